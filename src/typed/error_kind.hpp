/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>
#include <system_error>

namespace strata {

  /**
   * Coarse classification of errors returned by collections and
   * transactions.
   */
  enum class ErrorKind : uint8_t {
    Storage,   ///< the engine failed or refused the operation
    Decode,    ///< stored bytes do not match the requested type
    Encode,    ///< a value could not be encoded
    Conflict,  ///< a transaction kept losing races until it gave up
    Domain,    ///< anything else, e.g. an abort from a transaction callback
  };

  ErrorKind errorKind(const std::error_code &ec);

}  // namespace strata
