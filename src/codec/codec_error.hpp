/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <qtils/enum_error_code.hpp>

namespace strata::codec {

  /**
   * @brief Failures of the encode/decode bridge.
   */
  enum class CodecError : uint8_t {
    ENCODE_FAILED = 1,  ///< value is not representable under the codec
    DECODE_FAILED,      ///< bytes are truncated or malformed for the type
    TRAILING_BYTES,     ///< bytes hold more than one value of the type
  };

}  // namespace strata::codec

OUTCOME_HPP_DECLARE_ERROR(strata::codec, CodecError);
