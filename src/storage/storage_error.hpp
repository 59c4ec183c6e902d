/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

/**
 * @brief Error codes reported by the raw engine adapter.
 *
 * Every failure coming out of the underlying engine (I/O, corruption,
 * capacity, optimistic-transaction conflicts) is folded into one of these
 * codes and transported in outcome::result.
 */

#pragma once

#include <qtils/enum_error_code.hpp>

namespace strata::storage {

  /**
   * @brief Universal error codes for storage interface.
   */
  enum class StorageError : int {  // NOLINT(performance-enum-size)

    OK = 0,  ///< success (no error)

    NOT_SUPPORTED = 1,        ///< operation is not supported in storage
    CORRUPTION = 2,           ///< data corruption in storage
    INVALID_ARGUMENT = 3,     ///< invalid argument to storage
    IO_ERROR = 4,             ///< IO error in storage
    NOT_FOUND = 5,            ///< entry not found in storage
    DB_PATH_NOT_CREATED = 6,  ///< storage path was not created
    STORAGE_GONE = 7,         ///< storage instance has been uninitialized
    CONFLICT = 8,             ///< concurrent transaction touched same keys
    SPACE_NOT_FOUND = 9,      ///< named space is not opened
    FOREIGN_SPACE = 10,       ///< space belongs to another storage instance

    UNKNOWN = 1000,  ///< unknown error
  };
}  // namespace strata::storage

OUTCOME_HPP_DECLARE_ERROR(strata::storage, StorageError);
