/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <qtils/enum_error_code.hpp>

namespace testutil {
  /**
   * Errors a transaction callback returns to abort, standing in for the
   * domain errors of a real application.
   */
  enum class AbortReason : uint8_t {
    INSUFFICIENT_FUNDS = 1,
    DUPLICATE_NAME,
    CHANGED_MIND,
  };
}  // namespace testutil

OUTCOME_HPP_DECLARE_ERROR(testutil, AbortReason);

inline OUTCOME_CPP_DEFINE_CATEGORY(testutil, AbortReason, e) {
  using testutil::AbortReason;
  switch (e) {
    case AbortReason::INSUFFICIENT_FUNDS:
      return "insufficient funds";
    case AbortReason::DUPLICATE_NAME:
      return "name is already taken";
    case AbortReason::CHANGED_MIND:
      return "transaction was abandoned";
  }
  return "unknown (AbortReason) error";
}
