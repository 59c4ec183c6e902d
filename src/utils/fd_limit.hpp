/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstddef>
#include <optional>

#include "log/logger.hpp"

namespace strata {

  /**
   * Soft limit of open file descriptors for this process (RLIMIT_NOFILE).
   * RocksDB is allowed to keep half of it open.
   * @return the limit, or std::nullopt if getrlimit failed
   */
  std::optional<size_t> getFdLimit(const log::Logger &logger);

}  // namespace strata
