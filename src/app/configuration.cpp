/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "app/configuration.hpp"

namespace strata::app {

  Configuration::Configuration()
      : version_("undefined"),
        base_path_(std::filesystem::current_path()),
        database_{
            .directory = "db",
            .cache_size = 1 << 30,
            .max_transaction_retries = 0,
            .sync_writes = false,
        } {}

  const std::string &Configuration::version() const {
    return version_;
  }

  const std::filesystem::path &Configuration::basePath() const {
    return base_path_;
  }

  const Configuration::DatabaseConfig &Configuration::database() const {
    return database_;
  }

}  // namespace strata::app
