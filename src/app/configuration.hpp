/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <filesystem>
#include <string>

#include "utils/ctor_limiters.hpp"

namespace strata::app {
  class Configuration : Singleton<Configuration> {
   public:
    struct DatabaseConfig {
      std::filesystem::path directory = "db";
      size_t cache_size = 1 << 30;  // 1GiB
      /// Conflicting attempts retried before giving up; 0 is unlimited
      size_t max_transaction_retries = 0;
      bool sync_writes = false;
    };

    Configuration();
    virtual ~Configuration() = default;

    [[nodiscard]] virtual const std::string &version() const;
    [[nodiscard]] virtual const std::filesystem::path &basePath() const;

    [[nodiscard]] virtual const DatabaseConfig &database() const;

   private:
    friend class Configurator;  // for external configure

    std::string version_;
    std::filesystem::path base_path_;

    DatabaseConfig database_;
  };

}  // namespace strata::app
