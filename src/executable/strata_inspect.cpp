/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <cstdlib>
#include <future>
#include <iostream>
#include <memory>
#include <system_error>
#include <vector>

#include <fmt/format.h>
#include <fmt/ostream.h>
#include <qtils/final_action.hpp>
#include <soralog/impl/configurator_from_yaml.hpp>
#include <soralog/logging_system.hpp>
#include <soralog/util.hpp>

#include "app/configuration.hpp"
#include "app/configurator.hpp"
#include "log/logger.hpp"
#include "storage/rocksdb/rocksdb.hpp"

namespace {
  using strata::app::Configuration;
  using strata::log::LoggingSystem;

  int inspect(const std::shared_ptr<LoggingSystem> &logsys,
              const std::shared_ptr<Configuration> &appcfg,
              bool flush) {
    auto logger = logsys->getLogger("Inspect", strata::log::defaultGroupName);

    std::shared_ptr<strata::storage::RocksDb> db;
    try {
      db = std::make_shared<strata::storage::RocksDb>(logsys, appcfg);
    } catch (const std::system_error &e) {
      SL_CRITICAL(logger, "Can't open database: {}", e.what());
      return EXIT_FAILURE;
    }

    SL_INFO(logger, "Database: {}", appcfg->database().directory.native());

    std::vector<std::shared_future<outcome::result<void>>> flushes;
    for (const auto &name : db->spaceNames()) {
      auto space_res = db->openSpace(name);
      if (space_res.has_error()) {
        SL_ERROR(logger,
                 "Can't open collection '{}': {}",
                 name,
                 space_res.error());
        return EXIT_FAILURE;
      }
      auto &space = space_res.value();

      auto count_res = space->count();
      if (count_res.has_error()) {
        SL_ERROR(
            logger, "Can't count entries of '{}': {}", name, count_res.error());
        return EXIT_FAILURE;
      }
      auto size = space->byteSizeHint();
      fmt::println("{:<32} {:>12} entries {:>14}",
                   name,
                   count_res.value(),
                   size ? fmt::format("{} bytes", size.value()) : "-");

      if (flush) {
        flushes.emplace_back(space->flushAsync());
      }
    }

    for (auto &pending : flushes) {
      if (auto res = pending.get(); res.has_error()) {
        SL_ERROR(logger, "Flush failed: {}", res.error());
        return EXIT_FAILURE;
      }
    }
    if (flush) {
      SL_INFO(logger, "{} collections flushed", flushes.size());
    }

    logger->flush();
    return EXIT_SUCCESS;
  }

}  // namespace

int main(int argc, const char **argv) {
  setlinebuf(stdout);
  setlinebuf(stderr);

  soralog::util::setThreadName("strata-inspect");

  qtils::FinalAction flush_std_streams_at_exit([] {
    std::cout.flush();
    std::cerr.flush();
  });

  auto app_configurator =
      std::make_unique<strata::app::Configurator>(argc, argv);

  // Parse CLI args for help, version and config
  if (auto res = app_configurator->step1(); res.has_value()) {
    if (res.value()) {
      return EXIT_SUCCESS;
    }
  } else {
    return EXIT_FAILURE;
  }

  // Parse remaining args
  if (auto res = app_configurator->step2(); res.has_value()) {
    if (res.value()) {
      return EXIT_SUCCESS;
    }
  } else {
    return EXIT_FAILURE;
  }

  // Setup logging system
  auto logging_system = ({
    auto log_config = app_configurator->getLoggingConfig();
    if (log_config.has_error()) {
      std::cerr << "Logging config is empty.\n";
      return EXIT_FAILURE;
    }

    auto log_configurator = std::make_shared<soralog::ConfiguratorFromYAML>(
        std::shared_ptr<soralog::Configurator>(nullptr), log_config.value());

    auto logging_system =
        std::make_shared<soralog::LoggingSystem>(std::move(log_configurator));

    auto config_result = logging_system->configure();
    if (not config_result.message.empty()) {
      (config_result.has_error ? std::cerr : std::cout)
          << config_result.message << '\n';
    }
    if (config_result.has_error) {
      return EXIT_FAILURE;
    }

    std::make_shared<strata::log::LoggingSystem>(std::move(logging_system));
  });

  logging_system->tuneLoggingSystem(app_configurator->getLoggingCliArgs());

  // Setup config
  auto app_configuration = ({
    auto logger = logging_system->getLogger("Configurator",
                                            strata::log::defaultGroupName);

    auto config_res = app_configurator->calculateConfig(logger);
    if (config_res.has_error()) {
      auto error = config_res.error();
      SL_CRITICAL(logger, "Failed to calculate config: {}", error);
      fmt::println(std::cerr, "Failed to calculate config: {}", error);
      fmt::println(std::cerr, "See more details in the log");
      return EXIT_FAILURE;
    }

    config_res.value();
  });

  return inspect(logging_system,
                 app_configuration,
                 app_configurator->flushRequested());
}
