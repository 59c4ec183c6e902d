/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "app/configurator.hpp"

#include <cstdint>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>

#include <boost/program_options.hpp>
#include <boost/program_options/value_semantic.hpp>
#include <qtils/outcome.hpp>
#include <qtils/shared_ref.hpp>

#include "app/configuration.hpp"
#include "utils/parsers.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(strata::app, Configurator::Error, e) {
  using E = strata::app::Configurator::Error;
  switch (e) {
    case E::CliArgsParseFailed:
      return "CLI Arguments parse failed";
    case E::ConfigFileParseFailed:
      return "Config file parse failed";
    case E::InvalidValue:
      return "Result config has invalid values";
  }
  return "Unknown Configurator::Error";
}

namespace {
  template <typename T, typename Func>
  void find_argument(boost::program_options::variables_map &vm,
                     const char *name,
                     Func &&f) {
    if (auto it = vm.find(name); it != vm.end()) {
      if (it->second.defaulted()) {
        return;
      }
      std::forward<Func>(f)(it->second.as<T>());
    }
  }

}  // namespace

namespace strata::app {

  Configurator::Configurator(int argc, const char **argv)
      : argc_(argc), argv_(argv) {
    config_ = std::make_shared<Configuration>();

    config_->version_ = STRATA_VERSION;

    config_->database_.directory = "db";
    config_->database_.cache_size = 512 << 20;  // 512MiB
    config_->database_.max_transaction_retries = 0;
    config_->database_.sync_writes = false;

    namespace po = boost::program_options;

    // clang-format off

    po::options_description general_options("General options", 120, 100);
    general_options.add_options()
        ("help,h", "Show this help message.")
        ("version,v", "Show version information.")
        ("base-path", po::value<std::string>(), "Set base path. All relative paths will be resolved based on this path.")
        ("config,c", po::value<std::string>(),  "Optional. Filepath to load configuration from. Overrides default configuration values.")
        ("flush", "Flush every collection and wait until the data is durable.")
        ("log,l", po::value<std::vector<std::string>>(),
          "Sets a custom logging filter.\n"
          "Syntax: <target>=<level>, e.g., -lstorage=debug.\n"
          "Log levels: trace, debug, verbose, info, warn, error, critical, off.\n"
          "Default: all targets log at `info`.\n"
          "Global log level can be set with: -l<level>.")
        ;

    po::options_description storage_options("Storage options");
    storage_options.add_options()
        ("db_path", po::value<std::string>()->default_value(config_->database_.directory), "Path to DB directory. Can be relative on base path.")
        ("db_cache_size", po::value<std::string>()->default_value("512MiB"), "Limit the memory the database cache can use, e.g. 4096, 512MiB, 1G.")
        ("max_transaction_retries", po::value<size_t>()->default_value(0), "Give up a transaction after this many conflicting retries (0 is unlimited).")
        ("sync_writes", po::value<std::string>()->default_value("false"), "Wait for the OS to persist every write (true/false).")
        ;

    // clang-format on

    cli_options_
        .add(general_options)  //
        .add(storage_options);
  }

  outcome::result<bool> Configurator::step1() {  // read min cli-args and config
    namespace po = boost::program_options;

    po::options_description options;
    options.add_options()("help,h", "show help")("version,v", "show version")(
        "config,c", po::value<std::string>(), "config-file path");

    po::variables_map vm;

    // first-run parse to read-only general options and to lookup for "help",
    // "config" and "version". all the rest options are ignored
    try {
      po::parsed_options parsed = po::command_line_parser(argc_, argv_)
                                      .options(options)
                                      .allow_unregistered()
                                      .run();
      po::store(parsed, vm);
      po::notify(vm);
    } catch (const std::exception &e) {
      std::cerr << "Error: " << e.what() << '\n'
                << "Try run with option '--help' for more information\n";
      return Error::CliArgsParseFailed;
    }

    if (vm.contains("help")) {
      std::cout << "strata_inspect version " << config_->version_ << '\n';
      std::cout << cli_options_ << '\n';
      return true;
    }

    if (vm.contains("version")) {
      std::cout << "strata_inspect version " << config_->version_ << '\n';
      return true;
    }

    if (vm.contains("config")) {
      auto path = vm["config"].as<std::string>();
      try {
        config_file_ = YAML::LoadFile(path);
      } catch (const std::exception &exception) {
        std::cerr << "Error: Can't parse file "
                  << std::filesystem::weakly_canonical(path) << ": "
                  << exception.what() << "\n"
                  << "Option --config must be path to correct yaml-file\n"
                  << "Try run with option '--help' for more information\n";
        return Error::ConfigFileParseFailed;
      }
    }

    return false;
  }

  outcome::result<bool> Configurator::step2() {
    namespace po = boost::program_options;
    try {
      // second-run parse to gather all known options
      // with reporting about any unrecognized input
      po::parsed_options parsed =
          po::command_line_parser(argc_, argv_).options(cli_options_).run();
      po::store(parsed, cli_values_map_);
      po::notify(cli_values_map_);
    } catch (const std::exception &e) {
      std::cerr << "Error: " << e.what() << '\n'
                << "Try run with option '--help' for more information\n";
      return Error::CliArgsParseFailed;
    }

    find_argument<std::vector<std::string>>(
        cli_values_map_, "log", [&](const std::vector<std::string> &value) {
          logger_cli_args_ = value;
        });

    return false;
  }

  static constexpr std::string_view default_logging_yaml = R"yaml(
sinks:
  - name: console
    type: console
    stream: stdout
    thread: name
    color: true
    latency: 0
groups:
  - name: main
    sink: console
    level: info
    is_fallback: true
    children:
      - name: strata
        children:
          - name: storage
)yaml";

  outcome::result<YAML::Node> Configurator::getLoggingConfig() {
    auto load_default = [&]() -> outcome::result<YAML::Node> {
      try {
        return YAML::Load(std::string(default_logging_yaml));
      } catch (const std::exception &e) {
        file_errors_ << "E: Failed to load default logging config: " << e.what()
                     << "\n";
        return Error::ConfigFileParseFailed;
      }
    };

    if (not config_file_.has_value()) {
      return load_default();
    }

    auto logging = (*config_file_)["logging"];
    if (logging.IsDefined()) {
      return logging;
    }

    return load_default();
  }

  bool Configurator::flushRequested() const {
    return cli_values_map_.contains("flush");
  }

  outcome::result<std::shared_ptr<Configuration>> Configurator::calculateConfig(
      qtils::SharedRef<soralog::Logger> logger) {
    logger_ = std::move(logger);
    OUTCOME_TRY(initGeneralConfig());
    OUTCOME_TRY(initDatabaseConfig());

    return config_;
  }

  outcome::result<void> Configurator::reportFileErrors() {
    if (not file_has_error_) {
      return outcome::success();
    }
    std::string path;
    find_argument<std::string>(
        cli_values_map_, "config", [&](const std::string &value) {
          path = value;
        });
    SL_ERROR(logger_, "Config file `{}` has some problems:", path);
    std::istringstream iss(file_errors_.str());
    std::string line;
    while (std::getline(iss, line)) {
      SL_ERROR(logger_, "  {}", std::string_view(line).substr(3));
    }
    return Error::ConfigFileParseFailed;
  }

  outcome::result<void> Configurator::initGeneralConfig() {
    // Init by config-file
    if (config_file_.has_value()) {
      auto section = (*config_file_)["general"];
      if (section.IsDefined()) {
        if (section.IsMap()) {
          auto base_path = section["base-path"];
          if (base_path.IsDefined()) {
            if (base_path.IsScalar()) {
              auto value = base_path.as<std::string>();
              config_->base_path_ = value;
            } else {
              file_errors_ << "E: Value 'general.base-path' must be scalar\n";
              file_has_error_ = true;
            }
          }
        } else {
          file_errors_ << "E: Section 'general' defined, but is not map\n";
          file_has_error_ = true;
        }
      }
    }

    OUTCOME_TRY(reportFileErrors());

    // Adjust by CLI arguments
    find_argument<std::string>(
        cli_values_map_, "base-path", [&](const std::string &value) {
          config_->base_path_ = value;
        });

    // Check values
    config_->base_path_ = std::filesystem::absolute(config_->base_path_);
    if (not is_directory(config_->base_path_)) {
      SL_ERROR(logger_,
               "The 'base_path' does not exist or is not a directory: {}",
               config_->base_path_.c_str());
      return Error::InvalidValue;
    }

    return outcome::success();
  }

  outcome::result<void> Configurator::initDatabaseConfig() {
    // Init by config-file
    if (config_file_.has_value()) {
      auto section = (*config_file_)["database"];
      if (section.IsDefined()) {
        if (section.IsMap()) {
          auto path = section["path"];
          if (path.IsDefined()) {
            if (path.IsScalar()) {
              auto value = path.as<std::string>();
              config_->database_.directory = value;
            } else {
              file_errors_ << "E: Value 'database.path' must be scalar\n";
              file_has_error_ = true;
            }
          }
          auto cache_size = section["cache_size"];
          if (cache_size.IsDefined()) {
            if (cache_size.IsScalar()) {
              auto value =
                  util::parseByteQuantity(cache_size.as<std::string>());
              if (value.has_value()) {
                config_->database_.cache_size = value.value();
              } else {
                file_errors_ << "E: Bad 'database.cache_size' value; "
                                "Expected: 4096, 512Mb, 1G, etc.\n";
                file_has_error_ = true;
              }
            } else {
              file_errors_ << "E: Value 'database.cache_size' must be scalar\n";
              file_has_error_ = true;
            }
          }
          auto retries = section["max_transaction_retries"];
          if (retries.IsDefined()) {
            if (retries.IsScalar()) {
              try {
                config_->database_.max_transaction_retries =
                    retries.as<size_t>();
              } catch (const YAML::BadConversion &) {
                file_errors_ << "E: Value 'database.max_transaction_retries' "
                                "must be a non-negative number\n";
                file_has_error_ = true;
              }
            } else {
              file_errors_ << "E: Value 'database.max_transaction_retries' "
                              "must be scalar\n";
              file_has_error_ = true;
            }
          }
          auto sync_writes = section["sync_writes"];
          if (sync_writes.IsDefined()) {
            if (sync_writes.IsScalar()) {
              auto value = util::parseBool(sync_writes.as<std::string>());
              if (value.has_value()) {
                config_->database_.sync_writes = value.value();
              } else {
                file_errors_ << "E: Value 'database.sync_writes' has wrong "
                                "value. Expected 'true' or 'false'\n";
                file_has_error_ = true;
              }
            } else {
              file_errors_ << "E: Value 'database.sync_writes' must be "
                              "scalar\n";
              file_has_error_ = true;
            }
          }
        } else {
          file_errors_ << "E: Section 'database' defined, but is not map\n";
          file_has_error_ = true;
        }
      }
    }

    OUTCOME_TRY(reportFileErrors());

    // Adjust by CLI arguments
    bool fail;

    fail = false;
    find_argument<std::string>(
        cli_values_map_, "db_path", [&](const std::string &value) {
          config_->database_.directory = value;
        });
    find_argument<std::string>(
        cli_values_map_, "db_cache_size", [&](const std::string &value) {
          auto size = util::parseByteQuantity(value);
          if (size.has_value()) {
            config_->database_.cache_size = size.value();
          } else {
            SL_ERROR(logger_, "Bad '--db_cache_size' value: {}", value);
            fail = true;
          }
        });
    find_argument<size_t>(
        cli_values_map_, "max_transaction_retries", [&](const size_t &value) {
          config_->database_.max_transaction_retries = value;
        });
    find_argument<std::string>(
        cli_values_map_, "sync_writes", [&](const std::string &value) {
          auto flag = util::parseBool(value);
          if (flag.has_value()) {
            config_->database_.sync_writes = flag.value();
          } else {
            SL_ERROR(logger_, "Bad '--sync_writes' value: {}", value);
            fail = true;
          }
        });

    if (fail) {
      return Error::CliArgsParseFailed;
    }

    // Check values
    if (config_->database_.cache_size == 0) {
      SL_ERROR(logger_, "The database cache size must not be zero");
      return Error::InvalidValue;
    }

    auto make_absolute = [&](const std::filesystem::path &path) {
      return weakly_canonical(path.is_absolute()
                                  ? path
                                  : (config_->base_path_ / path));
    };

    config_->database_.directory = make_absolute(config_->database_.directory);

    return outcome::success();
  }

}  // namespace strata::app
