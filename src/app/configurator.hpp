/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>
#include <sstream>

#include <boost/program_options.hpp>
#include <qtils/enum_error_code.hpp>
#include <qtils/outcome.hpp>
#include <qtils/shared_ref.hpp>
#include <yaml-cpp/yaml.h>

#include "log/logger.hpp"

namespace soralog {
  class Logger;
}  // namespace soralog

namespace strata::app {
  class Configuration;
}  // namespace strata::app

namespace strata::app {

  /**
   * Builds Configuration from the command line and an optional YAML file.
   * Values given on the command line override those of the file.
   */
  class Configurator final {
   public:
    enum class Error : uint8_t {
      CliArgsParseFailed,
      ConfigFileParseFailed,
      InvalidValue,
    };

    Configurator() = delete;
    Configurator(Configurator &&) noexcept = delete;
    Configurator(const Configurator &) = delete;
    ~Configurator() = default;
    Configurator &operator=(Configurator &&) noexcept = delete;
    Configurator &operator=(const Configurator &) = delete;

    Configurator(int argc, const char **argv);

    /**
     * Parse CLI args for help, version and config
     * @return true if the program has nothing more to do (help or version
     * were printed)
     */
    outcome::result<bool> step1();

    // Parse remaining CLI args
    outcome::result<bool> step2();

    outcome::result<YAML::Node> getLoggingConfig();
    std::vector<std::string> getLoggingCliArgs() const {
      return logger_cli_args_;
    }

    /// Whether `--flush` was requested
    bool flushRequested() const;

    outcome::result<std::shared_ptr<Configuration>> calculateConfig(
        qtils::SharedRef<soralog::Logger> logger);

   private:
    outcome::result<void> initGeneralConfig();
    outcome::result<void> initDatabaseConfig();
    outcome::result<void> reportFileErrors();

    int argc_;
    const char **argv_;

    std::shared_ptr<Configuration> config_;
    std::shared_ptr<soralog::Logger> logger_;

    std::optional<YAML::Node> config_file_;
    bool file_has_error_ = false;
    std::ostringstream file_errors_;
    std::vector<std::string> logger_cli_args_;

    boost::program_options::options_description cli_options_;
    boost::program_options::variables_map cli_values_map_;
  };

}  // namespace strata::app

OUTCOME_HPP_DECLARE_ERROR(strata::app, Configurator::Error);
