/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "app/configurator.hpp"

#include <fstream>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <qtils/test/outcome.hpp>

#include "app/configuration.hpp"
#include "testutil/prepare_loggers.hpp"
#include "testutil/storage/base_fs_test.hpp"

using strata::app::Configuration;
using strata::app::Configurator;
using namespace testing;

struct ConfiguratorTest : public test::BaseFS_Test {
  ConfiguratorTest() : BaseFS_Test("/tmp/strata-test-configurator") {}

  void SetUp() override {
    BaseFS_Test::SetUp();
    logsys = testutil::prepareLoggers();
  }

  /// Runs both parsing steps and calculates the configuration
  outcome::result<std::shared_ptr<Configuration>> configure(
      std::vector<std::string> args) {
    configurator.reset();
    stored_args = std::move(args);
    stored_args.insert(stored_args.begin(), "strata_inspect");
    argv.clear();
    for (const auto &arg : stored_args) {
      argv.push_back(arg.c_str());
    }

    configurator = std::make_unique<Configurator>(
        static_cast<int>(argv.size()), argv.data());
    OUTCOME_TRY(configurator->step1());
    OUTCOME_TRY(configurator->step2());
    return configurator->calculateConfig(
        logsys->getLogger("Configurator", strata::log::defaultGroupName));
  }

  std::string writeFile(std::string_view name, std::string_view content) {
    auto path = base_path / name;
    std::ofstream file(path);
    file << content;
    return path.native();
  }

  std::shared_ptr<strata::log::LoggingSystem> logsys;
  std::vector<std::string> stored_args;
  std::vector<const char *> argv;
  std::unique_ptr<Configurator> configurator;
};

/**
 * @given no arguments at all
 * @when configuration is calculated
 * @then the database lives in ./db with default limits
 */
TEST_F(ConfiguratorTest, Defaults) {
  ASSERT_OUTCOME_SUCCESS(config, configure({}));
  const auto &db = config->database();
  EXPECT_EQ(db.directory,
            std::filesystem::weakly_canonical(
                std::filesystem::current_path() / "db"));
  EXPECT_EQ(db.cache_size, 512 << 20);
  EXPECT_EQ(db.max_transaction_retries, 0);
  EXPECT_FALSE(db.sync_writes);
  EXPECT_FALSE(configurator->flushRequested());
}

/**
 * @given database options on the command line
 * @when configuration is calculated
 * @then they are applied and relative paths resolve against the base path
 */
TEST_F(ConfiguratorTest, CommandLineOptions) {
  ASSERT_OUTCOME_SUCCESS(config,
                         configure({"--base-path",
                                    getPathString(),
                                    "--db_path",
                                    "data",
                                    "--db_cache_size",
                                    "64MiB",
                                    "--max_transaction_retries",
                                    "5",
                                    "--sync_writes",
                                    "yes",
                                    "--flush"}));
  const auto &db = config->database();
  EXPECT_EQ(db.directory,
            std::filesystem::weakly_canonical(base_path / "data"));
  EXPECT_EQ(db.cache_size, 64 << 20);
  EXPECT_EQ(db.max_transaction_retries, 5);
  EXPECT_TRUE(db.sync_writes);
  EXPECT_TRUE(configurator->flushRequested());
}

/**
 * @given a config file with a database section and a CLI override
 * @when configuration is calculated
 * @then file values are used unless overridden on the command line
 */
TEST_F(ConfiguratorTest, ConfigFileWithOverride) {
  auto file = writeFile("config.yaml", R"yaml(
general:
  base-path: /tmp/strata-test-configurator
database:
  path: from-file
  cache_size: 32MiB
  max_transaction_retries: 3
  sync_writes: true
)yaml");

  ASSERT_OUTCOME_SUCCESS(
      config, configure({"--config", file, "--max_transaction_retries", "7"}));
  const auto &db = config->database();
  EXPECT_EQ(db.directory,
            std::filesystem::weakly_canonical(base_path / "from-file"));
  EXPECT_EQ(db.cache_size, 32 << 20);
  EXPECT_EQ(db.max_transaction_retries, 7);
  EXPECT_TRUE(db.sync_writes);
}

/**
 * @given a config file with a malformed cache size
 * @when configuration is calculated
 * @then the file is rejected
 */
TEST_F(ConfiguratorTest, BadValueInFile) {
  auto file = writeFile("config.yaml", R"yaml(
database:
  cache_size: a lot
)yaml");

  EXPECT_OUTCOME_ERROR(configure({"--config", file}),
                       Configurator::Error::ConfigFileParseFailed);
}

/**
 * @given a malformed value on the command line
 * @when configuration is calculated
 * @then parsing fails
 */
TEST_F(ConfiguratorTest, BadValueOnCommandLine) {
  EXPECT_OUTCOME_ERROR(configure({"--db_cache_size", "lots"}),
                       Configurator::Error::CliArgsParseFailed);
  EXPECT_OUTCOME_ERROR(configure({"--no-such-option"}),
                       Configurator::Error::CliArgsParseFailed);
}

/**
 * @given logging overrides on the command line
 * @then they are collected in order for the logging system
 */
TEST_F(ConfiguratorTest, LoggingArgs) {
  ASSERT_OUTCOME_SUCCESS(configure({"-ldebug", "--log", "storage=trace"}));
  EXPECT_THAT(configurator->getLoggingCliArgs(),
              ElementsAre("debug", "storage=trace"));
  ASSERT_OUTCOME_SUCCESS(logging, configurator->getLoggingConfig());
  EXPECT_TRUE(logging["groups"].IsSequence());
}
