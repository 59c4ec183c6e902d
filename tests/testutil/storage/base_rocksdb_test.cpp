/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "testutil/storage/base_rocksdb_test.hpp"

#include "testutil/prepare_loggers.hpp"

namespace test {

  void BaseRocksDB_Test::open() {
    rocks_.reset();
    ASSERT_NO_THROW(
        rocks_ = std::make_shared<strata::storage::RocksDb>(logsys, app_config));
    ASSERT_TRUE(rocks_) << "BaseRocksDB_Test: db is nullptr";
  }

  BaseRocksDB_Test::BaseRocksDB_Test(fs::path path)
      : BaseFS_Test(std::move(path)) {}

  void BaseRocksDB_Test::SetUp() {
    BaseFS_Test::SetUp();

    logsys = testutil::prepareLoggers();
    app_config = std::make_shared<strata::app::ConfigurationMock>();

    db_config = DatabaseConfig{
        .directory = getPathString() + "/db",
        .cache_size = 8 << 20,  // 8Mb
        .max_transaction_retries = 0,
        .sync_writes = false,
    };
    EXPECT_CALL(*app_config, database())
        .WillRepeatedly(testing::ReturnRef(db_config));

    open();
  }

  void BaseRocksDB_Test::TearDown() {
    rocks_.reset();
    app_config.reset();
    BaseFS_Test::TearDown();
  }

}  // namespace test
