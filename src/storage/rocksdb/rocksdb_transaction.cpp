/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "storage/rocksdb/rocksdb_transaction.hpp"

#include "storage/rocksdb/rocksdb_util.hpp"

namespace strata::storage {

  RocksDbTransactionalSpace::RocksDbTransactionalSpace(
      RocksDb &db,
      rocksdb::Transaction &txn,
      rocksdb::ColumnFamilyHandle *column,
      const log::Logger &logger)
      : db_(db), txn_(txn), logger_(logger), column_(column) {}

  outcome::result<std::optional<ByteVec>> RocksDbTransactionalSpace::get(
      const ByteView &key) {
    rocksdb::ReadOptions ro;
    ro.snapshot = txn_.GetSnapshot();
    std::string value;
    auto status = txn_.GetForUpdate(ro, column_, make_slice(key), &value);
    if (status.ok()) {
      return make_buffer(value);
    }
    if (status.IsNotFound()) {
      return std::nullopt;
    }
    return status_as_error(status, logger_);
  }

  outcome::result<void> RocksDbTransactionalSpace::put(const ByteView &key,
                                                       ByteVecOrView &&value) {
    auto status =
        txn_.Put(column_, make_slice(key), make_slice(std::move(value)));
    if (not status.ok()) {
      return status_as_error(status, logger_);
    }
    return outcome::success();
  }

  outcome::result<void> RocksDbTransactionalSpace::remove(const ByteView &key) {
    auto status = txn_.Delete(column_, make_slice(key));
    if (not status.ok()) {
      return status_as_error(status, logger_);
    }
    return outcome::success();
  }

  outcome::result<std::optional<ByteVec>> RocksDbTransactionalSpace::exchange(
      const ByteView &key, ByteVecOrView &&value) {
    OUTCOME_TRY(previous, get(key));
    OUTCOME_TRY(put(key, std::move(value)));
    return previous;
  }

  outcome::result<std::optional<ByteVec>> RocksDbTransactionalSpace::take(
      const ByteView &key) {
    OUTCOME_TRY(previous, get(key));
    if (previous.has_value()) {
      OUTCOME_TRY(remove(key));
    }
    return previous;
  }

  void RocksDbTransactionalSpace::flush() {
    rocksdb::FlushOptions options;
    options.wait = false;
    auto status = db_.db_->Flush(options, column_);
    if (not status.ok()) {
      SL_ERROR(logger_, "Can't schedule flush: {}", status.ToString());
    }
  }

  outcome::result<uint64_t> RocksDbTransactionalSpace::generateId() {
    return db_.generateId();
  }

}  // namespace strata::storage
