/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "storage/rocksdb/rocksdb_cursor.hpp"

#include "storage/rocksdb/rocksdb_util.hpp"

namespace strata::storage {

  RocksDBCursor::RocksDBCursor(std::shared_ptr<rocksdb::Iterator> it)
      : i_{std::move(it)} {}

  outcome::result<bool> RocksDBCursor::position() const {
    if (i_->Valid()) {
      return true;
    }
    auto status = i_->status();
    if (status.ok()) {
      return false;
    }
    if (status.IsCorruption()) {
      return StorageError::CORRUPTION;
    }
    if (status.IsIOError()) {
      return StorageError::IO_ERROR;
    }
    return StorageError::UNKNOWN;
  }

  outcome::result<bool> RocksDBCursor::seekFirst() {
    i_->SeekToFirst();
    return position();
  }

  outcome::result<bool> RocksDBCursor::seek(const ByteView &key) {
    i_->Seek(make_slice(key));
    return position();
  }

  outcome::result<bool> RocksDBCursor::seekForPrev(const ByteView &key) {
    i_->SeekForPrev(make_slice(key));
    return position();
  }

  outcome::result<bool> RocksDBCursor::seekLast() {
    i_->SeekToLast();
    return position();
  }

  bool RocksDBCursor::isValid() const {
    return i_->Valid();
  }

  outcome::result<void> RocksDBCursor::next() {
    i_->Next();
    if (auto res = position(); res.has_error()) {
      return res.error();
    }
    return outcome::success();
  }

  outcome::result<void> RocksDBCursor::prev() {
    i_->Prev();
    if (auto res = position(); res.has_error()) {
      return res.error();
    }
    return outcome::success();
  }

  std::optional<ByteVec> RocksDBCursor::key() const {
    return isValid() ? std::make_optional(make_buffer(i_->key()))
                     : std::nullopt;
  }

  std::optional<ByteVecOrView> RocksDBCursor::value() const {
    return isValid() ? std::make_optional<ByteVecOrView>(
                           make_buffer(i_->value()))
                     : std::nullopt;
  }
}  // namespace strata::storage
