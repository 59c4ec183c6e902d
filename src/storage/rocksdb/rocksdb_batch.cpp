/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "storage/rocksdb/rocksdb_batch.hpp"

#include "storage/rocksdb/rocksdb_util.hpp"
#include "storage/storage_error.hpp"

namespace strata::storage {

  RocksDbBatch::RocksDbBatch(std::shared_ptr<RocksDbSpace> space,
                             log::Logger logger)
      : space_(std::move(space)), logger_(std::move(logger)) {}

  outcome::result<void> RocksDbBatch::put(const ByteView &key,
                                          ByteVecOrView &&value) {
    auto status = batch_.Put(
        space_->column_, make_slice(key), make_slice(std::move(value)));
    if (not status.ok()) {
      return status_as_error(status, logger_);
    }
    return outcome::success();
  }

  outcome::result<void> RocksDbBatch::remove(const ByteView &key) {
    auto status = batch_.Delete(space_->column_, make_slice(key));
    if (not status.ok()) {
      return status_as_error(status, logger_);
    }
    return outcome::success();
  }

  outcome::result<void> RocksDbBatch::commit() {
    OUTCOME_TRY(rocks, space_->use());
    auto status = rocks->db_->Write(rocks->wo_, &batch_);
    if (status.ok()) {
      SL_TRACE(logger_,
               "Batch of {} operations committed to '{}'",
               batch_.Count(),
               space_->name());
      return outcome::success();
    }

    return status_as_error(status, logger_);
  }

  void RocksDbBatch::clear() {
    batch_.Clear();
  }

  size_t RocksDbBatch::count() const {
    return batch_.Count();
  }
}  // namespace strata::storage
