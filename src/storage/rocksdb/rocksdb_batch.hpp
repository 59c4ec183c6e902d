/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <rocksdb/write_batch.h>

#include "storage/rocksdb/rocksdb.hpp"

namespace strata::storage {

  class RocksDbBatch : public BufferBatch {
   public:
    ~RocksDbBatch() override = default;

    RocksDbBatch(std::shared_ptr<RocksDbSpace> space, log::Logger logger);

    outcome::result<void> commit() override;

    void clear() override;

    size_t count() const override;

    outcome::result<void> put(const ByteView &key,
                              ByteVecOrView &&value) override;

    outcome::result<void> remove(const ByteView &key) override;

   private:
    std::shared_ptr<RocksDbSpace> space_;
    log::Logger logger_;
    rocksdb::WriteBatch batch_;
  };
}  // namespace strata::storage
