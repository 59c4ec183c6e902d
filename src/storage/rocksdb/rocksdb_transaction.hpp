/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <rocksdb/utilities/transaction.h>

#include "storage/rocksdb/rocksdb.hpp"

namespace strata::storage {

  /**
   * One column family as seen from inside an optimistic transaction.
   *
   * Reads go through GetForUpdate on the transaction snapshot, so every key
   * read is validated at commit, and they observe the transaction's own
   * pending writes.
   */
  class RocksDbTransactionalSpace : public BufferTransactionalMap {
   public:
    RocksDbTransactionalSpace(RocksDb &db,
                              rocksdb::Transaction &txn,
                              rocksdb::ColumnFamilyHandle *column,
                              const log::Logger &logger);

    outcome::result<std::optional<ByteVec>> get(const ByteView &key) override;

    outcome::result<void> put(const ByteView &key,
                              ByteVecOrView &&value) override;

    outcome::result<void> remove(const ByteView &key) override;

    outcome::result<std::optional<ByteVec>> exchange(
        const ByteView &key, ByteVecOrView &&value) override;

    outcome::result<std::optional<ByteVec>> take(const ByteView &key) override;

    void flush() override;

    outcome::result<uint64_t> generateId() override;

   private:
    // NOLINTBEGIN(cppcoreguidelines-avoid-const-or-ref-data-members)
    RocksDb &db_;
    rocksdb::Transaction &txn_;
    const log::Logger &logger_;
    // NOLINTEND(cppcoreguidelines-avoid-const-or-ref-data-members)
    rocksdb::ColumnFamilyHandle *column_;
  };

}  // namespace strata::storage
