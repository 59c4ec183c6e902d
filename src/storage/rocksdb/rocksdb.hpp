/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <atomic>
#include <filesystem>
#include <functional>
#include <future>
#include <map>
#include <mutex>

#include <qtils/shared_ref.hpp>
#include <rocksdb/table.h>
#include <rocksdb/utilities/optimistic_transaction_db.h>
#include <rocksdb/utilities/transaction.h>

#include "log/logger.hpp"
#include "storage/buffer_map_types.hpp"
#include "storage/spaced_storage.hpp"
#include "utils/ctor_limiters.hpp"

namespace strata::app {
  class Configuration;
}

namespace strata::storage {

  class RocksDbSpace;

  /**
   * SpacedStorage on top of a RocksDB OptimisticTransactionDB. Every space is
   * a column family; missing ones are created on first open.
   */
  class RocksDb : public SpacedStorage,
                  public std::enable_shared_from_this<RocksDb>,
                  NonCopyable,
                  NonMovable {
    using ColumnFamilyHandlePtr = rocksdb::ColumnFamilyHandle *;

   public:
    RocksDb(qtils::SharedRef<log::LoggingSystem> logsys,
            qtils::SharedRef<app::Configuration> app_config);

    ~RocksDb() override;

    static constexpr uint32_t kDefaultLruCacheSizeMiB = 512;
    static constexpr uint32_t kDefaultBlockSizeKiB = 32;

    outcome::result<std::shared_ptr<BufferStorage>> openSpace(
        std::string_view name) override;

    outcome::result<void> dropSpace(std::string_view name) override;

    [[nodiscard]] std::vector<std::string> spaceNames() const override;

    outcome::result<uint64_t> generateId() override;

    outcome::result<void> transaction(
        std::span<const std::shared_ptr<BufferStorage>> spaces,
        const TransactionBody &body) override;

    /**
     * Prepare configuration structure
     * @param lru_cache_size_mib - LRU rocksdb cache in MiB
     * @param block_size_kib - internal rocksdb block size in KiB
     * @return options structure
     */
    static rocksdb::BlockBasedTableOptions tableOptionsConfiguration(
        uint32_t lru_cache_size_mib = kDefaultLruCacheSizeMiB,
        uint32_t block_size_kib = kDefaultBlockSizeKiB);

    friend class RocksDbSpace;
    friend class RocksDbBatch;
    friend class RocksDbTransactionalSpace;

   private:
    using TransactionStep =
        std::function<outcome::result<void>(rocksdb::Transaction &)>;

    static outcome::result<void> createDirectory(
        const std::filesystem::path &absolute_path, log::Logger &log);

    static outcome::result<void> openDatabase(
        const rocksdb::Options &options,
        const std::filesystem::path &path,
        const std::vector<rocksdb::ColumnFamilyDescriptor>
            &column_family_descriptors,
        std::vector<ColumnFamilyHandlePtr> &column_family_handles,
        RocksDb &rocks_db,
        log::Logger &log);

    /// Reads the persisted upper bound of issued ids
    outcome::result<void> loadIdReservation();

    /**
     * Runs step inside a fresh optimistic transaction and commits it.
     * Attempts failing with StorageError::CONFLICT are repeated up to
     * max_retries times, forever if it is 0. Single key operations of a
     * space pass 0: their conflicts are never reported to the caller.
     */
    outcome::result<void> runTransaction(const TransactionStep &step,
                                         size_t max_retries);

    rocksdb::ColumnFamilyOptions columnOptions() const;

    rocksdb::OptimisticTransactionDB *db_{};
    ColumnFamilyHandlePtr default_column_{};

    // guards columns_, dropped_columns_ and spaces_
    mutable std::mutex spaces_mutex_;
    std::map<std::string, ColumnFamilyHandlePtr, std::less<>> columns_;
    // dropped families stay alive until the database is closed
    std::vector<ColumnFamilyHandlePtr> dropped_columns_;
    std::map<std::string, std::shared_ptr<RocksDbSpace>, std::less<>> spaces_;

    std::mutex id_mutex_;
    uint64_t next_id_ = 0;
    uint64_t reserved_until_ = 0;

    // memtable budget given to each column family
    uint64_t column_memory_budget_;
    size_t max_transaction_retries_;
    rocksdb::ReadOptions ro_;
    rocksdb::WriteOptions wo_;
    log::Logger logger_;
  };

  class RocksDbSpace : public BufferStorage,
                       public std::enable_shared_from_this<RocksDbSpace> {
   public:
    ~RocksDbSpace() override = default;

    RocksDbSpace(std::weak_ptr<RocksDb> storage,
                 std::string name,
                 rocksdb::ColumnFamilyHandle *column,
                 log::Logger logger);

    const std::string &name() const override;

    std::unique_ptr<BufferBatch> batch() override;

    std::optional<size_t> byteSizeHint() const override;

    outcome::result<std::unique_ptr<Cursor>> cursor() override;

    outcome::result<bool> contains(const ByteView &key) const override;

    outcome::result<ByteVecOrView> get(const ByteView &key) const override;

    outcome::result<std::optional<ByteVecOrView>> tryGet(
        const ByteView &key) const override;

    outcome::result<void> put(const ByteView &key,
                              ByteVecOrView &&value) override;

    outcome::result<void> remove(const ByteView &key) override;

    outcome::result<std::optional<ByteVec>> exchange(
        const ByteView &key, ByteVecOrView &&value) override;

    outcome::result<std::optional<ByteVec>> take(const ByteView &key) override;

    outcome::result<std::optional<std::pair<ByteVec, ByteVec>>> popFirst()
        override;

    outcome::result<std::optional<std::pair<ByteVec, ByteVec>>> popLast()
        override;

    outcome::result<size_t> count() const override;

    outcome::result<void> clear() override;

    std::shared_future<outcome::result<void>> flushAsync() override;

    friend class RocksDb;
    friend class RocksDbBatch;

   private:
    // gather storage instance from weak ptr
    outcome::result<std::shared_ptr<RocksDb>> use() const;

    outcome::result<std::optional<std::pair<ByteVec, ByteVec>>> popEdge(
        bool first);

    outcome::result<void> flush();

    std::weak_ptr<RocksDb> storage_;
    std::string name_;
    rocksdb::ColumnFamilyHandle *column_;
    std::atomic_bool dropped_ = false;
    log::Logger logger_;

    std::mutex flush_mutex_;
    std::shared_future<outcome::result<void>> pending_flush_;
  };
}  // namespace strata::storage
