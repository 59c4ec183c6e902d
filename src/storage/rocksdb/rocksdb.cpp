/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "storage/rocksdb/rocksdb.hpp"

#include <algorithm>
#include <chrono>
#include <thread>

#include <sys/resource.h>

#include <qtils/error_throw.hpp>
#include <rocksdb/filter_policy.h>
#include <rocksdb/table.h>
#include <rocksdb/write_batch.h>
#include <soralog/macro.hpp>
#include <soralog/util.hpp>

#include "app/configuration.hpp"
#include "codec/codec.hpp"
#include "storage/predefined_keys.hpp"
#include "storage/rocksdb/rocksdb_batch.hpp"
#include "storage/rocksdb/rocksdb_cursor.hpp"
#include "storage/rocksdb/rocksdb_transaction.hpp"
#include "storage/rocksdb/rocksdb_util.hpp"
#include "storage/storage_error.hpp"
#include "utils/fd_limit.hpp"

namespace strata::storage {
  namespace fs = std::filesystem;

  constexpr size_t kUnlimitedRetries = 0;

  RocksDb::RocksDb(qtils::SharedRef<log::LoggingSystem> logsys,
                   qtils::SharedRef<app::Configuration> app_config)
      : max_transaction_retries_(
            app_config->database().max_transaction_retries),
        logger_(logsys->getLogger("RocksDB", log::storageGroupName)) {
    ro_.fill_cache = false;
    wo_.sync = app_config->database().sync_writes;

    const auto &path = app_config->database().directory;

    auto options = rocksdb::Options{};
    options.create_if_missing = true;
    options.optimize_filters_for_hits = true;
    options.table_factory.reset(rocksdb::NewBlockBasedTableFactory(
        storage::RocksDb::tableOptionsConfiguration()));

    // Setting limit for open rocksdb files to a half of system soft limit
    auto soft_limit = getFdLimit(logger_);
    if (!soft_limit) {
      SL_CRITICAL(logger_, "Call getrlimit(RLIMIT_NOFILE) was failed");
      qtils::raise(StorageError::UNKNOWN);
    }
    if (soft_limit.value() == RLIM_INFINITY) {
      options.max_open_files = -1;
    } else {
      // NOLINTNEXTLINE(cppcoreguidelines-narrowing-conversions)
      options.max_open_files = soft_limit.value() / 2;
    }

    std::error_code ec;
    create_directories(path, ec);
    if (ec) {
      SL_CRITICAL(logger_, "Can't create DB directory: {}", ec.message());
      qtils::raise(StorageError::DB_PATH_NOT_CREATED);
    }

    if (auto res = createDirectory(path, logger_); res.has_error()) {
      SL_CRITICAL(logger_,
                  "Can't create DB directory ({}): {}",
                  path.native(),
                  res.error());
      qtils::raise(res.error());
    }

    std::vector<std::string> existing_families;
    auto res = rocksdb::DB::ListColumnFamilies(
        options, path.native(), &existing_families);
    if (not res.ok() and not res.IsPathNotFound()
        and not res.IsIOError()) {
      SL_ERROR(logger_,
               "Can't list column families in {}: {}",
               path.native(),
               res.ToString());
      qtils::raise(status_as_error(res, logger_));
    }
    if (std::ranges::find(existing_families, rocksdb::kDefaultColumnFamilyName)
        == existing_families.end()) {
      existing_families.emplace_back(rocksdb::kDefaultColumnFamilyName);
    }

    column_memory_budget_ =
        app_config->database().cache_size / existing_families.size();

    std::vector<rocksdb::ColumnFamilyDescriptor> column_family_descriptors;
    for (auto &family : existing_families) {
      column_family_descriptors.emplace_back(family, columnOptions());
      SL_DEBUG(logger_,
               "Column family '{}' configured with cache_size={:.0f}Mb",
               family,
               static_cast<double>(column_memory_budget_) / 1024.0 / 1024.0);
    }

    std::vector<ColumnFamilyHandlePtr> handles;
    qtils::raise_on_err(openDatabase(
        options, path, column_family_descriptors, handles, *this, logger_));

    for (auto *handle : handles) {
      if (handle->GetName() == rocksdb::kDefaultColumnFamilyName) {
        default_column_ = handle;
      } else {
        columns_.emplace(handle->GetName(), handle);
      }
    }

    qtils::raise_on_err(loadIdReservation());

    SL_VERBOSE(logger_, "Current column family sizes:");
    for (const auto &[name, handle] : columns_) {
      uint64_t size_bytes = 0;
      if (db_->GetIntProperty(
              handle, "rocksdb.estimate-live-data-size", &size_bytes)) {
        double size_mb = static_cast<double>(size_bytes) / 1024.0 / 1024.0;
        SL_VERBOSE(logger_, "  - {}: {:.2f} Mb", name, size_mb);
      } else {
        SL_WARN(logger_, "Failed to get size of column family '{}'", name);
      }
    }
  }

  RocksDb::~RocksDb() {
    if (db_ == nullptr) {
      return;
    }
    auto status = db_->Flush(rocksdb::FlushOptions());
    if (not status.ok()) {
      SL_ERROR(logger_, "Can't flush database: {}", status.ToString());
    }
    for (auto &[_, handle] : columns_) {
      db_->DestroyColumnFamilyHandle(handle);
    }
    for (auto *handle : dropped_columns_) {
      db_->DestroyColumnFamilyHandle(handle);
    }
    if (default_column_ != nullptr) {
      db_->DestroyColumnFamilyHandle(default_column_);
    }
    status = db_->Close();
    if (not status.ok()) {
      SL_ERROR(logger_, "Can't close database: {}", status.ToString());
    }
    delete db_;
    SL_DEBUG(logger_, "Database closed");
  }

  outcome::result<void> RocksDb::createDirectory(
      const std::filesystem::path &absolute_path, log::Logger &log) {
    std::error_code ec;
    if (not fs::create_directory(absolute_path.native(), ec) and ec.value()) {
      SL_ERROR(log,
               "Can't create directory {} for database: {}",
               absolute_path.native(),
               ec.message());
      return StorageError::DB_PATH_NOT_CREATED;
    }
    if (not fs::is_directory(absolute_path.native())) {
      SL_ERROR(log,
               "Can't open {} for database: is not a directory",
               absolute_path.native());
      return StorageError::DB_PATH_NOT_CREATED;
    }
    return outcome::success();
  }

  outcome::result<void> RocksDb::openDatabase(
      const rocksdb::Options &options,
      const std::filesystem::path &path,
      const std::vector<rocksdb::ColumnFamilyDescriptor>
          &column_family_descriptors,
      std::vector<ColumnFamilyHandlePtr> &column_family_handles,
      RocksDb &rocks_db,
      log::Logger &log) {
    const auto status =
        rocksdb::OptimisticTransactionDB::Open(options,
                                               path.native(),
                                               column_family_descriptors,
                                               &column_family_handles,
                                               &rocks_db.db_);
    if (not status.ok()) {
      SL_ERROR(log,
               "Can't open database in {}: {}",
               path.native(),
               status.ToString());
      return status_as_error(status, log);
    }
    SL_DEBUG(log,
             "Database opened in {} with {} column families",
             path.native(),
             column_family_handles.size());
    return outcome::success();
  }

  outcome::result<void> RocksDb::loadIdReservation() {
    std::string value;
    auto status = db_->Get(
        ro_, default_column_, make_slice(kIdReservationLookupKey), &value);
    if (status.IsNotFound()) {
      return outcome::success();
    }
    if (not status.ok()) {
      return status_as_error(status, logger_);
    }
    OUTCOME_TRY(reserved, codec::decode<uint64_t>(make_buffer(value)));
    // ids below the persisted bound might have been issued already
    next_id_ = reserved;
    reserved_until_ = reserved;
    SL_DEBUG(logger_, "Id generation resumes from {}", next_id_);
    return outcome::success();
  }

  rocksdb::ColumnFamilyOptions RocksDb::columnOptions() const {
    rocksdb::ColumnFamilyOptions options;
    options.OptimizeLevelStyleCompaction(column_memory_budget_);
    auto table_options = RocksDb::tableOptionsConfiguration();
    options.table_factory.reset(NewBlockBasedTableFactory(table_options));
    return options;
  }

  outcome::result<std::shared_ptr<BufferStorage>> RocksDb::openSpace(
      std::string_view name) {
    if (name.empty() or name == rocksdb::kDefaultColumnFamilyName) {
      return StorageError::INVALID_ARGUMENT;
    }

    std::lock_guard lock(spaces_mutex_);
    if (auto it = spaces_.find(name); it != spaces_.end()) {
      return it->second;
    }

    auto column_it = columns_.find(name);
    if (column_it == columns_.end()) {
      ColumnFamilyHandlePtr handle{};
      auto status =
          db_->CreateColumnFamily(columnOptions(), std::string(name), &handle);
      if (not status.ok()) {
        SL_ERROR(logger_,
                 "Can't create column family '{}': {}",
                 name,
                 status.ToString());
        return status_as_error(status, logger_);
      }
      SL_DEBUG(logger_, "Column family '{}' created", name);
      column_it = columns_.emplace(std::string(name), handle).first;
    }

    auto space = std::make_shared<RocksDbSpace>(
        weak_from_this(), std::string(name), column_it->second, logger_);
    spaces_.emplace(std::string(name), space);
    return space;
  }

  outcome::result<void> RocksDb::dropSpace(std::string_view name) {
    std::lock_guard lock(spaces_mutex_);
    auto column_it = columns_.find(name);
    if (column_it == columns_.end()) {
      return StorageError::SPACE_NOT_FOUND;
    }
    if (auto it = spaces_.find(name); it != spaces_.end()) {
      it->second->dropped_ = true;
      spaces_.erase(it);
    }
    auto *handle = column_it->second;
    auto status = db_->DropColumnFamily(handle);
    if (not status.ok()) {
      SL_ERROR(logger_,
               "Can't drop column family '{}': {}",
               name,
               status.ToString());
      return status_as_error(status, logger_);
    }
    columns_.erase(column_it);
    dropped_columns_.push_back(handle);
    SL_DEBUG(logger_, "Column family '{}' dropped", name);
    return outcome::success();
  }

  std::vector<std::string> RocksDb::spaceNames() const {
    std::lock_guard lock(spaces_mutex_);
    std::vector<std::string> names;
    names.reserve(columns_.size());
    for (const auto &[name, _] : columns_) {
      names.push_back(name);
    }
    return names;
  }

  outcome::result<uint64_t> RocksDb::generateId() {
    std::lock_guard lock(id_mutex_);
    if (next_id_ == reserved_until_) {
      const auto bound = reserved_until_ + kIdReservationBlock;
      OUTCOME_TRY(encoded, codec::encode(bound));
      auto status = db_->Put(wo_,
                             default_column_,
                             make_slice(kIdReservationLookupKey),
                             make_slice(codec::asView(encoded)));
      if (not status.ok()) {
        return status_as_error(status, logger_);
      }
      reserved_until_ = bound;
      SL_TRACE(logger_, "Ids reserved up to {}", bound);
    }
    return next_id_++;
  }

  outcome::result<void> RocksDb::runTransaction(const TransactionStep &step,
                                                size_t max_retries) {
    rocksdb::OptimisticTransactionOptions txn_options;
    txn_options.set_snapshot = true;

    for (size_t attempt = 1;; ++attempt) {
      std::unique_ptr<rocksdb::Transaction> txn{
          db_->BeginTransaction(wo_, txn_options)};

      auto res = step(*txn);
      if (res.has_value()) {
        auto status = txn->Commit();
        if (status.ok()) {
          return outcome::success();
        }
        auto error = status_as_error(status, logger_);
        if (error != StorageError::CONFLICT) {
          return error;
        }
      } else if (res.error() != StorageError::CONFLICT) {
        // not committed; destroying txn discards its writes
        return res.error();
      }

      if (max_retries != 0 and attempt > max_retries) {
        SL_DEBUG(logger_,
                 "Transaction gave up after {} conflicting attempts",
                 attempt);
        return StorageError::CONFLICT;
      }
      SL_DEBUG(logger_, "Transaction conflict, retry #{}", attempt);
    }
  }

  outcome::result<void> RocksDb::transaction(
      std::span<const std::shared_ptr<BufferStorage>> spaces,
      const TransactionBody &body) {
    std::vector<ColumnFamilyHandlePtr> columns;
    columns.reserve(spaces.size());
    for (const auto &space : spaces) {
      auto rocks_space = std::dynamic_pointer_cast<RocksDbSpace>(space);
      if (rocks_space == nullptr
          or rocks_space->storage_.lock().get() != this) {
        return StorageError::FOREIGN_SPACE;
      }
      if (rocks_space->dropped_) {
        return StorageError::SPACE_NOT_FOUND;
      }
      columns.push_back(rocks_space->column_);
    }

    return runTransaction(
        [&](rocksdb::Transaction &txn) -> outcome::result<void> {
          std::vector<RocksDbTransactionalSpace> views;
          views.reserve(columns.size());
          std::vector<BufferTransactionalMap *> handles;
          handles.reserve(columns.size());
          for (auto *column : columns) {
            handles.push_back(
                &views.emplace_back(*this, txn, column, logger_));
          }
          return body(handles);
        },
        max_transaction_retries_);
  }

  rocksdb::BlockBasedTableOptions RocksDb::tableOptionsConfiguration(
      uint32_t lru_cache_size_mib, uint32_t block_size_kib) {
    rocksdb::BlockBasedTableOptions table_options;
    table_options.format_version = 5;
    table_options.block_cache = rocksdb::NewLRUCache(
        static_cast<uint64_t>(lru_cache_size_mib) * 1024 * 1024);
    table_options.block_size = static_cast<size_t>(block_size_kib) * 1024;
    table_options.cache_index_and_filter_blocks = true;
    table_options.filter_policy.reset(rocksdb::NewBloomFilterPolicy(10, false));
    return table_options;
  }

  RocksDbSpace::RocksDbSpace(std::weak_ptr<RocksDb> storage,
                             std::string name,
                             rocksdb::ColumnFamilyHandle *column,
                             log::Logger logger)
      : storage_{std::move(storage)},
        name_{std::move(name)},
        column_{column},
        logger_{std::move(logger)} {}

  const std::string &RocksDbSpace::name() const {
    return name_;
  }

  std::unique_ptr<BufferBatch> RocksDbSpace::batch() {
    return std::make_unique<RocksDbBatch>(shared_from_this(), logger_);
  }

  std::optional<size_t> RocksDbSpace::byteSizeHint() const {
    auto rocks = storage_.lock();
    if (!rocks or dropped_) {
      return std::nullopt;
    }
    uint64_t live_bytes = 0;
    uint64_t memtable_bytes = 0;
    if (not rocks->db_->GetIntProperty(
            column_, "rocksdb.estimate-live-data-size", &live_bytes)
        or not rocks->db_->GetIntProperty(
            column_, "rocksdb.cur-size-all-mem-tables", &memtable_bytes)) {
      SL_ERROR(logger_, "Unable to retrieve size of '{}'", name_);
      return std::nullopt;
    }
    return live_bytes + memtable_bytes;
  }

  outcome::result<std::unique_ptr<RocksDbSpace::Cursor>>
  RocksDbSpace::cursor() {
    OUTCOME_TRY(rocks, use());
    auto it = std::unique_ptr<rocksdb::Iterator>(
        rocks->db_->NewIterator(rocks->ro_, column_));
    return std::unique_ptr<Cursor>{
        std::make_unique<RocksDBCursor>(std::move(it))};
  }

  outcome::result<bool> RocksDbSpace::contains(const ByteView &key) const {
    OUTCOME_TRY(rocks, use());
    std::string value;
    auto status = rocks->db_->Get(rocks->ro_, column_, make_slice(key), &value);
    if (status.ok()) {
      return true;
    }

    if (status.IsNotFound()) {
      return false;
    }

    return status_as_error(status, logger_);
  }

  outcome::result<ByteVecOrView> RocksDbSpace::get(const ByteView &key) const {
    OUTCOME_TRY(rocks, use());
    std::string value;
    auto status = rocks->db_->Get(rocks->ro_, column_, make_slice(key), &value);
    if (status.ok()) {
      return make_buffer(value);
    }
    return status_as_error(status, logger_);
  }

  outcome::result<std::optional<ByteVecOrView>> RocksDbSpace::tryGet(
      const ByteView &key) const {
    OUTCOME_TRY(rocks, use());
    std::string value;
    auto status = rocks->db_->Get(rocks->ro_, column_, make_slice(key), &value);
    if (status.ok()) {
      return std::make_optional(ByteVecOrView(make_buffer(value)));
    }

    if (status.IsNotFound()) {
      return std::nullopt;
    }

    return status_as_error(status, logger_);
  }

  outcome::result<void> RocksDbSpace::put(const ByteView &key,
                                          ByteVecOrView &&value) {
    OUTCOME_TRY(rocks, use());
    auto status = rocks->db_->Put(
        rocks->wo_, column_, make_slice(key), make_slice(std::move(value)));
    if (status.ok()) {
      return outcome::success();
    }

    return status_as_error(status, logger_);
  }

  outcome::result<void> RocksDbSpace::remove(const ByteView &key) {
    OUTCOME_TRY(rocks, use());
    auto status = rocks->db_->Delete(rocks->wo_, column_, make_slice(key));
    if (status.ok()) {
      return outcome::success();
    }

    return status_as_error(status, logger_);
  }

  outcome::result<std::optional<ByteVec>> RocksDbSpace::exchange(
      const ByteView &key, ByteVecOrView &&value) {
    OUTCOME_TRY(rocks, use());
    const auto owned = std::move(value).intoByteVec();
    std::optional<ByteVec> previous;
    OUTCOME_TRY(rocks->runTransaction(
        [&](rocksdb::Transaction &txn) -> outcome::result<void> {
          RocksDbTransactionalSpace space(*rocks, txn, column_, logger_);
          OUTCOME_TRY(old, space.exchange(key, ByteVecOrView{ByteView{owned}}));
          previous = std::move(old);
          return outcome::success();
        },
        kUnlimitedRetries));
    return previous;
  }

  outcome::result<std::optional<ByteVec>> RocksDbSpace::take(
      const ByteView &key) {
    OUTCOME_TRY(rocks, use());
    std::optional<ByteVec> previous;
    OUTCOME_TRY(rocks->runTransaction(
        [&](rocksdb::Transaction &txn) -> outcome::result<void> {
          RocksDbTransactionalSpace space(*rocks, txn, column_, logger_);
          OUTCOME_TRY(old, space.take(key));
          previous = std::move(old);
          return outcome::success();
        },
        kUnlimitedRetries));
    return previous;
  }

  outcome::result<std::optional<std::pair<ByteVec, ByteVec>>>
  RocksDbSpace::popFirst() {
    return popEdge(true);
  }

  outcome::result<std::optional<std::pair<ByteVec, ByteVec>>>
  RocksDbSpace::popLast() {
    return popEdge(false);
  }

  outcome::result<std::optional<std::pair<ByteVec, ByteVec>>>
  RocksDbSpace::popEdge(bool first) {
    OUTCOME_TRY(rocks, use());
    std::optional<std::pair<ByteVec, ByteVec>> popped;
    OUTCOME_TRY(rocks->runTransaction(
        [&](rocksdb::Transaction &txn) -> outcome::result<void> {
          popped.reset();
          rocksdb::ReadOptions ro;
          ro.snapshot = txn.GetSnapshot();
          std::unique_ptr<rocksdb::Iterator> it{txn.GetIterator(ro, column_)};
          first ? it->SeekToFirst() : it->SeekToLast();
          if (not it->Valid()) {
            if (not it->status().ok()) {
              return status_as_error(it->status(), logger_);
            }
            return outcome::success();
          }
          auto key = make_buffer(it->key());
          RocksDbTransactionalSpace space(*rocks, txn, column_, logger_);
          OUTCOME_TRY(value, space.take(key));
          if (not value.has_value()) {
            // removed concurrently after the snapshot was taken
            return StorageError::CONFLICT;
          }
          popped.emplace(std::move(key), std::move(value.value()));
          return outcome::success();
        },
        kUnlimitedRetries));
    return popped;
  }

  outcome::result<size_t> RocksDbSpace::count() const {
    OUTCOME_TRY(rocks, use());
    std::unique_ptr<rocksdb::Iterator> it{
        rocks->db_->NewIterator(rocks->ro_, column_)};
    size_t n = 0;
    for (it->SeekToFirst(); it->Valid(); it->Next()) {
      ++n;
    }
    if (not it->status().ok()) {
      return status_as_error(it->status(), logger_);
    }
    return n;
  }

  outcome::result<void> RocksDbSpace::clear() {
    OUTCOME_TRY(rocks, use());
    rocksdb::WriteBatch batch;
    std::unique_ptr<rocksdb::Iterator> it{
        rocks->db_->NewIterator(rocks->ro_, column_)};
    for (it->SeekToFirst(); it->Valid(); it->Next()) {
      batch.Delete(column_, it->key());
    }
    if (not it->status().ok()) {
      return status_as_error(it->status(), logger_);
    }
    auto status = rocks->db_->Write(rocks->wo_, &batch);
    if (not status.ok()) {
      return status_as_error(status, logger_);
    }
    SL_TRACE(logger_, "Space '{}' cleared, {} entries", name_, batch.Count());
    return outcome::success();
  }

  std::shared_future<outcome::result<void>> RocksDbSpace::flushAsync() {
    std::lock_guard lock(flush_mutex_);
    if (pending_flush_.valid()
        and pending_flush_.wait_for(std::chrono::seconds::zero())
                != std::future_status::ready) {
      return pending_flush_;
    }
    // The flush thread may end up holding the last reference to the space
    // or to the storage, so it is detached and never joined from them
    std::promise<outcome::result<void>> done;
    pending_flush_ = done.get_future().share();
    std::thread([weak{weak_from_this()}, done{std::move(done)}]() mutable {
      soralog::util::setThreadName("db-flush");
      auto self = weak.lock();
      if (not self) {
        done.set_value(StorageError::STORAGE_GONE);
        return;
      }
      done.set_value(self->flush());
    }).detach();
    return pending_flush_;
  }

  outcome::result<void> RocksDbSpace::flush() {
    OUTCOME_TRY(rocks, use());
    rocksdb::FlushOptions options;
    options.wait = true;
    auto status = rocks->db_->Flush(options, column_);
    if (not status.ok()) {
      SL_ERROR(logger_, "Can't flush '{}': {}", name_, status.ToString());
      return status_as_error(status, logger_);
    }
    SL_TRACE(logger_, "Space '{}' flushed", name_);
    return outcome::success();
  }

  outcome::result<std::shared_ptr<RocksDb>> RocksDbSpace::use() const {
    auto rocks = storage_.lock();
    if (!rocks) {
      return StorageError::STORAGE_GONE;
    }
    if (dropped_) {
      return StorageError::SPACE_NOT_FOUND;
    }
    return rocks;
  }

}  // namespace strata::storage
