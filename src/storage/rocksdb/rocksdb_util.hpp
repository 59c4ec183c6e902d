/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string>

#include <qtils/byte_vec.hpp>
#include <qtils/byte_view.hpp>
#include <rocksdb/slice.h>
#include <rocksdb/status.h>

#include "log/logger.hpp"
#include "storage/storage_error.hpp"

namespace strata::storage {

  inline StorageError status_as_error(const rocksdb::Status &s,
                                      const log::Logger &log) {
    if (s.IsNotFound()) {
      return StorageError::NOT_FOUND;
    }

    // Optimistic transactions report a lost race as Busy, and as TryAgain
    // when the memtable history is too short to validate the read set
    if (s.IsBusy() or s.IsTryAgain()) {
      return StorageError::CONFLICT;
    }

    if (s.IsIOError()) {
      SL_ERROR(log, ":{}", s.ToString());
      return StorageError::IO_ERROR;
    }

    if (s.IsInvalidArgument()) {
      return StorageError::INVALID_ARGUMENT;
    }

    if (s.IsCorruption()) {
      SL_ERROR(log, ":{}", s.ToString());
      return StorageError::CORRUPTION;
    }

    if (s.IsNotSupported()) {
      return StorageError::NOT_SUPPORTED;
    }

    SL_ERROR(log, "Unexpected status: {}", s.ToString());
    return StorageError::UNKNOWN;
  }

  inline rocksdb::Slice make_slice(const qtils::ByteView &buf) {
    // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
    const auto *ptr = reinterpret_cast<const char *>(buf.data());
    size_t n = buf.size();
    return rocksdb::Slice{ptr, n};
  }

  inline qtils::ByteView make_span(const rocksdb::Slice &s) {
    // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
    return {reinterpret_cast<const uint8_t *>(s.data()), s.size()};
  }

  inline qtils::ByteVec make_buffer(const rocksdb::Slice &s) {
    // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
    const auto *ptr = reinterpret_cast<const uint8_t *>(s.data());
    // NOLINTNEXTLINE(cppcoreguidelines-pro-bounds-pointer-arithmetic)
    return {ptr, ptr + s.size()};
  }

  inline qtils::ByteVec make_buffer(const std::string &s) {
    return make_buffer(rocksdb::Slice{s});
  }

}  // namespace strata::storage
