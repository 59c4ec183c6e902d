/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

/**
 * @brief Byte-level specializations of the storage faces.
 *
 * Everything below the typed layer deals with raw bytes only: keys are passed
 * as qtils::ByteView, values as qtils::ByteVecOrView, and whatever the engine
 * hands back is an owned qtils::ByteVec.
 */

#pragma once

#include <qtils/byte_vec.hpp>
#include <qtils/byte_vec_or_view.hpp>
#include <qtils/byte_view.hpp>

#include "storage/face/generic_maps.hpp"
#include "storage/face/transactional.hpp"
#include "storage/face/write_batch.hpp"

namespace strata::storage::face {

  template <>
  struct OwnedOrViewTrait<qtils::ByteVec> {
    using type = qtils::ByteVecOrView;
  };

  template <>
  struct ViewTrait<qtils::ByteVec> {
    using type = qtils::ByteView;
  };

}  // namespace strata::storage::face

namespace strata::storage {

  using qtils::ByteVec;
  using qtils::ByteVecOrView;
  using qtils::ByteView;

  /// Write batch over one space
  using BufferBatch = face::WriteBatch<ByteVec, ByteVec>;

  /// One named space of the storage
  using BufferStorage = face::GenericStorage<ByteVec, ByteVec>;

  /// Cursor over one space
  using BufferStorageCursor = face::MapCursor<ByteVec, ByteVec>;

  /// Handle of one space inside a running transaction
  using BufferTransactionalMap = face::TransactionalMap<ByteVec, ByteVec>;

}  // namespace strata::storage
