/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>

#include <qtils/error_throw.hpp>
#include <qtils/outcome.hpp>

#include "codec/codec.hpp"
#include "storage/buffer_map_types.hpp"
#include "typed/batch.hpp"
#include "typed/entry.hpp"
#include "typed/views.hpp"

namespace strata::typed {

  template <Entry... Es>
  class Joined;

  /**
   * Typed access to one collection inside a single transaction attempt.
   *
   * Views are handed to the transaction callback and must not escape it. A
   * value that can not be encoded here is a programming error and is raised
   * as an exception with CodecError::ENCODE_FAILED, which aborts the whole
   * transaction without retrying it.
   */
  template <Entry E>
  class TransactionalView {
   public:
    using KeyType = typename E::Key;
    using ValueType = typename E::Value;

    outcome::result<std::optional<Value<E>>> insert(const KeyType &key,
                                                    const ValueType &value) {
      auto encoded_key = encodeOrRaise(key);
      auto encoded_value = encodeOrRaise(value);
      OUTCOME_TRY(previous,
                  map_->exchange(codec::asView(encoded_key),
                                 qtils::ByteVecOrView{
                                     codec::asView(encoded_value)}));
      return wrap(std::move(previous));
    }

    outcome::result<std::optional<Value<E>>> remove(const KeyType &key) {
      auto encoded_key = encodeOrRaise(key);
      OUTCOME_TRY(previous, map_->take(codec::asView(encoded_key)));
      return wrap(std::move(previous));
    }

    /// Observes writes made earlier in the same attempt
    outcome::result<std::optional<Value<E>>> get(const KeyType &key) {
      auto encoded_key = encodeOrRaise(key);
      OUTCOME_TRY(found, map_->get(codec::asView(encoded_key)));
      return wrap(std::move(found));
    }

    /// Stages every operation of batch; the batch stays intact for retries
    outcome::result<void> applyBatch(const Batch<E> &batch) {
      for (const auto &operation : batch.operations()) {
        if (operation.value.has_value()) {
          OUTCOME_TRY(map_->put(
              codec::asView(operation.key),
              qtils::ByteVecOrView{codec::asView(*operation.value)}));
        } else {
          OUTCOME_TRY(map_->remove(codec::asView(operation.key)));
        }
      }
      return outcome::success();
    }

    /// Schedules a flush of the collection and returns immediately
    void flush() {
      map_->flush();
    }

    outcome::result<uint64_t> generateId() {
      return map_->generateId();
    }

   private:
    template <Entry... Es>
    friend class Joined;

    explicit TransactionalView(storage::BufferTransactionalMap &map)
        : map_(&map) {}

    template <typename T>
    static codec::EncodedBuffer encodeOrRaise(const T &value) {
      auto encoded = codec::encode(value);
      if (encoded.has_error()) {
        qtils::raise(encoded.error());
      }
      return std::move(encoded.value());
    }

    static std::optional<Value<E>> wrap(std::optional<qtils::ByteVec> raw) {
      if (not raw.has_value()) {
        return std::nullopt;
      }
      return Value<E>{std::move(raw.value())};
    }

    storage::BufferTransactionalMap *map_;
  };

}  // namespace strata::typed
