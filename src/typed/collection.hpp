/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <future>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

#include <qtils/outcome.hpp>

#include "codec/codec.hpp"
#include "storage/buffer_map_types.hpp"
#include "storage/spaced_storage.hpp"
#include "typed/batch.hpp"
#include "typed/bound.hpp"
#include "typed/entry.hpp"
#include "typed/iter.hpp"
#include "typed/transaction.hpp"
#include "typed/views.hpp"

namespace strata::typed {

  /**
   * Named, ordered map of E::Key to E::Value stored in one engine space.
   *
   * Keys and values are encoded on the way in and handed back as views which
   * decode on access. Copies of a collection share the same space and can be
   * used from several threads.
   */
  template <Entry E>
  class Collection {
   public:
    using KeyType = typename E::Key;
    using ValueType = typename E::Value;

    /**
     * Opens the space called name, creating it if needed.
     */
    static outcome::result<Collection> open(
        std::shared_ptr<storage::SpacedStorage> engine, std::string_view name) {
      OUTCOME_TRY(space, engine->openSpace(name));
      return Collection(std::move(engine), std::move(space));
    }

    /**
     * Stores value under key.
     * @return value previously stored under key, if any
     */
    outcome::result<std::optional<Value<E>>> insert(const KeyType &key,
                                                    const ValueType &value) {
      OUTCOME_TRY(encoded_key, codec::encode(key));
      OUTCOME_TRY(encoded_value, codec::encode(value));
      OUTCOME_TRY(previous,
                  space_->exchange(
                      codec::asView(encoded_key),
                      qtils::ByteVecOrView{codec::asView(encoded_value)}));
      return wrap(std::move(previous));
    }

    outcome::result<std::optional<Value<E>>> get(const KeyType &key) const {
      OUTCOME_TRY(encoded_key, codec::encode(key));
      OUTCOME_TRY(found, space_->tryGet(codec::asView(encoded_key)));
      if (not found.has_value()) {
        return std::nullopt;
      }
      return Value<E>{std::move(found.value()).intoByteVec()};
    }

    outcome::result<bool> contains(const KeyType &key) const {
      OUTCOME_TRY(encoded_key, codec::encode(key));
      return space_->contains(codec::asView(encoded_key));
    }

    /**
     * Removes key.
     * @return removed value, std::nullopt if there was none
     */
    outcome::result<std::optional<Value<E>>> remove(const KeyType &key) {
      OUTCOME_TRY(encoded_key, codec::encode(key));
      OUTCOME_TRY(previous, space_->take(codec::asView(encoded_key)));
      return wrap(std::move(previous));
    }

    /**
     * Entries with keys between from and to.
     */
    outcome::result<Iter<E>> range(const Bound<KeyType> &from,
                                   const Bound<KeyType> &to) const {
      OUTCOME_TRY(lower, encodeBound(from));
      OUTCOME_TRY(upper, encodeBound(to));
      return Iter<E>{space_, std::move(lower), std::move(upper)};
    }

    /**
     * Entries with from <= key < to.
     */
    outcome::result<Iter<E>> range(const KeyType &from,
                                   const KeyType &to) const {
      return range(Bound<KeyType>::included(from),
                   Bound<KeyType>::excluded(to));
    }

    /**
     * Entries whose encoded key starts with the encoded prefix.
     */
    outcome::result<Iter<E>> scanPrefix(const KeyType &prefix) const {
      return scanEncodedPrefix(codec::encode(prefix));
    }

    /**
     * Same for a prefix of another type, such as the leading element of a
     * tuple key.
     */
    template <typename P>
      requires(not std::is_same_v<std::remove_cvref_t<P>, KeyType>)
    outcome::result<Iter<E>> scanPrefix(const P &prefix) const {
      return scanEncodedPrefix(codec::encode(prefix));
    }

    Iter<E> iter() const {
      return Iter<E>{
          space_, RawBound::unbounded(), RawBound::unbounded()};
    }

    /**
     * Applies all operations of batch in one atomic write.
     */
    outcome::result<void> applyBatch(Batch<E> &&batch) {
      auto raw = space_->batch();
      for (const auto &operation : batch.operations()) {
        if (operation.value.has_value()) {
          OUTCOME_TRY(raw->put(
              codec::asView(operation.key),
              qtils::ByteVecOrView{codec::asView(*operation.value)}));
        } else {
          OUTCOME_TRY(raw->remove(codec::asView(operation.key)));
        }
      }
      OUTCOME_TRY(raw->commit());
      batch.clear();
      return outcome::success();
    }

    /// Atomically removes and returns the entry with the smallest key
    outcome::result<std::optional<KeyValue<E>>> popMin() {
      OUTCOME_TRY(popped, space_->popFirst());
      return wrapPair(std::move(popped));
    }

    /// Atomically removes and returns the entry with the greatest key
    outcome::result<std::optional<KeyValue<E>>> popMax() {
      OUTCOME_TRY(popped, space_->popLast());
      return wrapPair(std::move(popped));
    }

    /// Number of entries; walks the whole collection
    outcome::result<size_t> size() const {
      return space_->count();
    }

    outcome::result<bool> isEmpty() const {
      OUTCOME_TRY(cursor, space_->cursor());
      OUTCOME_TRY(found, cursor->seekFirst());
      return not found;
    }

    outcome::result<void> clear() {
      return space_->clear();
    }

    /**
     * Makes everything written so far durable. Callers arriving while a
     * flush is in progress share it.
     */
    std::shared_future<outcome::result<void>> flushAsync() {
      return space_->flushAsync();
    }

    /// Single collection shortcut for join(*this).transaction(f)
    template <typename F>
    auto transaction(F &&f) const {
      return join(*this).transaction(std::forward<F>(f));
    }

    const std::string &name() const {
      return space_->name();
    }

   private:
    template <Entry... Es>
    friend class Joined;

    Collection(std::shared_ptr<storage::SpacedStorage> engine,
               std::shared_ptr<storage::BufferStorage> space)
        : engine_(std::move(engine)), space_(std::move(space)) {}

    static std::optional<Value<E>> wrap(std::optional<qtils::ByteVec> raw) {
      if (not raw.has_value()) {
        return std::nullopt;
      }
      return Value<E>{std::move(raw.value())};
    }

    static std::optional<KeyValue<E>> wrapPair(
        std::optional<std::pair<qtils::ByteVec, qtils::ByteVec>> raw) {
      if (not raw.has_value()) {
        return std::nullopt;
      }
      return KeyValue<E>{std::move(raw->first), std::move(raw->second)};
    }

    static outcome::result<RawBound> encodeBound(const Bound<KeyType> &bound) {
      if (bound.isUnbounded()) {
        return RawBound::unbounded();
      }
      OUTCOME_TRY(encoded, codec::encode(bound.key()));
      qtils::ByteVec key(encoded.begin(), encoded.end());
      if (bound.kind() == Bound<KeyType>::Kind::Included) {
        return RawBound::included(std::move(key));
      }
      return RawBound::excluded(std::move(key));
    }

    outcome::result<Iter<E>> scanEncodedPrefix(
        outcome::result<codec::EncodedBuffer> encoded) const {
      OUTCOME_TRY(prefix, std::move(encoded));
      qtils::ByteVec lower(prefix.begin(), prefix.end());

      // smallest key greater than every key starting with the prefix
      qtils::ByteVec upper = lower;
      while (not upper.empty() and upper.back() == 0xff) {
        upper.pop_back();
      }
      if (upper.empty()) {
        return Iter<E>{
            space_, RawBound::included(std::move(lower)), RawBound::unbounded()};
      }
      ++upper.back();
      return Iter<E>{space_,
                     RawBound::included(std::move(lower)),
                     RawBound::excluded(std::move(upper))};
    }

    std::shared_ptr<storage::SpacedStorage> engine_;
    std::shared_ptr<storage::BufferStorage> space_;
  };

}  // namespace strata::typed
