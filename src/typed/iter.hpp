/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

/**
 * @brief Lazy double-ended traversal of a key range of one collection.
 *
 * Each end owns its own engine cursor, created on the first step from that
 * end. The ends remember the last key they yielded and stop when they would
 * cross each other, so every entry of the range is yielded exactly once no
 * matter how next() and nextBack() are interleaved.
 */

#pragma once

#include <algorithm>
#include <memory>
#include <optional>
#include <utility>
#include <vector>

#include <qtils/outcome.hpp>

#include "storage/buffer_map_types.hpp"
#include "typed/bound.hpp"
#include "typed/entry.hpp"
#include "typed/views.hpp"

namespace strata::typed {

  namespace detail {

    inline bool lessBytes(qtils::ByteView lhs, qtils::ByteView rhs) {
      return std::ranges::lexicographical_compare(lhs, rhs);
    }

    /**
     * Untyped core of Iter, stepping over raw key/value pairs.
     */
    class RawIter {
     public:
      struct Item {
        qtils::ByteVec key;
        qtils::ByteVec value;
      };

      RawIter(std::shared_ptr<storage::BufferStorage> space,
              RawBound lower,
              RawBound upper)
          : space_(std::move(space)),
            lower_(std::move(lower)),
            upper_(std::move(upper)) {}

      /**
       * @param with_value whether to copy out the value
       * @return next entry from the chosen end, std::nullopt when exhausted
       */
      std::optional<outcome::result<Item>> step(bool forward,
                                                bool with_value) {
        if (exhausted_) {
          return std::nullopt;
        }
        auto position = forward ? advanceFront() : advanceBack();
        if (position.has_error()) {
          // the cursor can not be trusted any more
          exhausted_ = true;
          return outcome::result<Item>{position.error()};
        }
        if (not position.value()) {
          exhausted_ = true;
          return std::nullopt;
        }

        auto &cursor = forward ? front_ : back_;
        auto key = cursor->key().value();
        if (forward ? not belowUpper(key) : not aboveLower(key)) {
          exhausted_ = true;
          return std::nullopt;
        }
        // ends met
        if (forward ? last_back_ and not lessBytes(key, *last_back_)
                    : last_front_ and not lessBytes(*last_front_, key)) {
          exhausted_ = true;
          return std::nullopt;
        }

        Item item{.key = key, .value = {}};
        if (with_value) {
          item.value = std::move(cursor->value().value()).intoByteVec();
        }
        (forward ? last_front_ : last_back_) = std::move(key);
        return outcome::result<Item>{std::move(item)};
      }

     private:
      outcome::result<bool> advanceFront() {
        if (front_) {
          OUTCOME_TRY(front_->next());
          return front_->isValid();
        }
        OUTCOME_TRY(front, space_->cursor());
        front_ = std::move(front);
        switch (lower_.kind()) {
          case RawBound::Kind::Unbounded:
            return front_->seekFirst();
          case RawBound::Kind::Included:
            return front_->seek(lower_.key());
          case RawBound::Kind::Excluded: {
            OUTCOME_TRY(found, front_->seek(lower_.key()));
            if (found and front_->key() == lower_.key()) {
              OUTCOME_TRY(front_->next());
            }
            return front_->isValid();
          }
        }
        return false;
      }

      outcome::result<bool> advanceBack() {
        if (back_) {
          OUTCOME_TRY(back_->prev());
          return back_->isValid();
        }
        OUTCOME_TRY(back, space_->cursor());
        back_ = std::move(back);
        switch (upper_.kind()) {
          case RawBound::Kind::Unbounded:
            return back_->seekLast();
          case RawBound::Kind::Included:
            return back_->seekForPrev(upper_.key());
          case RawBound::Kind::Excluded: {
            OUTCOME_TRY(found, back_->seekForPrev(upper_.key()));
            if (found and back_->key() == upper_.key()) {
              OUTCOME_TRY(back_->prev());
            }
            return back_->isValid();
          }
        }
        return false;
      }

      bool belowUpper(const qtils::ByteVec &key) const {
        switch (upper_.kind()) {
          case RawBound::Kind::Unbounded:
            return true;
          case RawBound::Kind::Included:
            return not lessBytes(upper_.key(), key);
          case RawBound::Kind::Excluded:
            return lessBytes(key, upper_.key());
        }
        return false;
      }

      bool aboveLower(const qtils::ByteVec &key) const {
        switch (lower_.kind()) {
          case RawBound::Kind::Unbounded:
            return true;
          case RawBound::Kind::Included:
            return not lessBytes(key, lower_.key());
          case RawBound::Kind::Excluded:
            return lessBytes(lower_.key(), key);
        }
        return false;
      }

      std::shared_ptr<storage::BufferStorage> space_;
      RawBound lower_;
      RawBound upper_;
      std::unique_ptr<storage::BufferStorageCursor> front_;
      std::unique_ptr<storage::BufferStorageCursor> back_;
      std::optional<qtils::ByteVec> last_front_;
      std::optional<qtils::ByteVec> last_back_;
      bool exhausted_ = false;
    };

  }  // namespace detail

  template <Entry E>
  class KeyIter;

  template <Entry E>
  class ValueIter;

  /**
   * Entries of a range in ascending order of their encoded keys.
   *
   * Items are yielded undecoded; a malformed entry only fails when its key()
   * or value() is called and does not affect the rest of the range. An
   * engine error is yielded once and ends the iteration.
   */
  template <Entry E>
  class Iter {
   public:
    using Item = outcome::result<KeyValue<E>>;

    Iter(std::shared_ptr<storage::BufferStorage> space,
         RawBound lower,
         RawBound upper)
        : raw_(std::move(space), std::move(lower), std::move(upper)) {}

    std::optional<Item> next() {
      return wrap(raw_.step(true, true));
    }

    std::optional<Item> nextBack() {
      return wrap(raw_.step(false, true));
    }

    /// Yields only keys; values are not read
    KeyIter<E> keys() && {
      return KeyIter<E>{std::move(raw_)};
    }

    /// Yields only values
    ValueIter<E> values() && {
      return ValueIter<E>{std::move(raw_)};
    }

    /// Drains the rest of the range front to back
    std::vector<Item> collect() {
      std::vector<Item> items;
      while (auto item = next()) {
        items.emplace_back(std::move(item.value()));
      }
      return items;
    }

   private:
    static std::optional<Item> wrap(
        std::optional<outcome::result<detail::RawIter::Item>> raw) {
      if (not raw.has_value()) {
        return std::nullopt;
      }
      if (raw->has_error()) {
        return Item{raw->error()};
      }
      auto &entry = raw->value();
      return Item{KeyValue<E>{std::move(entry.key), std::move(entry.value)}};
    }

    detail::RawIter raw_;
  };

  template <Entry E>
  class KeyIter {
   public:
    using Item = outcome::result<Key<E>>;

    explicit KeyIter(detail::RawIter raw) : raw_(std::move(raw)) {}

    std::optional<Item> next() {
      return wrap(raw_.step(true, false));
    }

    std::optional<Item> nextBack() {
      return wrap(raw_.step(false, false));
    }

   private:
    static std::optional<Item> wrap(
        std::optional<outcome::result<detail::RawIter::Item>> raw) {
      if (not raw.has_value()) {
        return std::nullopt;
      }
      if (raw->has_error()) {
        return Item{raw->error()};
      }
      return Item{Key<E>{std::move(raw->value().key)}};
    }

    detail::RawIter raw_;
  };

  template <Entry E>
  class ValueIter {
   public:
    using Item = outcome::result<Value<E>>;

    explicit ValueIter(detail::RawIter raw) : raw_(std::move(raw)) {}

    std::optional<Item> next() {
      return wrap(raw_.step(true, true));
    }

    std::optional<Item> nextBack() {
      return wrap(raw_.step(false, true));
    }

   private:
    static std::optional<Item> wrap(
        std::optional<outcome::result<detail::RawIter::Item>> raw) {
      if (not raw.has_value()) {
        return std::nullopt;
      }
      if (raw->has_error()) {
        return Item{raw->error()};
      }
      return Item{Value<E>{std::move(raw->value().value)}};
    }

    detail::RawIter raw_;
  };

}  // namespace strata::typed
