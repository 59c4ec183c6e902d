/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>
#include <optional>
#include <utility>

#include <qtils/byte_vec.hpp>

namespace strata::typed {

  /**
   * One end of a key range.
   */
  template <typename K>
  class Bound {
   public:
    enum class Kind : uint8_t { Included, Excluded, Unbounded };

    static Bound included(K key) {
      return Bound{Kind::Included, std::move(key)};
    }

    static Bound excluded(K key) {
      return Bound{Kind::Excluded, std::move(key)};
    }

    static Bound unbounded() {
      return Bound{Kind::Unbounded, std::nullopt};
    }

    Kind kind() const {
      return kind_;
    }

    bool isUnbounded() const {
      return kind_ == Kind::Unbounded;
    }

    /// Key of a bounded end; must not be called on an unbounded one
    const K &key() const {
      return key_.value();
    }

   private:
    Bound(Kind kind, std::optional<K> key)
        : kind_(kind), key_(std::move(key)) {}

    Kind kind_;
    std::optional<K> key_;
  };

  /// Bound over encoded keys, as handed to the engine
  using RawBound = Bound<qtils::ByteVec>;

}  // namespace strata::typed
