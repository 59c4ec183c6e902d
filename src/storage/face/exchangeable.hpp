/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

/**
 * @brief Interface for read-modify-write primitives of a storage map.
 *
 * Each method is a single atomic engine operation: no concurrent writer can
 * slip between reading the old value and writing the new one.
 */

#pragma once

#include <optional>
#include <utility>

#include <qtils/outcome.hpp>

#include "storage/face/owned_or_view.hpp"

namespace strata::storage::face {

  template <typename K, typename V>
  struct Exchangeable {
    virtual ~Exchangeable() = default;

    /**
     * @brief Store a value and return the one it displaced.
     * @return previous value, or std::nullopt if the key was absent
     */
    virtual outcome::result<std::optional<V>> exchange(
        const View<K> &key, OwnedOrView<V> &&value) = 0;

    /**
     * @brief Remove a value and return it.
     * @return removed value, or std::nullopt if the key was absent
     */
    virtual outcome::result<std::optional<V>> take(const View<K> &key) = 0;

    /**
     * @brief Remove and return the entry with the smallest key.
     */
    virtual outcome::result<std::optional<std::pair<K, V>>> popFirst() = 0;

    /**
     * @brief Remove and return the entry with the greatest key.
     */
    virtual outcome::result<std::optional<std::pair<K, V>>> popLast() = 0;
  };

}  // namespace strata::storage::face
