/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>

#include <qtils/outcome.hpp>

#include "storage/face/owned_or_view.hpp"

namespace strata::storage::face {
  /**
   * @brief A mixin for read-only map.
   * @tparam K key type
   * @tparam V value type
   */
  template <typename K, typename V>
  struct Readable {
    virtual ~Readable() = default;

    /**
     * @brief Checks if given key-value binding exists in the storage.
     * @return true if key has value, false if does not, or error
     */
    [[nodiscard]] virtual outcome::result<bool> contains(
        const View<K> &key) const = 0;

    /**
     * @brief Get value by key
     * @return value, or StorageError::NOT_FOUND if there is none
     */
    [[nodiscard]] virtual outcome::result<OwnedOrView<V>> get(
        const View<K> &key) const = 0;

    /**
     * @brief Get value by key
     * @return value if contains(key) or std::nullopt
     */
    [[nodiscard]] virtual outcome::result<std::optional<OwnedOrView<V>>> tryGet(
        const View<K> &key) const = 0;
  };
}  // namespace strata::storage::face
