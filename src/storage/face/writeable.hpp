/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

/**
 * @brief Interface for modifiable storage map.
 *
 * Writeable provides methods to add or remove entries in the underlying
 * storage by key, without reporting what was there before.
 */

#pragma once

#include <qtils/outcome.hpp>

#include "storage/face/owned_or_view.hpp"

namespace strata::storage::face {

  /**
   * @brief Interface for modifiable map storage.
   * @tparam K Key type.
   * @tparam V Value type.
   *
   * Implementations apply each operation immediately or as part of a larger
   * batch.
   */
  template <typename K, typename V>
  struct Writeable {
    virtual ~Writeable() = default;

    /**
     * @brief Store or update a value by key.
     *
     * @param key   Key to associate with the value.
     * @param value The value to store, either owned or a view.
     */
    virtual outcome::result<void> put(const View<K> &key,
                                      OwnedOrView<V> &&value) = 0;

    /**
     * @brief Remove a value by key. Removing an absent key is not an error.
     */
    virtual outcome::result<void> remove(const View<K> &key) = 0;
  };

}  // namespace strata::storage::face
