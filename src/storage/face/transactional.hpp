/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

/**
 * @brief Per-space handle of a running multi-space transaction.
 *
 * A TransactionalMap is created by the storage for exactly one attempt of a
 * transaction body and must not be used after the body returns. Reads observe
 * the writes made earlier in the same attempt; nothing becomes visible to
 * other readers until the whole transaction commits.
 */

#pragma once

#include <cstdint>
#include <optional>

#include <qtils/outcome.hpp>

#include "storage/face/owned_or_view.hpp"
#include "storage/face/writeable.hpp"

namespace strata::storage::face {

  template <typename K, typename V>
  struct TransactionalMap : Writeable<K, V> {
    /**
     * @brief Read a value, registering the key for conflict detection.
     */
    virtual outcome::result<std::optional<V>> get(const View<K> &key) = 0;

    /**
     * @brief Store a value and return the one it displaced (possibly written
     * earlier in this transaction).
     */
    virtual outcome::result<std::optional<V>> exchange(
        const View<K> &key, OwnedOrView<V> &&value) = 0;

    /**
     * @brief Remove a value and return it.
     */
    virtual outcome::result<std::optional<V>> take(const View<K> &key) = 0;

    /**
     * @brief Schedule flushing of the space without waiting for it.
     */
    virtual void flush() = 0;

    /**
     * @brief Next value of the storage-wide monotonic id sequence.
     */
    virtual outcome::result<uint64_t> generateId() = 0;
  };

}  // namespace strata::storage::face
