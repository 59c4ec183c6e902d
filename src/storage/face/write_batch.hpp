/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

/**
 * @brief Interface for batch write operations on storage.
 *
 * A WriteBatch accumulates multiple write operations and applies them
 * in a single atomic commit.
 */

#pragma once

#include "storage/face/writeable.hpp"

namespace strata::storage::face {

  /**
   * @brief An abstraction over a storage, which can be used for batch writes.
   *
   * Nothing put into the batch is visible until commit(); after commit
   * either every operation is visible or none is.
   */
  template <typename K, typename V>
  struct WriteBatch : public Writeable<K, V> {
    /**
     * @brief Applies all accumulated operations atomically.
     */
    virtual outcome::result<void> commit() = 0;

    /**
     * @brief Drops all pending operations so the batch can be reused.
     */
    virtual void clear() = 0;

    /**
     * @brief Number of pending operations.
     */
    [[nodiscard]] virtual size_t count() const = 0;
  };

}  // namespace strata::storage::face
