/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

/**
 * @brief Composite interface for generic key-value storage.
 *
 * Combines readable, writable, exchangeable, iterable and batched write
 * support into a single storage abstraction of one named space.
 */

#pragma once

#include <future>
#include <optional>
#include <string>

#include "storage/face/batch_writeable.hpp"
#include "storage/face/exchangeable.hpp"
#include "storage/face/iterable.hpp"
#include "storage/face/readable.hpp"
#include "storage/face/writeable.hpp"

namespace strata::storage::face {

  /**
   * @brief Abstraction over one named space of a key-value storage.
   * @tparam K Key type.
   * @tparam V Value type.
   */
  template <typename K, typename V>
  struct GenericStorage : Readable<K, V>,
                          Iterable<K, V>,
                          Writeable<K, V>,
                          Exchangeable<K, V>,
                          BatchWriteable<K, V> {
    /**
     * @brief Name the space was opened with.
     */
    [[nodiscard]] virtual const std::string &name() const = 0;

    /**
     * @brief Exact number of entries. Walks the whole space.
     */
    virtual outcome::result<size_t> count() const = 0;

    /**
     * @brief Removes every entry in one atomic write.
     */
    virtual outcome::result<void> clear() = 0;

    /**
     * @brief Requests a durability barrier for this space.
     *
     * Callers arriving while a barrier is still in progress receive the same
     * future.
     */
    virtual std::shared_future<outcome::result<void>> flushAsync() = 0;

    /**
     * @brief Hint for approximate RAM usage.
     *
     * @return Optional in-memory size in bytes, or std::nullopt if no size
     * hint is available.
     */
    [[nodiscard]] virtual std::optional<size_t> byteSizeHint() const {
      return std::nullopt;
    }
  };

}  // namespace strata::storage::face
