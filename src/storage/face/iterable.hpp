/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>
#include <optional>

#include <qtils/outcome.hpp>

#include "storage/face/owned_or_view.hpp"

namespace strata::storage::face {

  /**
   * @brief Positioned cursor over an ordered map.
   *
   * Keys are ordered bytewise. A cursor is a single-consumer object; it must
   * not be shared between threads.
   */
  template <typename K, typename V>
  struct MapCursor {
    virtual ~MapCursor() = default;

    /**
     * @brief Same as std::begin(...);
     * @return true if the cursor points to an element
     */
    virtual outcome::result<bool> seekFirst() = 0;

    /**
     * @brief Find first element with key not less than @param key
     * @return true if the cursor points to an element
     */
    virtual outcome::result<bool> seek(const View<K> &key) = 0;

    /**
     * @brief Find last element with key not greater than @param key
     * @return true if the cursor points to an element
     */
    virtual outcome::result<bool> seekForPrev(const View<K> &key) = 0;

    /**
     * @brief Same as iterator--(std::end(...));
     * @return true if the cursor points to an element
     */
    virtual outcome::result<bool> seekLast() = 0;

    /**
     * @brief Is the cursor in a valid state?
     */
    [[nodiscard]] virtual bool isValid() const = 0;

    /**
     * @brief Make step forward.
     */
    virtual outcome::result<void> next() = 0;

    /**
     * @brief Make step back.
     */
    virtual outcome::result<void> prev() = 0;

    /**
     * @brief Getter for key.
     * @return key if isValid()
     */
    [[nodiscard]] virtual std::optional<K> key() const = 0;

    /**
     * @brief Getter for value.
     * @return value if isValid()
     */
    [[nodiscard]] virtual std::optional<OwnedOrView<V>> value() const = 0;
  };

  /**
   * @brief A mixin for an iterable map.
   */
  template <typename K, typename V>
  struct Iterable {
    using Cursor = MapCursor<K, V>;

    virtual ~Iterable() = default;

    /**
     * @brief Returns new cursor over the current state of the map. The cursor
     * is not positioned; call one of the seek methods first.
     * @return the cursor, or an error if the map can not be read any more
     */
    virtual outcome::result<std::unique_ptr<Cursor>> cursor() = 0;
  };

}  // namespace strata::storage::face
