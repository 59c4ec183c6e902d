/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>
#include <stdexcept>

#include "storage/face/write_batch.hpp"

namespace strata::storage::face {

  /**
   * @brief Mixin interface for batched map modifications.
   */
  template <typename K, typename V>
  struct BatchWriteable {
    virtual ~BatchWriteable() = default;

    /**
     * @brief Create a new write batch bound to this map.
     *
     * The default implementation throws logic_error if not overridden.
     */
    virtual std::unique_ptr<WriteBatch<K, V>> batch() {
      throw std::logic_error{"BatchWriteable::batch not implemented"};
    }
  };

}  // namespace strata::storage::face
