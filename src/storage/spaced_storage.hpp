/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

/**
 * @brief Declares the SpacedStorage interface, the raw engine seen by the
 * typed layer.
 *
 * A SpacedStorage is a set of independently named, ordered byte maps
 * ("spaces") which can be read and written one by one, or several at once
 * inside an atomic transaction.
 */

#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "storage/buffer_map_types.hpp"

namespace strata::storage {

  class SpacedStorage {
   public:
    /**
     * Body of a transaction. Receives one handle per requested space, in the
     * requested order. Returning an error rolls the attempt back; the error
     * is returned from transaction() unchanged unless it is
     * StorageError::CONFLICT, which makes the storage run the body again.
     */
    using TransactionBody = std::function<outcome::result<void>(
        std::span<BufferTransactionalMap *const> spaces)>;

    virtual ~SpacedStorage() = default;

    /**
     * Open the space with the given name, creating it if it does not exist.
     * Opening the same name twice returns the same object.
     */
    virtual outcome::result<std::shared_ptr<BufferStorage>> openSpace(
        std::string_view name) = 0;

    /**
     * Drop the space together with all its data. Handles obtained earlier
     * become unusable.
     */
    virtual outcome::result<void> dropSpace(std::string_view name) = 0;

    /**
     * Names of all spaces present in the storage.
     */
    [[nodiscard]] virtual std::vector<std::string> spaceNames() const = 0;

    /**
     * Monotonic id, unique for the lifetime of the storage files.
     */
    virtual outcome::result<uint64_t> generateId() = 0;

    /**
     * Run body atomically over the given spaces, retrying it on conflicts.
     * Every space must have been opened from this storage.
     */
    virtual outcome::result<void> transaction(
        std::span<const std::shared_ptr<BufferStorage>> spaces,
        const TransactionBody &body) = 0;
  };

}  // namespace strata::storage
