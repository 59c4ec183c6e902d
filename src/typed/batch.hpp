/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>
#include <vector>

#include <qtils/outcome.hpp>

#include "codec/codec.hpp"
#include "typed/entry.hpp"

namespace strata::typed {

  /**
   * Typed mutations staged for one atomic write. Staging only encodes; the
   * storage is touched when the batch is applied to a collection.
   */
  template <Entry E>
  class Batch {
   public:
    using KeyType = typename E::Key;
    using ValueType = typename E::Value;

    struct Operation {
      codec::EncodedBuffer key;
      /// std::nullopt stands for removal
      std::optional<codec::EncodedBuffer> value;
    };

    outcome::result<void> insert(const KeyType &key, const ValueType &value) {
      OUTCOME_TRY(encoded_key, codec::encode(key));
      OUTCOME_TRY(encoded_value, codec::encode(value));
      operations_.push_back(
          Operation{std::move(encoded_key), std::move(encoded_value)});
      return outcome::success();
    }

    outcome::result<void> remove(const KeyType &key) {
      OUTCOME_TRY(encoded_key, codec::encode(key));
      operations_.push_back(Operation{std::move(encoded_key), std::nullopt});
      return outcome::success();
    }

    size_t size() const {
      return operations_.size();
    }

    bool empty() const {
      return operations_.empty();
    }

    void clear() {
      operations_.clear();
    }

    /// Staged operations in the order they were made
    const std::vector<Operation> &operations() const {
      return operations_;
    }

   private:
    std::vector<Operation> operations_;
  };

}  // namespace strata::typed
