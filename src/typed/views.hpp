/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

/**
 * @brief Typed views over bytes returned by the engine.
 *
 * A view owns the bytes and decodes them on every access. For borrowed
 * types the decoded object points into the view, so the accessors are only
 * available on lvalues: `collection.get(k).value()->value()` does not
 * compile when the value type is borrowed.
 */

#pragma once

#include <utility>

#include <qtils/byte_vec.hpp>
#include <qtils/byte_view.hpp>
#include <qtils/outcome.hpp>

#include "codec/codec.hpp"
#include "typed/entry.hpp"

namespace strata::typed {

  template <Entry E>
  class Key {
   public:
    using Type = typename E::Key;

    explicit Key(qtils::ByteVec raw) : raw_(std::move(raw)) {}

    outcome::result<Type> key() const & {
      return codec::decode<Type>(raw_);
    }

    outcome::result<Type> key() const &&
      requires(not codec::Borrowed<Type>)
    {
      return codec::decode<Type>(raw_);
    }

    outcome::result<Type> key() const &&
      requires codec::Borrowed<Type>
    = delete;

    qtils::ByteView bytes() const {
      return raw_;
    }

   private:
    qtils::ByteVec raw_;
  };

  template <Entry E>
  class Value {
   public:
    using Type = typename E::Value;

    explicit Value(qtils::ByteVec raw) : raw_(std::move(raw)) {}

    outcome::result<Type> value() const & {
      return codec::decode<Type>(raw_);
    }

    outcome::result<Type> value() const &&
      requires(not codec::Borrowed<Type>)
    {
      return codec::decode<Type>(raw_);
    }

    outcome::result<Type> value() const &&
      requires codec::Borrowed<Type>
    = delete;

    qtils::ByteView bytes() const {
      return raw_;
    }

   private:
    qtils::ByteVec raw_;
  };

  template <Entry E>
  class KeyValue {
   public:
    using KeyType = typename E::Key;
    using ValueType = typename E::Value;

    KeyValue(qtils::ByteVec raw_key, qtils::ByteVec raw_value)
        : raw_key_(std::move(raw_key)), raw_value_(std::move(raw_value)) {}

    outcome::result<KeyType> key() const & {
      return codec::decode<KeyType>(raw_key_);
    }

    outcome::result<KeyType> key() const &&
      requires(not codec::Borrowed<KeyType>)
    {
      return codec::decode<KeyType>(raw_key_);
    }

    outcome::result<KeyType> key() const &&
      requires codec::Borrowed<KeyType>
    = delete;

    outcome::result<ValueType> value() const & {
      return codec::decode<ValueType>(raw_value_);
    }

    outcome::result<ValueType> value() const &&
      requires(not codec::Borrowed<ValueType>)
    {
      return codec::decode<ValueType>(raw_value_);
    }

    outcome::result<ValueType> value() const &&
      requires codec::Borrowed<ValueType>
    = delete;

    qtils::ByteView keyBytes() const {
      return raw_key_;
    }

    qtils::ByteView valueBytes() const {
      return raw_value_;
    }

   private:
    qtils::ByteVec raw_key_;
    qtils::ByteVec raw_value_;
  };

}  // namespace strata::typed
