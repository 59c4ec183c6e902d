/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

/**
 * @brief Bridge between typed values and the bytes stored in the engine.
 *
 * Everything crossing the typed layer boundary goes through encode() and
 * decode() below, always with the default SCALE configuration. Encoding
 * writes into an inline buffer and spills to the heap only for long values.
 * Decoding into a borrowed type (std::string_view, qtils::ByteView) does not
 * copy: the result refers into the decoded bytes.
 */

#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <utility>

#include <boost/container/small_vector.hpp>
#include <qtils/byte_vec.hpp>
#include <qtils/byte_view.hpp>
#include <qtils/outcome.hpp>
#include <scale/scale.hpp>

#include "codec/codec_error.hpp"

namespace strata::codec {

  /// Encoded values up to this size never touch the heap
  inline constexpr size_t kInlineCapacity = 64;

  using EncodedBuffer =
      boost::container::small_vector<uint8_t, kInlineCapacity>;

  /**
   * Whether the buffer still uses its inline storage. Only meaningful for
   * diagnostics; results never depend on it.
   */
  inline bool isInline(const EncodedBuffer &buffer) {
    return buffer.capacity() <= kInlineCapacity;
  }

  inline qtils::ByteView asView(const EncodedBuffer &buffer) {
    return {buffer.data(), buffer.size()};
  }

  /**
   * Types which decode by referring into the source bytes. Encoded exactly
   * like their owning counterpart, so both are interchangeable on disk.
   */
  template <typename T>
  struct BorrowTraits {
    static constexpr bool borrowed = false;
  };

  template <>
  struct BorrowTraits<std::string_view> {
    static constexpr bool borrowed = true;
    using Owned = std::string;

    static std::string_view fromBytes(qtils::ByteView bytes) {
      // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
      return {reinterpret_cast<const char *>(bytes.data()), bytes.size()};
    }
  };

  template <>
  struct BorrowTraits<qtils::ByteView> {
    static constexpr bool borrowed = true;
    using Owned = qtils::ByteVec;

    static qtils::ByteView fromBytes(qtils::ByteView bytes) {
      return bytes;
    }
  };

  template <typename T>
  concept Borrowed = BorrowTraits<std::remove_cvref_t<T>>::borrowed;

  namespace detail {

    /**
     * Reads the compact length prefix of a byte sequence with the SCALE
     * decoder, which also rejects non-canonical prefixes.
     * @return pair of prefix size and announced payload length
     */
    inline outcome::result<std::pair<size_t, size_t>> readLengthPrefix(
        qtils::ByteView bytes) {
      scale::CompactInteger length;
      EncodedBuffer prefix;
      try {
        scale::backend::FromBytes decoder(bytes);
        scale::decode(length, decoder);
        if (length > bytes.size()) {
          return CodecError::DECODE_FAILED;
        }
        scale::backend::ToBytes encoder(prefix);
        scale::encode(length, encoder);
      } catch (const std::system_error &) {
        return CodecError::DECODE_FAILED;
      }
      return std::pair{prefix.size(), length.convert_to<size_t>()};
    }

    template <Borrowed T>
    outcome::result<T> decodeBorrowed(qtils::ByteView bytes) {
      OUTCOME_TRY(prefix, readLengthPrefix(bytes));
      auto [prefix_size, length] = prefix;
      const auto available = bytes.size() - prefix_size;
      if (length > available) {
        return CodecError::DECODE_FAILED;
      }
      if (length < available) {
        return CodecError::TRAILING_BYTES;
      }
      return BorrowTraits<T>::fromBytes(bytes.subspan(prefix_size));
    }

  }  // namespace detail

  /**
   * Encodes value with the default SCALE configuration.
   * @return encoded bytes, or CodecError::ENCODE_FAILED
   */
  template <typename T>
  outcome::result<EncodedBuffer> encode(const T &value) {
    if constexpr (Borrowed<T>) {
      const typename BorrowTraits<std::remove_cvref_t<T>>::Owned owned(
          value.begin(), value.end());
      return encode(owned);
    } else {
      EncodedBuffer out;
      try {
        scale::backend::ToBytes encoder(out);
        scale::encode(value, encoder);
      } catch (const std::system_error &) {
        return CodecError::ENCODE_FAILED;
      }
      return out;
    }
  }

  /**
   * Decodes bytes produced by encode<T>(). The bytes must hold exactly one
   * value: anything left over is CodecError::TRAILING_BYTES.
   *
   * For borrowed T the result refers into bytes and is valid only as long as
   * bytes are.
   */
  template <typename T>
  outcome::result<T> decode(qtils::ByteView bytes) {
    if constexpr (Borrowed<T>) {
      return detail::decodeBorrowed<T>(bytes);
    } else {
      static_assert(std::is_default_constructible_v<T>,
                    "Decoded types must be default constructible");
      T value{};
      try {
        scale::backend::FromBytes decoder(bytes);
        scale::decode(value, decoder);
      } catch (const std::system_error &) {
        return CodecError::DECODE_FAILED;
      }
      // encoding is canonical, so a shorter re-encoding means unread bytes
      OUTCOME_TRY(canonical, encode(value));
      if (canonical.size() != bytes.size()) {
        return CodecError::TRAILING_BYTES;
      }
      return value;
    }
  }

}  // namespace strata::codec
