/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "codec/codec.hpp"

#include <gtest/gtest.h>

#include <qtils/test/outcome.hpp>

#include "testutil/person.hpp"

using strata::codec::CodecError;
using strata::codec::decode;
using strata::codec::encode;
using strata::codec::isInline;
using strata::codec::kInlineCapacity;
using testutil::Person;

/**
 * @given a structured value
 * @when it is encoded and decoded back
 * @then the decoded value equals the original
 */
TEST(CodecTest, StructRoundTrip) {
  Person adam{.name = "Adam", .age = 42};

  ASSERT_OUTCOME_SUCCESS(bytes, encode(adam));
  ASSERT_OUTCOME_SUCCESS(decoded,
                         decode<Person>(strata::codec::asView(bytes)));
  EXPECT_EQ(decoded, adam);
}

/**
 * @given the same value encoded twice
 * @then both encodings are identical
 */
TEST(CodecTest, EncodingIsDeterministic) {
  Person jane{.name = "Jane", .age = 31};
  ASSERT_OUTCOME_SUCCESS(first, encode(jane));
  ASSERT_OUTCOME_SUCCESS(second, encode(jane));
  EXPECT_TRUE(std::ranges::equal(first, second));
}

/**
 * @given values whose encoding is below and above the inline capacity
 * @when they are encoded
 * @then the short one stays inline, the long one spills to the heap, and both
 * round-trip the same way
 */
TEST(CodecTest, BufferStrategyDoesNotChangeResult) {
  std::string short_text(kInlineCapacity / 2, 'x');
  std::string long_text(kInlineCapacity * 4, 'y');

  ASSERT_OUTCOME_SUCCESS(short_bytes, encode(short_text));
  ASSERT_OUTCOME_SUCCESS(long_bytes, encode(long_text));

  EXPECT_TRUE(isInline(short_bytes));
  EXPECT_FALSE(isInline(long_bytes));

  ASSERT_OUTCOME_SUCCESS(
      short_back, decode<std::string>(strata::codec::asView(short_bytes)));
  ASSERT_OUTCOME_SUCCESS(
      long_back, decode<std::string>(strata::codec::asView(long_bytes)));
  EXPECT_EQ(short_back, short_text);
  EXPECT_EQ(long_back, long_text);
}

/**
 * @given an encoded string
 * @when it is decoded as std::string_view
 * @then the view points into the encoded bytes and has the original content
 */
TEST(CodecTest, BorrowedDecodeDoesNotCopy) {
  ASSERT_OUTCOME_SUCCESS(bytes, encode(std::string("borrowed")));
  auto view = strata::codec::asView(bytes);

  ASSERT_OUTCOME_SUCCESS(text, decode<std::string_view>(view));
  EXPECT_EQ(text, "borrowed");
  EXPECT_GE(static_cast<const void *>(text.data()),
            static_cast<const void *>(view.data()));
  EXPECT_LT(static_cast<const void *>(text.data()),
            static_cast<const void *>(view.data() + view.size()));
}

/**
 * @given a string_view and a std::string with the same content
 * @then they encode to the same bytes
 */
TEST(CodecTest, BorrowedAndOwnedEncodeAlike) {
  std::string_view borrowed = "same";
  ASSERT_OUTCOME_SUCCESS(from_view, encode(borrowed));
  ASSERT_OUTCOME_SUCCESS(from_string, encode(std::string(borrowed)));
  EXPECT_TRUE(std::ranges::equal(from_view, from_string));
}

/**
 * @given a long byte string
 * @when it is decoded as qtils::ByteView
 * @then the multi-byte length prefix is understood
 */
TEST(CodecTest, BorrowedBytesWithLongPrefix) {
  qtils::ByteVec blob(300, 0xab);
  ASSERT_OUTCOME_SUCCESS(bytes, encode(blob));
  ASSERT_OUTCOME_SUCCESS(view,
                         decode<qtils::ByteView>(strata::codec::asView(bytes)));
  EXPECT_EQ(view.size(), blob.size());
  EXPECT_TRUE(std::ranges::equal(view, blob));
}

/**
 * @given bytes cut short in the middle of a value
 * @when decoded
 * @then DECODE_FAILED is reported instead of a crash
 */
TEST(CodecTest, TruncatedInputFails) {
  ASSERT_OUTCOME_SUCCESS(bytes, encode(std::string("truncated")));
  auto view = strata::codec::asView(bytes).first(bytes.size() - 3);

  EXPECT_OUTCOME_ERROR(decode<std::string_view>(view),
                       CodecError::DECODE_FAILED);
  EXPECT_OUTCOME_ERROR(decode<Person>(view), CodecError::DECODE_FAILED);
  EXPECT_OUTCOME_ERROR(decode<uint64_t>(qtils::ByteView{}),
                       CodecError::DECODE_FAILED);
}

/**
 * @given bytes of a Person
 * @when decoded as a string or a single byte
 * @then the extra bytes are reported by owned and borrowed decodes alike
 */
TEST(CodecTest, TrailingBytesAreReported) {
  ASSERT_OUTCOME_SUCCESS(bytes, encode(Person{.name = "Paul", .age = 7}));
  auto view = strata::codec::asView(bytes);
  EXPECT_OUTCOME_ERROR(decode<std::string_view>(view),
                       CodecError::TRAILING_BYTES);
  EXPECT_OUTCOME_ERROR(decode<std::string>(view), CodecError::TRAILING_BYTES);
  EXPECT_OUTCOME_ERROR(decode<uint8_t>(view), CodecError::TRAILING_BYTES);
}

/**
 * @given a string whose length 1 is written with a redundant two byte prefix
 * @when decoded as an owned and as a borrowed string
 * @then both reject it
 */
TEST(CodecTest, NonCanonicalLengthIsRejected) {
  const qtils::ByteVec bytes{0x05, 0x00, 'a'};
  EXPECT_OUTCOME_ERROR(decode<std::string>(bytes), CodecError::DECODE_FAILED);
  EXPECT_OUTCOME_ERROR(decode<std::string_view>(bytes),
                       CodecError::DECODE_FAILED);

  const qtils::ByteVec canonical{0x04, 'a'};
  ASSERT_OUTCOME_SUCCESS(owned, decode<std::string>(canonical));
  ASSERT_OUTCOME_SUCCESS(borrowed, decode<std::string_view>(canonical));
  EXPECT_EQ(owned, borrowed);
}
