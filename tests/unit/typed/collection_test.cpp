/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "strata.hpp"

#include <algorithm>
#include <tuple>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <qtils/test/outcome.hpp>

#include "testutil/person.hpp"
#include "testutil/typed/base_collection_test.hpp"

using strata::typed::Batch;
using strata::typed::Bound;
using strata::typed::Collection;
using testutil::Balances;
using testutil::Blobs;
using testutil::Families;
using testutil::Notes;
using testutil::People;
using testutil::Person;
using testutil::Tallies;
using namespace testing;

struct CollectionTest : public test::BaseCollection_Test {
  CollectionTest()
      : BaseCollection_Test("/tmp/strata-test-typed-collection") {}

  void SetUp() override {
    BaseCollection_Test::SetUp();
    people.emplace(openCollection<People>("people"));
  }

  void TearDown() override {
    people.reset();
    BaseCollection_Test::TearDown();
  }

  /// Keys of the whole collection in iteration order
  std::vector<std::string> names() {
    std::vector<std::string> result;
    auto it = people->iter();
    while (auto item = it.next()) {
      EXPECT_TRUE(item->has_value());
      auto key = item->value().key();
      EXPECT_TRUE(key.has_value());
      result.push_back(key.value());
    }
    return result;
  }

  const Person adam{.name = "Adam", .age = 42};
  const Person jane{.name = "Jane", .age = 31};
  const Person paul{.name = "Paul", .age = 27};

  std::optional<Collection<People>> people;
};

/**
 * @given an empty collection
 * @when a value is inserted and read back
 * @then get returns the inserted value and the first insert displaced nothing
 */
TEST_F(CollectionTest, InsertThenGet) {
  ASSERT_OUTCOME_SUCCESS(previous, people->insert("Adam", adam));
  EXPECT_FALSE(previous.has_value());

  ASSERT_OUTCOME_SUCCESS(found, people->get("Adam"));
  ASSERT_TRUE(found.has_value());
  ASSERT_OUTCOME_SUCCESS(person, found->value());
  EXPECT_EQ(person, adam);

  ASSERT_OUTCOME_SUCCESS(contains, people->contains("Adam"));
  EXPECT_TRUE(contains);
  ASSERT_OUTCOME_SUCCESS(missing, people->get("Eve"));
  EXPECT_FALSE(missing.has_value());
}

/**
 * @given a stored value
 * @when the key is inserted again
 * @then the displaced value is returned
 */
TEST_F(CollectionTest, InsertReturnsDisplacedValue) {
  ASSERT_OUTCOME_SUCCESS(people->insert("Adam", adam));
  auto older = adam;
  older.age += 1;

  ASSERT_OUTCOME_SUCCESS(previous, people->insert("Adam", older));
  ASSERT_TRUE(previous.has_value());
  ASSERT_OUTCOME_SUCCESS(was, previous->value());
  EXPECT_EQ(was, adam);
}

/**
 * @given keys inserted out of order
 * @when the collection is iterated
 * @then keys come out in ascending order
 */
TEST_F(CollectionTest, IterationIsOrdered) {
  ASSERT_OUTCOME_SUCCESS(people->insert("Paul", paul));
  ASSERT_OUTCOME_SUCCESS(people->insert("Adam", adam));
  ASSERT_OUTCOME_SUCCESS(people->insert("Jane", jane));

  EXPECT_THAT(names(), ElementsAre("Adam", "Jane", "Paul"));
}

/**
 * @given a stored key
 * @when it is removed twice
 * @then the first removal returns the value and the second returns nothing
 */
TEST_F(CollectionTest, RemoveIsIdempotent) {
  ASSERT_OUTCOME_SUCCESS(people->insert("Jane", jane));

  ASSERT_OUTCOME_SUCCESS(removed, people->remove("Jane"));
  ASSERT_TRUE(removed.has_value());
  ASSERT_OUTCOME_SUCCESS(person, removed->value());
  EXPECT_EQ(person, jane);

  ASSERT_OUTCOME_SUCCESS(again, people->remove("Jane"));
  EXPECT_FALSE(again.has_value());
}

/**
 * @given three people
 * @when popping the smallest and the greatest entries
 * @then Adam and Paul are removed and only Jane stays
 */
TEST_F(CollectionTest, PopMinMax) {
  ASSERT_OUTCOME_SUCCESS(people->insert("Paul", paul));
  ASSERT_OUTCOME_SUCCESS(people->insert("Adam", adam));
  ASSERT_OUTCOME_SUCCESS(people->insert("Jane", jane));

  ASSERT_OUTCOME_SUCCESS(min, people->popMin());
  ASSERT_TRUE(min.has_value());
  ASSERT_OUTCOME_SUCCESS(min_key, min->key());
  EXPECT_EQ(min_key, "Adam");
  ASSERT_OUTCOME_SUCCESS(min_value, min->value());
  EXPECT_EQ(min_value, adam);

  ASSERT_OUTCOME_SUCCESS(max, people->popMax());
  ASSERT_TRUE(max.has_value());
  ASSERT_OUTCOME_SUCCESS(max_key, max->key());
  EXPECT_EQ(max_key, "Paul");

  EXPECT_THAT(names(), ElementsAre("Jane"));

  ASSERT_OUTCOME_SUCCESS(people->clear());
  ASSERT_OUTCOME_SUCCESS(nothing, people->popMin());
  EXPECT_FALSE(nothing.has_value());
}

/**
 * @given the same key count in a fresh and a filled collection
 * @then size, isEmpty and clear agree with each other
 */
TEST_F(CollectionTest, SizeAndClear) {
  ASSERT_OUTCOME_SUCCESS(empty, people->isEmpty());
  EXPECT_TRUE(empty);

  ASSERT_OUTCOME_SUCCESS(people->insert("Adam", adam));
  ASSERT_OUTCOME_SUCCESS(people->insert("Jane", jane));

  ASSERT_OUTCOME_SUCCESS(size, people->size());
  EXPECT_EQ(size, 2);
  ASSERT_OUTCOME_SUCCESS(not_empty, people->isEmpty());
  EXPECT_FALSE(not_empty);

  ASSERT_OUTCOME_SUCCESS(people->clear());
  ASSERT_OUTCOME_SUCCESS(cleared, people->size());
  EXPECT_EQ(cleared, 0);
}

/**
 * @given numbered keys
 * @when ranges with different bounds are requested
 * @then each yields exactly the keys inside the bounds
 */
TEST_F(CollectionTest, BoundedRanges) {
  // single byte keys encode in numeric order
  struct Ordered {
    using Key = std::tuple<uint8_t>;
    using Value = uint32_t;
  };
  auto numbers = openCollection<Ordered>("numbers");
  for (uint8_t i = 1; i <= 5; ++i) {
    ASSERT_OUTCOME_SUCCESS(numbers.insert({i}, i * 10u));
  }

  auto keys_of = [](auto it) {
    std::vector<uint8_t> keys;
    while (auto item = it.next()) {
      EXPECT_TRUE(item->has_value());
      keys.push_back(std::get<0>(item->value().key().value()));
    }
    return keys;
  };

  using B = Bound<Ordered::Key>;
  ASSERT_OUTCOME_SUCCESS(half_open, numbers.range({2}, {4}));
  EXPECT_THAT(keys_of(std::move(half_open)), ElementsAre(2, 3));

  ASSERT_OUTCOME_SUCCESS(closed,
                         numbers.range(B::included({2}), B::included({4})));
  EXPECT_THAT(keys_of(std::move(closed)), ElementsAre(2, 3, 4));

  ASSERT_OUTCOME_SUCCESS(open_start,
                         numbers.range(B::unbounded(), B::excluded({3})));
  EXPECT_THAT(keys_of(std::move(open_start)), ElementsAre(1, 2));

  ASSERT_OUTCOME_SUCCESS(open_end,
                         numbers.range(B::excluded({3}), B::unbounded()));
  EXPECT_THAT(keys_of(std::move(open_end)), ElementsAre(4, 5));

  ASSERT_OUTCOME_SUCCESS(empty, numbers.range({4}, {2}));
  EXPECT_THAT(keys_of(std::move(empty)), IsEmpty());
}

/**
 * @given family members keyed by (surname, name)
 * @when scanning by a surname prefix
 * @then only members of that family are yielded
 */
TEST_F(CollectionTest, ScanPrefix) {
  auto families = openCollection<Families>("families");
  ASSERT_OUTCOME_SUCCESS(families.insert({"Smith", "Adam"}, 42));
  ASSERT_OUTCOME_SUCCESS(families.insert({"Smith", "Jane"}, 31));
  ASSERT_OUTCOME_SUCCESS(families.insert({"Smithers", "Paul"}, 27));
  ASSERT_OUTCOME_SUCCESS(families.insert({"Jones", "Eve"}, 50));

  ASSERT_OUTCOME_SUCCESS(smiths, families.scanPrefix(std::string("Smith")));
  std::vector<std::string> names;
  while (auto item = smiths.next()) {
    ASSERT_OUTCOME_SUCCESS(key, item->value().key());
    names.push_back(std::get<1>(key));
  }
  EXPECT_THAT(names, ElementsAre("Adam", "Jane"));
}

/**
 * @given a batch staging inserts and a removal
 * @when it is applied
 * @then all operations become visible together and the batch is emptied
 */
TEST_F(CollectionTest, ApplyBatch) {
  ASSERT_OUTCOME_SUCCESS(people->insert("Paul", paul));

  Batch<People> batch;
  ASSERT_OUTCOME_SUCCESS(batch.insert("Adam", adam));
  ASSERT_OUTCOME_SUCCESS(batch.insert("Jane", jane));
  ASSERT_OUTCOME_SUCCESS(batch.remove("Paul"));
  EXPECT_EQ(batch.size(), 3);

  // staging does not touch the collection
  EXPECT_THAT(names(), ElementsAre("Paul"));

  ASSERT_OUTCOME_SUCCESS(people->applyBatch(std::move(batch)));
  EXPECT_THAT(names(), ElementsAre("Adam", "Jane"));
}

/**
 * @given a collection with unflushed writes
 * @when two flushes are requested
 * @then both complete successfully
 */
TEST_F(CollectionTest, FlushAsync) {
  ASSERT_OUTCOME_SUCCESS(people->insert("Adam", adam));
  auto first = people->flushAsync();
  auto second = people->flushAsync();
  ASSERT_OUTCOME_SUCCESS(first.get());
  ASSERT_OUTCOME_SUCCESS(second.get());
}

/**
 * @given collections with borrowed key and value types
 * @when values are read back
 * @then the views decode without copying and match what was stored
 */
TEST_F(CollectionTest, BorrowedTypes) {
  auto notes = openCollection<Notes>("notes");
  ASSERT_OUTCOME_SUCCESS(notes.insert(1, "first note"));

  ASSERT_OUTCOME_SUCCESS(found, notes.get(1));
  ASSERT_TRUE(found.has_value());
  ASSERT_OUTCOME_SUCCESS(text, found->value());
  EXPECT_EQ(text, "first note");
  EXPECT_EQ(static_cast<const void *>(text.data()),
            static_cast<const void *>(found->bytes().data() + 1));

  auto blobs = openCollection<Blobs>("blobs");
  qtils::ByteVec payload{1, 2, 3};
  ASSERT_OUTCOME_SUCCESS(blobs.insert("payload", payload));
  ASSERT_OUTCOME_SUCCESS(blob, blobs.get("payload"));
  ASSERT_TRUE(blob.has_value());
  ASSERT_OUTCOME_SUCCESS(bytes, blob->value());
  EXPECT_TRUE(std::ranges::equal(bytes, payload));
}

/**
 * @given two collections opened under different names
 * @then they do not see each other's entries
 */
TEST_F(CollectionTest, CollectionsAreIndependent) {
  auto balances = openCollection<Balances>("balances");
  ASSERT_OUTCOME_SUCCESS(people->insert("Adam", adam));
  ASSERT_OUTCOME_SUCCESS(balances.insert("Jane", 100));

  ASSERT_OUTCOME_SUCCESS(no_adam, balances.contains("Adam"));
  EXPECT_FALSE(no_adam);
  EXPECT_THAT(names(), ElementsAre("Adam"));
  EXPECT_EQ(balances.name(), "balances");
}

/**
 * @given bytes stored by one entry type
 * @when read through an entry type they do not match
 * @then a decode error is returned instead of a value
 */
TEST_F(CollectionTest, CrossTypeReadFailsToDecode) {
  struct Tiny {
    using Key = std::string;
    using Value = uint8_t;
  };
  auto tiny = openCollection<Tiny>("people");
  ASSERT_OUTCOME_SUCCESS(tiny.insert("Eve", 0));

  ASSERT_OUTCOME_SUCCESS(found, people->get("Eve"));
  ASSERT_TRUE(found.has_value());
  EXPECT_OUTCOME_ERROR(found->value(), strata::codec::CodecError::DECODE_FAILED);
}

/**
 * @given a collection whose space has been dropped
 * @when it is iterated or checked for emptiness
 * @then SPACE_NOT_FOUND is returned instead of an exception
 */
TEST_F(CollectionTest, DroppedCollectionReportsError) {
  using strata::storage::StorageError;
  ASSERT_OUTCOME_SUCCESS(people->insert("Adam", adam));
  ASSERT_OUTCOME_SUCCESS(rocks_->dropSpace("people"));

  auto it = people->iter();
  std::optional<strata::typed::Iter<People>::Item> item;
  ASSERT_NO_THROW(item = it.next());
  ASSERT_TRUE(item.has_value());
  EXPECT_OUTCOME_ERROR(*item, StorageError::SPACE_NOT_FOUND);
  EXPECT_FALSE(it.next().has_value());

  auto back = people->iter();
  auto last = back.nextBack();
  ASSERT_TRUE(last.has_value());
  EXPECT_OUTCOME_ERROR(*last, StorageError::SPACE_NOT_FOUND);

  EXPECT_OUTCOME_ERROR(people->isEmpty(), StorageError::SPACE_NOT_FOUND);
}

/**
 * @given a value the encoder rejects
 * @when it is inserted directly or staged in a batch
 * @then ENCODE_FAILED is returned and nothing is stored
 */
TEST_F(CollectionTest, EncodeFailureIsReported) {
  using strata::codec::CodecError;
  auto tallies = openCollection<Tallies>("tallies");
  const scale::CompactInteger negative{-1};

  EXPECT_OUTCOME_ERROR(tallies.insert(1, negative), CodecError::ENCODE_FAILED);
  ASSERT_OUTCOME_SUCCESS(stored, tallies.contains(1));
  EXPECT_FALSE(stored);

  Batch<Tallies> batch;
  ASSERT_OUTCOME_SUCCESS(batch.insert(2, scale::CompactInteger{5}));
  EXPECT_OUTCOME_ERROR(batch.insert(3, negative), CodecError::ENCODE_FAILED);
  EXPECT_EQ(batch.size(), 1);

  ASSERT_OUTCOME_SUCCESS(tallies.applyBatch(std::move(batch)));
  ASSERT_OUTCOME_SUCCESS(size, tallies.size());
  EXPECT_EQ(size, 1);
}
