/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string_view>

#include <qtils/error_throw.hpp>

#include "testutil/storage/base_rocksdb_test.hpp"
#include "typed/collection.hpp"

namespace test {

  /**
   * RocksDB fixture able to open typed collections on the test database.
   */
  struct BaseCollection_Test : public BaseRocksDB_Test {
    using BaseRocksDB_Test::BaseRocksDB_Test;

    template <strata::typed::Entry E>
    strata::typed::Collection<E> openCollection(std::string_view name) {
      auto res = strata::typed::Collection<E>::open(rocks_, name);
      if (res.has_error()) {
        ADD_FAILURE() << "Can't open collection " << name << ": "
                      << res.error().message();
        qtils::raise(res.error());
      }
      return std::move(res.value());
    }
  };

}  // namespace test
