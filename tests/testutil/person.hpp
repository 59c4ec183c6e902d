/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <tuple>

#include <qtils/byte_view.hpp>
#include <scale/scale.hpp>

namespace testutil {

  struct Person {
    std::string name;
    uint32_t age = 0;

    bool operator==(const Person &) const = default;
  };

  /// name -> person
  struct People {
    using Key = std::string;
    using Value = Person;
  };

  /// name -> balance
  struct Balances {
    using Key = std::string;
    using Value = uint64_t;
  };

  /// (surname, name) -> age; scanned by surname
  struct Families {
    using Key = std::tuple<std::string, std::string>;
    using Value = uint32_t;
  };

  /// values decoded without copying
  struct Notes {
    using Key = uint32_t;
    using Value = std::string_view;
  };

  struct Blobs {
    using Key = std::string_view;
    using Value = qtils::ByteView;
  };

  /// id -> tally; a negative tally is rejected by the encoder
  struct Tallies {
    using Key = uint32_t;
    using Value = scale::CompactInteger;
  };

}  // namespace testutil
