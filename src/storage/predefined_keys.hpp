/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>

#include <qtils/byte_vec.hpp>
#include <qtils/literals.hpp>

namespace strata::storage {

  using qtils::literals::operator""_vec;

  /// Key in the default space keeping the upper bound of reserved ids
  inline const qtils::ByteVec kIdReservationLookupKey =
      ":strata:id_reservation"_vec;

  /// Ids are persisted in blocks of this size
  inline constexpr uint64_t kIdReservationBlock = 1'000'000;

}  // namespace strata::storage
