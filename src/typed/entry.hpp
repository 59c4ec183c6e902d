/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

namespace strata::typed {

  /**
   * Compile-time schema of a collection: a type naming its Key and Value.
   * @code
   *   struct PeopleByName {
   *     using Key = std::string;
   *     using Value = Person;
   *   };
   * @endcode
   * Either member may be a borrowed type (std::string_view, qtils::ByteView).
   */
  template <typename E>
  concept Entry = requires {
    typename E::Key;
    typename E::Value;
  };

}  // namespace strata::typed
