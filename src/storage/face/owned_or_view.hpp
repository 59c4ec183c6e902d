/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

/**
 * @brief Traits selecting the argument and result types of storage faces.
 *
 * View<T> is the non-owning type a key is passed as; OwnedOrView<T> is the
 * type a value is passed or returned as, which may either own its bytes or
 * refer to bytes owned by someone else.
 */

#pragma once

namespace strata::storage::face {

  /**
   * @brief Trait to determine the non-owning view type of T.
   */
  template <typename T>
  struct ViewTrait;

  template <typename T>
  using View = typename ViewTrait<T>::type;

  /**
   * @brief Trait to determine the storage value type.
   *
   * Specialize this trait to define `type` as either an owned
   * container or a view for the template parameter T.
   */
  template <typename T>
  struct OwnedOrViewTrait;

  template <typename T>
  using OwnedOrView = typename OwnedOrViewTrait<T>::type;

}  // namespace strata::storage::face
