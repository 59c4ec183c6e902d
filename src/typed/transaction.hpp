/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

/**
 * @brief Atomic transactions over any number of typed collections.
 *
 * @code
 *   auto res = join(people, counters, log).transaction(
 *       [&](auto &people, auto &counters, auto &log)
 *           -> outcome::result<void> {
 *         OUTCOME_TRY(people.insert("Adam", adam));
 *         ...
 *         return outcome::success();
 *       });
 * @endcode
 *
 * The callback may run several times: an attempt that loses a race with a
 * concurrent writer is discarded and the callback is invoked again with fresh
 * views. Any error returned by the callback discards the attempt and is
 * returned as is.
 */

#pragma once

#include <array>
#include <memory>
#include <optional>
#include <span>
#include <tuple>
#include <type_traits>
#include <utility>
#include <variant>

#include <qtils/outcome.hpp>

#include "storage/spaced_storage.hpp"
#include "storage/storage_error.hpp"
#include "typed/entry.hpp"
#include "typed/transactional_view.hpp"

namespace strata::typed {

  template <Entry E>
  class Collection;

  namespace detail {
    template <typename T>
    struct IsResult : std::false_type {};

    template <typename T>
    struct IsResult<outcome::result<T>> : std::true_type {};
  }  // namespace detail

  /**
   * Ordered set of collections taking part in one transaction.
   */
  template <Entry... Es>
  class Joined {
    static_assert(sizeof...(Es) > 0, "Nothing to join");

   public:
    explicit Joined(const Collection<Es> &...collections)
        : engine_(std::get<0>(std::tie(collections...)).engine_),
          spaces_{collections.space_...},
          same_engine_(((collections.engine_ == engine_) and ...)) {}

    /**
     * Runs f atomically over the joined collections.
     * @param f callable taking TransactionalView<Es>&... in join order and
     * returning outcome::result<R>
     * @return what the last attempt of f returned, or the engine error
     */
    template <typename F>
    auto transaction(F &&f) const {
      static_assert(std::is_invocable_v<F &, TransactionalView<Es> &...>,
                    "Callback must accept one TransactionalView per joined "
                    "collection, in the order they were joined");
      using Result = std::invoke_result_t<F &, TransactionalView<Es> &...>;
      static_assert(detail::IsResult<Result>::value,
                    "Callback must return outcome::result<R>");
      using R = typename Result::value_type;

      if (not same_engine_) {
        return Result{outcome::failure(
            make_error_code(storage::StorageError::FOREIGN_SPACE))};
      }

      std::conditional_t<std::is_void_v<R>, std::monostate, std::optional<R>>
          output;

      auto body = [&](std::span<storage::BufferTransactionalMap *const> maps)
          -> outcome::result<void> {
        auto views = makeViews(maps, std::index_sequence_for<Es...>{});
        Result res = std::apply(f, views);
        if (res.has_error()) {
          return res.error();
        }
        if constexpr (not std::is_void_v<R>) {
          output.emplace(std::move(res.value()));
        }
        return outcome::success();
      };

      auto res = engine_->transaction(spaces_, body);
      if (res.has_error()) {
        return Result{outcome::failure(res.error())};
      }
      if constexpr (std::is_void_v<R>) {
        return Result{outcome::success()};
      } else {
        return Result{std::move(output.value())};
      }
    }

   private:
    template <size_t... Is>
    static std::tuple<TransactionalView<Es>...> makeViews(
        std::span<storage::BufferTransactionalMap *const> maps,
        std::index_sequence<Is...>) {
      return {TransactionalView<Es>{*maps[Is]}...};
    }

    std::shared_ptr<storage::SpacedStorage> engine_;
    std::array<std::shared_ptr<storage::BufferStorage>, sizeof...(Es)> spaces_;
    bool same_engine_;
  };

  /**
   * Joins collections for a transaction. The collections may have different
   * entry types but must be opened from the same engine.
   */
  template <Entry... Es>
  Joined<Es...> join(const Collection<Es> &...collections) {
    return Joined<Es...>(collections...);
  }

}  // namespace strata::typed
