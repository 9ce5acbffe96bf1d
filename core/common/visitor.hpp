/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <type_traits>
#include <utility>
#include <variant>

namespace chainext {

  /// Callable overloaded with the call operators of every lambda given
  template <typename... Lambdas>
  struct Overloaded : Lambdas... {
    using Lambdas::operator()...;
  };

  /**
   * @brief Inplace visitor for std::variant.
   * @code
   *   std::variant<int, std::string> value = "1234";
   *   ...
   *   visit_in_place(value,
   *                  [](int v) { std::cout << "(int)" << v; },
   *                  [](std::string v) { std::cout << "(string)" << v;}
   *                  );
   * @endcode
   */
  template <typename TVariant, typename... TVisitors>
  constexpr decltype(auto) visit_in_place(TVariant &&variant,
                                          TVisitors &&...visitors) {
    return std::visit(
        Overloaded<std::decay_t<TVisitors>...>{
            std::forward<TVisitors>(visitors)...},
        std::forward<TVariant>(variant));
  }

}  // namespace chainext
