/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <array>
#include <cstdint>
#include <limits>

namespace chainext::runtime {

  using WasmPointer = uint32_t;

  /**
   * @brief Size type is uint32_t because we are working in 32 bit address
   * space
   */
  using WasmSize = uint32_t;

  /// Unit of gas charged for host work done on behalf of the guest
  using Weight = uint64_t;

  using AccountId = std::array<uint8_t, 32>;
  using StorageKey = std::array<uint8_t, 32>;
  using Balance = uint64_t;
  using BlockNumber = uint64_t;

  /**
   * Output pointer value by which the guest states it is not interested in
   * the output of a host call
   */
  inline constexpr WasmPointer kSentinel =
      std::numeric_limits<WasmPointer>::max();

  constexpr Weight saturatingMul(Weight lhs, Weight rhs) {
    if (rhs != 0 and lhs > std::numeric_limits<Weight>::max() / rhs) {
      return std::numeric_limits<Weight>::max();
    }
    return lhs * rhs;
  }

  constexpr Weight saturatingAdd(Weight lhs, Weight rhs) {
    if (lhs > std::numeric_limits<Weight>::max() - rhs) {
      return std::numeric_limits<Weight>::max();
    }
    return lhs + rhs;
  }

}  // namespace chainext::runtime
