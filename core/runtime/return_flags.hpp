/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>

#include "common/bytes.hpp"

namespace chainext::runtime {

  /**
   * Flags a guest invocation finishes with. Bits other than REVERT are
   * reserved and carried as is.
   */
  enum class ReturnFlags : uint32_t {
    EMPTY = 0,
    /// State changes of the invocation must be rolled back
    REVERT = 0x0000'0001,
  };

  constexpr ReturnFlags operator&(ReturnFlags lhs, ReturnFlags rhs) {
    return static_cast<ReturnFlags>(static_cast<uint32_t>(lhs)
                                    & static_cast<uint32_t>(rhs));
  }

  constexpr bool hasFlag(ReturnFlags flags, ReturnFlags flag) {
    return (flags & flag) == flag;
  }

  /// Outcome of a guest invocation as seen by its caller
  struct ExecReturnValue {
    ReturnFlags flags = ReturnFlags::EMPTY;
    common::Bytes data;

    bool isSuccess() const {
      return not hasFlag(flags, ReturnFlags::REVERT);
    }

    bool operator==(const ExecReturnValue &) const = default;
  };

}  // namespace chainext::runtime
