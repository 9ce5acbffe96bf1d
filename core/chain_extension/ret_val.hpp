/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>
#include <variant>

#include "common/bytes.hpp"
#include "runtime/return_flags.hpp"

namespace chainext::chain_extension {

  /// Guest execution resumes and the host call yields `value`
  struct Converging {
    uint32_t value;

    bool operator==(const Converging &) const = default;
  };

  /**
   * The whole guest invocation ends right away, as if the guest returned
   * `data` with `flags` itself
   */
  struct Diverging {
    runtime::ReturnFlags flags;
    common::Bytes data;

    bool operator==(const Diverging &) const = default;
  };

  /// What a chain extension call produces for the calling guest
  using RetVal = std::variant<Converging, Diverging>;

}  // namespace chainext::chain_extension
