/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "runtime/types.hpp"

namespace chainext::runtime {

  /// Base costs of host functions exposed to the guest
  struct HostFnWeights {
    /// Charged once per chain extension call, before dispatching
    Weight call_chain_extension = 500'000;

    /// Price of a byte moved in or out of the sandbox by a chain extension
    Weight chain_extension_per_byte = 1'000;

    bool operator==(const HostFnWeights &) const = default;
  };

  struct Schedule {
    HostFnWeights host_fn_weights;

    bool operator==(const Schedule &) const = default;
  };

}  // namespace chainext::runtime
