/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "chain_extension/environment.hpp"
#include "chain_extension/ret_val.hpp"
#include "outcome/outcome.hpp"

namespace chainext::chain_extension {

  /**
   * Chain specific functionality exposed to contracts.
   *
   * Implementations pick the calling convention of a function by moving
   * the environment to one of its terminal states. Calls have to be
   * deterministic given the same execution context and input.
   */
  class ChainExtension {
   public:
    virtual ~ChainExtension() = default;

    /**
     * Executes function `func_id` requested by the guest
     * @return value for the guest, or an error which fails the whole
     * contract invocation
     */
    virtual outcome::result<RetVal> call(uint32_t func_id,
                                         Environment<state::Init> env) = 0;

    /**
     * If false, the guest host call fails with NO_CHAIN_EXTENSION before
     * `call` is reached
     */
    virtual bool enabled() const {
      return true;
    }
  };

}  // namespace chainext::chain_extension
