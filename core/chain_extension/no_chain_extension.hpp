/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "chain_extension/chain_extension.hpp"

namespace chainext::chain_extension {

  /**
   * Used when the chain exposes no extension. Reports itself as disabled and
   * fails every call.
   */
  class NoChainExtension final : public ChainExtension {
   public:
    outcome::result<RetVal> call(uint32_t func_id,
                                 Environment<state::Init> env) override;

    bool enabled() const override {
      return false;
    }
  };

}  // namespace chainext::chain_extension
