/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>

#include "chain_extension/chain_extension.hpp"
#include "log/logger.hpp"

namespace chainext::chain_extension {

  /**
   * Host function behind the guest's chain extension call. Builds the
   * environment of the call and translates the result of the extension into
   * the guest control flow.
   */
  class ChainExtensionDispatcher final {
   public:
    explicit ChainExtensionDispatcher(
        std::shared_ptr<ChainExtension> extension);

    /**
     * @return value the host call yields to the guest. On failure the guest
     * has to be stopped; the reason is recorded in `runtime`, either the
     * error itself or the data of a diverging extension call
     * (EXECUTION_HALTED).
     */
    outcome::result<uint32_t> callChainExtension(runtime::Runtime &runtime,
                                                 uint32_t func_id,
                                                 uint32_t input_ptr,
                                                 uint32_t input_len,
                                                 uint32_t output_ptr,
                                                 uint32_t output_len_ptr) const;

   private:
    outcome::result<uint32_t> dispatch(runtime::Runtime &runtime,
                                       uint32_t func_id,
                                       CallWords words) const;

    std::shared_ptr<ChainExtension> extension_;
    log::Logger logger_;
  };

}  // namespace chainext::chain_extension
