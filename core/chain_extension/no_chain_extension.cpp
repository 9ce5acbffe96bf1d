/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "chain_extension/no_chain_extension.hpp"

#include "chain_extension/chain_extension_error.hpp"

namespace chainext::chain_extension {

  outcome::result<RetVal> NoChainExtension::call(
      uint32_t, Environment<state::Init> env) {
    // keeps the cost of a call close to the one of an enabled extension
    [[maybe_unused]] const auto &caller = env.ext().caller();
    return ChainExtensionError::NO_CHAIN_EXTENSION;
  }

}  // namespace chainext::chain_extension
