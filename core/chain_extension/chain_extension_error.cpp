/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "chain_extension/chain_extension_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(chainext::chain_extension,
                            ChainExtensionError,
                            e) {
  using E = chainext::chain_extension::ChainExtensionError;
  switch (e) {
    case E::NO_CHAIN_EXTENSION:
      return "Chain extensions are disabled";
    case E::UNKNOWN_FUNCTION:
      return "Chain extension does not provide the requested function";
    case E::INVALID_INPUT:
      return "Chain extension input is malformed";
  }
  return "Unknown ChainExtensionError";
}
