/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "outcome/outcome.hpp"

namespace chainext::chain_extension {
  enum class ChainExtensionError : uint8_t {
    NO_CHAIN_EXTENSION = 1,
    UNKNOWN_FUNCTION,
    INVALID_INPUT,
  };
}  // namespace chainext::chain_extension

OUTCOME_HPP_DECLARE_ERROR(chainext::chain_extension, ChainExtensionError);
