/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "outcome/outcome.hpp"

namespace chainext::runtime {
  enum class MemoryError {
    ACCESS_OUT_OF_BOUNDS = 1,
    OUTPUT_BUFFER_TOO_SMALL,
    DECODING_FAILED,
    PAGES_LIMIT_EXCEEDED,
  };
}  // namespace chainext::runtime

OUTCOME_HPP_DECLARE_ERROR(chainext::runtime, MemoryError);
