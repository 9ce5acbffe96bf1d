/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "runtime/common/memory_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(chainext::runtime, MemoryError, e) {
  using E = chainext::runtime::MemoryError;
  switch (e) {
    case E::ACCESS_OUT_OF_BOUNDS:
      return "MemoryError: Memory access out of bounds";
    case E::OUTPUT_BUFFER_TOO_SMALL:
      return "MemoryError: Output does not fit into the buffer declared by "
             "the guest";
    case E::DECODING_FAILED:
      return "MemoryError: Can't decode value read from sandbox memory";
    case E::PAGES_LIMIT_EXCEEDED:
      return "MemoryError: Requested size exceeds the maximum number of pages";
  }
  return "MemoryError: Unknown error";
}
