/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "runtime/impl/linear_memory.hpp"

#include <algorithm>
#include <limits>

#include <boost/assert.hpp>

#include "runtime/common/memory_error.hpp"
#include "runtime/memory_check.hpp"

namespace chainext::runtime {

  LinearMemory::LinearMemory(WasmSize initial_pages,
                             std::optional<WasmSize> pages_max)
      : pages_max_{pages_max},
        logger_{log::createLogger("LinearMemory", "memory")} {
    BOOST_ASSERT(not pages_max_ or initial_pages <= *pages_max_);
    // the last page is unreachable by a 32-bit pointer anyway
    data_.resize(std::min<uint64_t>(initial_pages * kMemoryPageSize,
                                    std::numeric_limits<WasmSize>::max()));
  }

  outcome::result<void> LinearMemory::resize(WasmSize new_size) {
    if (new_size <= size()) {
      return outcome::success();
    }
    auto new_page_num = sizeToPages(new_size);
    if (pages_max_ and new_page_num > *pages_max_) {
      SL_WARN(logger_,
              "Can't grow memory to {} pages, limit is {}",
              new_page_num,
              *pages_max_);
      return MemoryError::PAGES_LIMIT_EXCEEDED;
    }
    data_.resize(std::min<uint64_t>(new_page_num * kMemoryPageSize,
                                    std::numeric_limits<WasmSize>::max()));
    SL_DEBUG(logger_,
             "Grow memory to {} pages ({} bytes)",
             new_page_num,
             data_.size());
    return outcome::success();
  }

  outcome::result<BytesOut> LinearMemory::view(WasmPointer ptr,
                                               WasmSize size) const {
    if (not memoryCheck(ptr, size, data_.size())) {
      SL_TRACE(logger_,
               "Out of bounds access: ptr {}, size {}, memory size {}",
               ptr,
               size,
               data_.size());
      return MemoryError::ACCESS_OUT_OF_BOUNDS;
    }
    return BytesOut{data_.data() + ptr, size};
  }

}  // namespace chainext::runtime
