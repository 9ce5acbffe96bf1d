/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "runtime/memory.hpp"

#include <algorithm>
#include <limits>

#include <boost/assert.hpp>
#include <scale/scale.hpp>

#include "runtime/common/memory_error.hpp"

namespace chainext::runtime {

  Memory::Memory(std::shared_ptr<MemoryHandle> handle)
      : handle_{std::move(handle)} {
    BOOST_ASSERT(handle_);
  }

  outcome::result<common::Bytes> Memory::load(WasmPointer ptr,
                                              WasmSize size) const {
    OUTCOME_TRY(span, handle_->view(ptr, size));
    return common::Bytes(span.begin(), span.end());
  }

  outcome::result<void> Memory::store(WasmPointer ptr, common::BytesIn data) {
    if (data.size() > std::numeric_limits<WasmSize>::max()) {
      return MemoryError::ACCESS_OUT_OF_BOUNDS;
    }
    OUTCOME_TRY(span, handle_->view(ptr, static_cast<WasmSize>(data.size())));
    std::copy(data.begin(), data.end(), span.begin());
    return outcome::success();
  }

  outcome::result<uint32_t> Memory::load32u(WasmPointer ptr) const {
    OUTCOME_TRY(span, handle_->view(ptr, sizeof(uint32_t)));
    auto res = scale::decode<uint32_t>(common::BytesIn{span});
    if (res.has_error()) {
      return MemoryError::DECODING_FAILED;
    }
    return res.value();
  }

  outcome::result<void> Memory::store32u(WasmPointer ptr, uint32_t value) {
    OUTCOME_TRY(encoded, scale::encode(value));
    return store(ptr, encoded);
  }

}  // namespace chainext::runtime
