/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "runtime/memory.hpp"

#include "log/logger.hpp"

namespace chainext::runtime {

  /**
   * Guest linear memory kept in a host byte vector. Grows in whole pages up
   * to the optional page limit.
   */
  class LinearMemory final : public MemoryHandle {
   public:
    explicit LinearMemory(WasmSize initial_pages,
                          std::optional<WasmSize> pages_max = std::nullopt);

    WasmSize size() const override {
      return static_cast<WasmSize>(data_.size());
    }

    std::optional<WasmSize> pagesMax() const override {
      return pages_max_;
    }

    outcome::result<void> resize(WasmSize new_size) override;

    outcome::result<BytesOut> view(WasmPointer ptr,
                                   WasmSize size) const override;

   private:
    mutable common::Bytes data_;
    std::optional<WasmSize> pages_max_;
    log::Logger logger_;
  };

}  // namespace chainext::runtime
