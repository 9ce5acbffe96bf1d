/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>
#include <optional>

#include "common/bytes.hpp"
#include "outcome/outcome.hpp"
#include "runtime/types.hpp"

namespace chainext::runtime {
  using common::BytesOut;

  // https://webassembly.github.io/spec/core/exec/runtime.html#memory-instances
  inline constexpr size_t kMemoryPageSize = 64 * 1024;

  inline uint64_t sizeToPages(uint64_t size) {
    return (size + kMemoryPageSize - 1) / kMemoryPageSize;
  }

  /**
   * An interface for a particular sandbox memory implementation
   */
  class MemoryHandle {
   public:
    virtual ~MemoryHandle() = default;

    virtual WasmSize size() const = 0;

    virtual std::optional<WasmSize> pagesMax() const = 0;

    virtual outcome::result<void> resize(WasmSize new_size) = 0;

    /**
     * Bounds-checked view of the guest memory
     * @return ACCESS_OUT_OF_BOUNDS unless the whole [ptr, ptr + size) range
     * is mapped
     */
    virtual outcome::result<BytesOut> view(WasmPointer ptr,
                                           WasmSize size) const = 0;
  };

  /**
   * A convenience wrapper around a memory handle.
   *
   * Guest memory can be accessed through unaligned pointers, so integers are
   * never loaded in place but decoded from copied bytes.
   */
  class Memory final {
   public:
    explicit Memory(std::shared_ptr<MemoryHandle> handle);

    WasmSize size() const {
      return handle_->size();
    }

    outcome::result<BytesOut> view(WasmPointer ptr, WasmSize size) const {
      return handle_->view(ptr, size);
    }

    /// Copies `size` bytes starting at `ptr`, never a partial range
    outcome::result<common::Bytes> load(WasmPointer ptr, WasmSize size) const;

    outcome::result<void> store(WasmPointer ptr, common::BytesIn data);

    /// Reads a SCALE (little endian) encoded u32
    outcome::result<uint32_t> load32u(WasmPointer ptr) const;

    outcome::result<void> store32u(WasmPointer ptr, uint32_t value);

    const std::shared_ptr<MemoryHandle> &handle() const {
      return handle_;
    }

   private:
    std::shared_ptr<MemoryHandle> handle_;
  };
}  // namespace chainext::runtime
