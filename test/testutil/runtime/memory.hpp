/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>

#include <gtest/gtest.h>

#include "runtime/impl/in_memory_ext.hpp"
#include "runtime/impl/linear_memory.hpp"
#include "runtime/runtime.hpp"

namespace chainext::runtime {

  /**
   * A single page of guest memory with helpers to lay out call arguments
   */
  struct TestMemory {
    TestMemory()
        : handle{std::make_shared<LinearMemory>(1, 1)}, memory{handle} {}

    std::shared_ptr<LinearMemory> handle;
    Memory memory;

    void store(WasmPointer ptr, common::BytesIn data) {
      ASSERT_TRUE(memory.store(ptr, data));
    }

    void store32u(WasmPointer ptr, uint32_t value) {
      ASSERT_TRUE(memory.store32u(ptr, value));
    }

    common::Bytes load(WasmPointer ptr, WasmSize size) const {
      return memory.load(ptr, size).value();
    }

    uint32_t load32u(WasmPointer ptr) const {
      return memory.load32u(ptr).value();
    }
  };

  /**
   * Everything a host function needs to serve a single guest invocation
   */
  struct TestRuntime {
    explicit TestRuntime(Ext &ext,
                         Weight gas_limit = 1'000'000'000,
                         Schedule schedule = {})
        : schedule{schedule},
          gas_meter{gas_limit},
          runtime{ext, mem.memory, gas_meter, this->schedule} {}

    TestMemory mem;
    Schedule schedule;
    GasMeter gas_meter;
    Runtime runtime;
  };

}  // namespace chainext::runtime
