/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <functional>
#include <optional>
#include <system_error>
#include <variant>

#include <scale/scale.hpp>

#include "log/logger.hpp"
#include "outcome/outcome.hpp"
#include "runtime/common/memory_error.hpp"
#include "runtime/ext.hpp"
#include "runtime/gas_meter.hpp"
#include "runtime/memory.hpp"
#include "runtime/return_flags.hpp"
#include "runtime/schedule.hpp"

namespace chainext::runtime {

  enum class RuntimeError : uint8_t {
    /// Guest trapped without a reason recorded by the host
    CONTRACT_TRAPPED = 1,
    /// A host function stopped the guest on purpose, see the trap reason
    EXECUTION_HALTED,
  };

  namespace trap {
    /// Guest returns to its caller with the given flags and data
    struct Return {
      ReturnFlags flags;
      common::Bytes data;
    };

    /// Contract terminated itself
    struct Termination {};

    /// A host function failed
    struct SupervisorError {
      std::error_code error;
    };
  }  // namespace trap

  using TrapReason =
      std::variant<trap::Return, trap::Termination, trap::SupervisorError>;

  /**
   * Host side state of a single guest invocation. Gives host functions
   * bounds-checked access to the sandbox memory, gas metering and the
   * execution context.
   */
  class Runtime final {
   public:
    /// Produces the token to charge for an output of the given length
    using CostFn = std::function<std::optional<RuntimeToken>(WasmSize)>;

    Runtime(Ext &ext,
            Memory &memory,
            GasMeter &gas_meter,
            const Schedule &schedule);

    Runtime(const Runtime &) = delete;
    Runtime &operator=(const Runtime &) = delete;

    Ext &ext() {
      return ext_;
    }

    const Schedule &schedule() const {
      return schedule_;
    }

    outcome::result<void> chargeGas(const RuntimeToken &token);

    /**
     * Reads `len` bytes at `ptr`
     * @return ACCESS_OUT_OF_BOUNDS if the range is not fully inside the
     * sandbox memory
     */
    outcome::result<common::Bytes> readSandboxMemory(WasmPointer ptr,
                                                     WasmSize len) const;

    /// Reads `len` bytes at `ptr` and SCALE decodes them as T
    template <typename T>
    outcome::result<T> readSandboxMemoryAs(WasmPointer ptr,
                                           WasmSize len) const {
      OUTCOME_TRY(bytes, readSandboxMemory(ptr, len));
      auto res = scale::decode<T>(bytes);
      if (res.has_error()) {
        SL_DEBUG(logger_,
                 "Can't decode value at {}: {}",
                 ptr,
                 res.error().message());
        return MemoryError::DECODING_FAILED;
      }
      return std::move(res.value());
    }

    /**
     * Writes `buf` to the guest output buffer at `out_ptr` and its length to
     * `out_len_ptr`. The u32 at `out_len_ptr` holds the buffer capacity
     * declared by the guest.
     *
     * If `allow_skip` is set and `out_ptr` is the sentinel, nothing is
     * written or charged. The token produced by `create_token` is charged
     * before anything is written.
     */
    outcome::result<void> writeSandboxOutput(WasmPointer out_ptr,
                                             WasmPointer out_len_ptr,
                                             common::BytesIn buf,
                                             bool allow_skip,
                                             const CostFn &create_token);

    /// Records why the guest has to stop. The first recorded reason wins.
    void setTrapReason(TrapReason reason);

    const std::optional<TrapReason> &trapReason() const {
      return trap_reason_;
    }

    /**
     * Converts the outcome of the sandboxed execution into the outcome of
     * the invocation, taking the recorded trap reason into account
     */
    outcome::result<ExecReturnValue> finish(
        outcome::result<void> sandbox_result);

   private:
    Ext &ext_;
    Memory &memory_;
    GasMeter &gas_meter_;
    const Schedule &schedule_;
    std::optional<TrapReason> trap_reason_;
    log::Logger logger_;
  };

}  // namespace chainext::runtime

OUTCOME_HPP_DECLARE_ERROR(chainext::runtime, RuntimeError);
