/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "runtime/runtime.hpp"

#include <limits>
#include <utility>

#include "common/visitor.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(chainext::runtime, RuntimeError, e) {
  using E = chainext::runtime::RuntimeError;
  switch (e) {
    case E::CONTRACT_TRAPPED:
      return "Contract trapped during execution";
    case E::EXECUTION_HALTED:
      return "Guest execution halted by a host function";
  }
  return "Unknown RuntimeError";
}

namespace chainext::runtime {

  Runtime::Runtime(Ext &ext,
                   Memory &memory,
                   GasMeter &gas_meter,
                   const Schedule &schedule)
      : ext_{ext},
        memory_{memory},
        gas_meter_{gas_meter},
        schedule_{schedule},
        logger_{log::createLogger("Runtime", "runtime")} {}

  outcome::result<void> Runtime::chargeGas(const RuntimeToken &token) {
    return gas_meter_.charge(token.weight(schedule_));
  }

  outcome::result<common::Bytes> Runtime::readSandboxMemory(
      WasmPointer ptr, WasmSize len) const {
    return memory_.load(ptr, len);
  }

  outcome::result<void> Runtime::writeSandboxOutput(
      WasmPointer out_ptr,
      WasmPointer out_len_ptr,
      common::BytesIn buf,
      bool allow_skip,
      const CostFn &create_token) {
    if (allow_skip and out_ptr == kSentinel) {
      SL_TRACE(logger_, "Output of {} bytes skipped by guest", buf.size());
      return outcome::success();
    }

    if (buf.size() > std::numeric_limits<WasmSize>::max()) {
      return MemoryError::OUTPUT_BUFFER_TOO_SMALL;
    }
    const auto buf_len = static_cast<WasmSize>(buf.size());

    OUTCOME_TRY(capacity, memory_.load32u(out_len_ptr));
    if (capacity < buf_len) {
      SL_DEBUG(logger_,
               "Output of {} bytes does not fit into guest buffer of {}",
               buf_len,
               capacity);
      return MemoryError::OUTPUT_BUFFER_TOO_SMALL;
    }

    if (create_token) {
      if (auto token = create_token(buf_len)) {
        OUTCOME_TRY(chargeGas(*token));
      }
    }

    // the length word was just read, so only the data range may be invalid
    OUTCOME_TRY(memory_.store(out_ptr, buf));
    OUTCOME_TRY(memory_.store32u(out_len_ptr, buf_len));
    return outcome::success();
  }

  void Runtime::setTrapReason(TrapReason reason) {
    if (trap_reason_) {
      SL_DEBUG(logger_, "Trap reason is already set, new one is dropped");
      return;
    }
    trap_reason_ = std::move(reason);
  }

  outcome::result<ExecReturnValue> Runtime::finish(
      outcome::result<void> sandbox_result) {
    auto reason = std::exchange(trap_reason_, std::nullopt);
    if (reason) {
      return visit_in_place(
          std::move(*reason),
          [](trap::Return &&ret) -> outcome::result<ExecReturnValue> {
            return ExecReturnValue{ret.flags, std::move(ret.data)};
          },
          [](trap::Termination &&) -> outcome::result<ExecReturnValue> {
            return ExecReturnValue{};
          },
          [](trap::SupervisorError &&err) -> outcome::result<ExecReturnValue> {
            return err.error;
          });
    }

    if (sandbox_result.has_value()) {
      return ExecReturnValue{};
    }
    SL_DEBUG(logger_,
             "Contract trapped without a reason: {}",
             sandbox_result.error().message());
    return RuntimeError::CONTRACT_TRAPPED;
  }

}  // namespace chainext::runtime
