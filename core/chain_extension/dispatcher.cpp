/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "chain_extension/dispatcher.hpp"

#include "chain_extension/chain_extension_error.hpp"
#include "common/visitor.hpp"

namespace chainext::chain_extension {

  ChainExtensionDispatcher::ChainExtensionDispatcher(
      std::shared_ptr<ChainExtension> extension)
      : extension_{std::move(extension)},
        logger_{log::createLogger("ChainExtension", "chain_extension")} {
    BOOST_ASSERT(extension_);
  }

  outcome::result<uint32_t> ChainExtensionDispatcher::callChainExtension(
      runtime::Runtime &runtime,
      uint32_t func_id,
      uint32_t input_ptr,
      uint32_t input_len,
      uint32_t output_ptr,
      uint32_t output_len_ptr) const {
    auto res = dispatch(
        runtime, func_id, {input_ptr, input_len, output_ptr, output_len_ptr});
    if (res.has_error()
        and res.error() != runtime::RuntimeError::EXECUTION_HALTED) {
      SL_DEBUG(logger_,
               "Chain extension function {} failed: {}",
               func_id,
               res.error().message());
      runtime.setTrapReason(runtime::trap::SupervisorError{res.error()});
    }
    return res;
  }

  outcome::result<uint32_t> ChainExtensionDispatcher::dispatch(
      runtime::Runtime &runtime, uint32_t func_id, CallWords words) const {
    if (not extension_->enabled()) {
      return ChainExtensionError::NO_CHAIN_EXTENSION;
    }
    OUTCOME_TRY(
        runtime.chargeGas(runtime::RuntimeToken::callChainExtension()));

    SL_TRACE(logger_,
             "Call function {} with ({}, {}, {}, {})",
             func_id,
             words.val0,
             words.val1,
             words.val2,
             words.val3);

    OUTCOME_TRY(ret_val,
                extension_->call(func_id,
                                 Environment<state::Init>{runtime, words}));

    return visit_in_place(
        std::move(ret_val),
        [&](Converging &&ret) -> outcome::result<uint32_t> {
          return ret.value;
        },
        [&](Diverging &&ret) -> outcome::result<uint32_t> {
          SL_DEBUG(logger_,
                   "Function {} halts execution with flags {:#x} and {} bytes",
                   func_id,
                   static_cast<uint32_t>(ret.flags),
                   ret.data.size());
          runtime.setTrapReason(
              runtime::trap::Return{ret.flags, std::move(ret.data)});
          return runtime::RuntimeError::EXECUTION_HALTED;
        });
  }

}  // namespace chainext::chain_extension
