/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "runtime/gas_meter.hpp"

#include <algorithm>

#include "common/visitor.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(chainext::runtime, GasMeterError, e) {
  using E = chainext::runtime::GasMeterError;
  switch (e) {
    case E::OUT_OF_GAS:
      return "Out of gas";
  }
  return "Unknown GasMeterError";
}

namespace chainext::runtime {

  Weight RuntimeToken::weight(const Schedule &schedule) const {
    return visit_in_place(
        kind_,
        [](const ChainExtension &token) -> Weight { return token.amount; },
        [&](const CallChainExtension &) -> Weight {
          return schedule.host_fn_weights.call_chain_extension;
        });
  }

  GasMeter::GasMeter(Weight limit)
      : limit_{limit},
        gas_left_{limit},
        logger_{log::createLogger("GasMeter", "gas_meter")} {}

  outcome::result<void> GasMeter::charge(Weight amount) {
    if (amount > gas_left_) {
      SL_DEBUG(logger_,
               "Out of gas: requested {}, left {} of {}",
               amount,
               gas_left_,
               limit_);
      gas_left_ = 0;
      return GasMeterError::OUT_OF_GAS;
    }
    gas_left_ -= amount;
    SL_TRACE(logger_, "Charged {}, left {}", amount, gas_left_);
    return outcome::success();
  }

  void GasMeter::refund(Weight amount) {
    gas_left_ = std::min(saturatingAdd(gas_left_, amount), limit_);
  }

}  // namespace chainext::runtime
