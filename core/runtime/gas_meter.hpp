/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <variant>

#include "log/logger.hpp"
#include "outcome/outcome.hpp"
#include "runtime/schedule.hpp"
#include "runtime/types.hpp"

namespace chainext::runtime {

  enum class GasMeterError : uint8_t {
    OUT_OF_GAS = 1,
  };

  /**
   * Something the host runtime charges gas for. The actual weight is
   * resolved against the schedule at charge time.
   */
  class RuntimeToken {
   public:
    /// Weight requested by a chain extension
    struct ChainExtension {
      Weight amount;
    };

    /// Base cost of entering the chain extension host function
    struct CallChainExtension {};

    static RuntimeToken chainExtension(Weight amount) {
      return RuntimeToken{ChainExtension{amount}};
    }

    static RuntimeToken callChainExtension() {
      return RuntimeToken{CallChainExtension{}};
    }

    Weight weight(const Schedule &schedule) const;

   private:
    using Kind = std::variant<ChainExtension, CallChainExtension>;

    explicit RuntimeToken(Kind kind) : kind_{kind} {}

    Kind kind_;
  };

  /**
   * Tracks gas left for a single guest invocation
   */
  class GasMeter final {
   public:
    explicit GasMeter(Weight limit);

    /**
     * Subtracts `amount` from the gas left
     * @return OUT_OF_GAS if not enough gas is left, in which case the meter
     * is drained
     */
    outcome::result<void> charge(Weight amount);

    /// Returns gas to the meter, never above the limit
    void refund(Weight amount);

    Weight limit() const {
      return limit_;
    }

    Weight gasLeft() const {
      return gas_left_;
    }

    Weight gasSpent() const {
      return limit_ - gas_left_;
    }

   private:
    Weight limit_;
    Weight gas_left_;
    log::Logger logger_;
  };

}  // namespace chainext::runtime

OUTCOME_HPP_DECLARE_ERROR(chainext::runtime, GasMeterError);
