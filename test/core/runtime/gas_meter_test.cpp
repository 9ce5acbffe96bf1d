/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "runtime/gas_meter.hpp"

#include <limits>

#include <gtest/gtest.h>

#include "testutil/outcome.hpp"
#include "testutil/prepare_loggers.hpp"

using chainext::runtime::GasMeter;
using chainext::runtime::GasMeterError;
using chainext::runtime::RuntimeToken;
using chainext::runtime::Schedule;
using chainext::runtime::Weight;

class GasMeterTest : public testing::Test {
 public:
  static void SetUpTestCase() {
    testutil::prepareLoggers();
  }

 protected:
  GasMeter meter_{1000};
};

TEST_F(GasMeterTest, Charge) {
  EXPECT_OUTCOME_TRUE_1(meter_.charge(400));
  EXPECT_OUTCOME_TRUE_1(meter_.charge(600));
  EXPECT_EQ(meter_.gasLeft(), 0);
  EXPECT_EQ(meter_.gasSpent(), 1000);
  EXPECT_OUTCOME_TRUE_1(meter_.charge(0));
}

/**
 * @given a meter with 1000 gas left
 * @when more than that is charged
 * @then the charge fails with OUT_OF_GAS and the meter is drained
 */
TEST_F(GasMeterTest, OutOfGasDrains) {
  EXPECT_EC(meter_.charge(1001), GasMeterError::OUT_OF_GAS);
  EXPECT_EQ(meter_.gasLeft(), 0);
  EXPECT_EQ(meter_.gasSpent(), meter_.limit());
}

TEST_F(GasMeterTest, RefundCappedByLimit) {
  EXPECT_OUTCOME_TRUE_1(meter_.charge(300));
  meter_.refund(100);
  EXPECT_EQ(meter_.gasLeft(), 800);
  meter_.refund(std::numeric_limits<Weight>::max());
  EXPECT_EQ(meter_.gasLeft(), 1000);
}

/**
 * @given a schedule
 * @then the base call token weighs as the schedule says and a chain extension
 * token weighs as requested
 */
TEST(RuntimeTokenTest, Weight) {
  Schedule schedule{{.call_chain_extension = 11, .chain_extension_per_byte = 1}};
  EXPECT_EQ(RuntimeToken::callChainExtension().weight(schedule), 11);
  EXPECT_EQ(RuntimeToken::chainExtension(12345).weight(schedule), 12345);
  EXPECT_EQ(RuntimeToken::callChainExtension().weight(Schedule{}),
            Schedule{}.host_fn_weights.call_chain_extension);
}

TEST(SaturatingTest, Saturates) {
  constexpr auto kMax = std::numeric_limits<Weight>::max();
  static_assert(chainext::runtime::saturatingMul(kMax, 2) == kMax);
  static_assert(chainext::runtime::saturatingMul(3, 4) == 12);
  static_assert(chainext::runtime::saturatingMul(0, kMax) == 0);
  static_assert(chainext::runtime::saturatingAdd(kMax, 1) == kMax);
  static_assert(chainext::runtime::saturatingAdd(1, 2) == 3);
}
