/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "chain_extension/environment.hpp"

#include <array>

#include <gtest/gtest.h>

#include "chain_extension/dispatcher.hpp"
#include "runtime/common/memory_error.hpp"
#include "testutil/chain_extension/function_chain_extension.hpp"
#include "testutil/outcome.hpp"
#include "testutil/prepare_loggers.hpp"
#include "testutil/runtime/memory.hpp"

using chainext::common::Bytes;
using chainext::runtime::GasMeterError;
using chainext::runtime::InMemoryExt;
using chainext::runtime::kSentinel;
using chainext::runtime::MemoryError;
using chainext::runtime::TestRuntime;
using chainext::runtime::Weight;

using namespace chainext::chain_extension;

class EnvironmentTest : public testing::Test {
 public:
  static void SetUpTestCase() {
    testutil::prepareLoggers();
  }

  /// Dispatches a single call whose body is `body`
  outcome::result<uint32_t> callWith(FunctionChainExtension::Function body,
                                     CallWords words) {
    auto extension = std::make_shared<FunctionChainExtension>(std::move(body));
    ChainExtensionDispatcher dispatcher{extension};
    return dispatcher.callChainExtension(
        rt.runtime, 0, words.val0, words.val1, words.val2, words.val3);
  }

  Weight gasSpentByCall() const {
    return rt.gas_meter.gasSpent() - rt.schedule.host_fn_weights.call_chain_extension;
  }

  InMemoryExt ext{{.block_number = 7}};
  TestRuntime rt{ext};
};

/**
 * @given call words 1, 2, 3, 4
 * @when the environment is moved to OnlyIn
 * @then all four words are returned as is
 */
TEST_F(EnvironmentTest, OnlyInExposesAllWords) {
  std::array<uint32_t, 4> seen{};
  EXPECT_OUTCOME_TRUE(
      ret,
      callWith(
          [&](uint32_t, Environment<state::Init> env) -> outcome::result<RetVal> {
            auto in = std::move(env).onlyIn();
            seen = {in.val0(), in.val1(), in.val2(), in.val3()};
            return Converging{in.val0() + in.val3()};
          },
          {1, 2, 3, 4}));
  EXPECT_EQ(ret, 5);
  EXPECT_EQ(seen, (std::array<uint32_t, 4>{1, 2, 3, 4}));
}

/**
 * @given input bytes stored in the guest memory
 * @when the environment is moved to BufInBufOut and read
 * @then the input range is returned and no gas is charged for it
 */
TEST_F(EnvironmentTest, ReadReturnsInputBuffer) {
  const Bytes input{0xde, 0xad, 0xbe, 0xef, 0x01};
  rt.mem.store(0x100, input);

  Bytes read;
  uint32_t in_len = 0;
  EXPECT_OUTCOME_TRUE_1(callWith(
      [&](uint32_t, Environment<state::Init> env) -> outcome::result<RetVal> {
        auto io = std::move(env).bufInBufOut();
        in_len = io.inLen();
        OUTCOME_TRY(bytes, io.read());
        read = std::move(bytes);
        return Converging{0};
      },
      {0x100, static_cast<uint32_t>(input.size()), 0, 0}));
  EXPECT_EQ(read, input);
  EXPECT_EQ(in_len, input.size());
  EXPECT_EQ(gasSpentByCall(), 0);
}

/**
 * @given an input range reaching past the end of the guest memory
 * @when it is read
 * @then the call fails with ACCESS_OUT_OF_BOUNDS
 */
TEST_F(EnvironmentTest, ReadOutOfBounds) {
  auto size = rt.mem.memory.size();
  EXPECT_EC(callWith(
                [](uint32_t, Environment<state::Init> env)
                    -> outcome::result<RetVal> {
                  auto io = std::move(env).bufInBufOut();
                  OUTCOME_TRY(io.read());
                  return Converging{0};
                },
                {size - 2, 4, 0, 0}),
            MemoryError::ACCESS_OUT_OF_BOUNDS);
}

/**
 * @given an output buffer of 16 bytes
 * @when 4 bytes are written with a per-byte weight
 * @then data and length are stored and 4 times the weight is charged
 */
TEST_F(EnvironmentTest, WriteChargesPerByte) {
  rt.mem.store32u(0x2004, 16);
  const Bytes output{1, 2, 3, 4};

  EXPECT_OUTCOME_TRUE_1(callWith(
      [&](uint32_t, Environment<state::Init> env) -> outcome::result<RetVal> {
        auto out = std::move(env).primInBufOut();
        OUTCOME_TRY(out.write(output, false, 10));
        return Converging{0};
      },
      {0, 0, 0x2000, 0x2004}));
  EXPECT_EQ(rt.mem.load(0x2000, 4), output);
  EXPECT_EQ(rt.mem.load32u(0x2004), 4);
  EXPECT_EQ(gasSpentByCall(), 40);
}

/**
 * @given the sentinel as output pointer
 * @when an output is written with allow_skip
 * @then nothing is written or charged
 */
TEST_F(EnvironmentTest, WriteSkipsSentinel) {
  rt.mem.store32u(0x2004, 16);

  EXPECT_OUTCOME_TRUE_1(callWith(
      [&](uint32_t, Environment<state::Init> env) -> outcome::result<RetVal> {
        auto out = std::move(env).primInBufOut();
        OUTCOME_TRY(out.write(Bytes{1, 2, 3, 4}, true, 10));
        return Converging{0};
      },
      {0, 0, kSentinel, 0x2004}));
  EXPECT_EQ(rt.mem.load32u(0x2004), 16);
  EXPECT_EQ(gasSpentByCall(), 0);
}

/**
 * @given the sentinel as output pointer
 * @when an output is written without allow_skip
 * @then the write fails since the sentinel is not a valid buffer
 */
TEST_F(EnvironmentTest, SentinelWithoutSkipFails) {
  rt.mem.store32u(0x2004, 16);

  EXPECT_EC(callWith(
                [&](uint32_t, Environment<state::Init> env)
                    -> outcome::result<RetVal> {
                  auto out = std::move(env).primInBufOut();
                  OUTCOME_TRY(out.write(Bytes{1, 2, 3, 4}, false, 10));
                  return Converging{0};
                },
                {0, 0, kSentinel, 0x2004}),
            MemoryError::ACCESS_OUT_OF_BOUNDS);
}

/**
 * @given a gas meter which can't afford the weight of the output
 * @when the output is written
 * @then the call fails with OUT_OF_GAS and the output buffer is untouched
 */
TEST_F(EnvironmentTest, WriteOutOfGasLeavesBufferIntact) {
  InMemoryExt ext{{}};
  TestRuntime poor{ext, 500'000 + 39};
  poor.mem.store32u(0x2004, 16);

  auto extension = std::make_shared<FunctionChainExtension>(
      [](uint32_t, Environment<state::Init> env) -> outcome::result<RetVal> {
        auto out = std::move(env).primInBufOut();
        OUTCOME_TRY(out.write(Bytes{1, 2, 3, 4}, false, 10));
        return Converging{0};
      });
  ChainExtensionDispatcher dispatcher{extension};
  EXPECT_EC(dispatcher.callChainExtension(poor.runtime, 0, 0, 0, 0x2000, 0x2004),
            GasMeterError::OUT_OF_GAS);
  EXPECT_EQ(poor.mem.load(0x2000, 4), Bytes(4, 0));
  EXPECT_EQ(poor.mem.load32u(0x2004), 16);
  EXPECT_EQ(poor.gas_meter.gasLeft(), 0);
}

/**
 * @given an environment
 * @when weight is charged explicitly
 * @then the gas meter is charged by exactly that amount and the execution
 * context stays reachable
 */
TEST_F(EnvironmentTest, ChargeWeight) {
  EXPECT_OUTCOME_TRUE(ret, callWith(
      [](uint32_t, Environment<state::Init> env) -> outcome::result<RetVal> {
        OUTCOME_TRY(env.chargeWeight(1234));
        auto in = std::move(env).onlyIn();
        OUTCOME_TRY(in.chargeWeight(1));
        return Converging{in.ext().blockNumber() == 7 ? 0u : 1u};
      },
      {}));
  EXPECT_EQ(ret, 0);
  EXPECT_EQ(gasSpentByCall(), 1235);
}
