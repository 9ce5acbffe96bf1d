/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <gtest/gtest.h>

#include "application/impl/app_configuration_impl.hpp"
#include "log/logger.hpp"
#include "testutil/prepare_loggers.hpp"

using chainext::application::AppConfiguration;
using chainext::application::AppConfigurationImpl;
using chainext::common::Bytes;
using chainext::runtime::HostFnWeights;

class AppConfigurationTest : public testing::Test {
 public:
  static void SetUpTestCase() {
    testutil::prepareLoggers();
  }

  void SetUp() override {
    app_config_ = std::make_shared<AppConfigurationImpl>(
        chainext::log::createLogger("AppConfigTest", "testing"));
  }

  std::shared_ptr<AppConfigurationImpl> app_config_;
};

/**
 * @given only the function to call
 * @when initializeFromArgs() is called
 * @then every other option takes its default value
 */
TEST_F(AppConfigurationTest, DefaultValuesTest) {
  char const *args[] = {"/path/", "--func-id", "7"};
  ASSERT_TRUE(app_config_->initializeFromArgs(std::size(args), args));

  ASSERT_EQ(app_config_->funcId(), 7);
  ASSERT_TRUE(app_config_->input().empty());
  ASSERT_EQ(app_config_->outputCapacity(), 1024);
  ASSERT_FALSE(app_config_->skipOutput());
  ASSERT_EQ(app_config_->gasLimit(), 10'000'000'000);
  ASSERT_EQ(app_config_->memoryPages(), 1);
  ASSERT_FALSE(app_config_->maxMemoryPages());
  ASSERT_TRUE(app_config_->chainExtensionEnabled());
  ASSERT_EQ(app_config_->schedule().host_fn_weights, HostFnWeights{});
  ASSERT_EQ(app_config_->caller(), chainext::runtime::AccountId{});
  ASSERT_EQ(app_config_->blockNumber(), 0);
  ASSERT_TRUE(app_config_->log().empty());
}

/**
 * @given no function to call
 * @when initializeFromArgs() is called
 * @then it fails
 */
TEST_F(AppConfigurationTest, FuncIdRequired) {
  char const *args[] = {"/path/", "--gas-limit", "100"};
  ASSERT_FALSE(app_config_->initializeFromArgs(std::size(args), args));
}

/**
 * @given every call and runtime option
 * @when initializeFromArgs() is called
 * @then the values are taken as passed
 */
TEST_F(AppConfigurationTest, CallOptionsTest) {
  char const *args[] = {
      "/path/",
      "--func-id",
      "3",
      "--input",
      "0x0102ff",
      "--output-capacity",
      "16",
      "--skip-output",
      "--caller",
      "0x0101010101010101010101010101010101010101010101010101010101010101",
      "--block-number",
      "42",
      "--gas-limit",
      "5000",
      "--memory-pages",
      "2",
      "--max-memory-pages",
      "4",
      "--disable-extension",
      "--call-weight",
      "10",
      "--per-byte-weight",
      "2",
      "-lruntime=debug",
  };
  ASSERT_TRUE(app_config_->initializeFromArgs(std::size(args), args));

  ASSERT_EQ(app_config_->funcId(), 3);
  ASSERT_EQ(app_config_->input(), (Bytes{0x01, 0x02, 0xff}));
  ASSERT_EQ(app_config_->outputCapacity(), 16);
  ASSERT_TRUE(app_config_->skipOutput());
  chainext::runtime::AccountId caller;
  caller.fill(0x01);
  ASSERT_EQ(app_config_->caller(), caller);
  ASSERT_EQ(app_config_->blockNumber(), 42);
  ASSERT_EQ(app_config_->gasLimit(), 5000);
  ASSERT_EQ(app_config_->memoryPages(), 2);
  ASSERT_EQ(app_config_->maxMemoryPages(), 4);
  ASSERT_FALSE(app_config_->chainExtensionEnabled());
  ASSERT_EQ(app_config_->schedule().host_fn_weights,
            (HostFnWeights{.call_chain_extension = 10,
                           .chain_extension_per_byte = 2}));
  ASSERT_EQ(app_config_->log(), std::vector<std::string>{"runtime=debug"});
}

/**
 * @given malformed hex arguments
 * @when initializeFromArgs() is called
 * @then it fails
 */
TEST_F(AppConfigurationTest, InvalidHexTest) {
  {
    char const *args[] = {"/path/", "--func-id", "1", "--input", "0102"};
    ASSERT_FALSE(app_config_->initializeFromArgs(std::size(args), args));
  }
  {
    char const *args[] = {"/path/", "--func-id", "1", "--caller", "0x0102"};
    ASSERT_FALSE(app_config_->initializeFromArgs(std::size(args), args));
  }
}

/**
 * @given a memory limit below the initial memory size
 * @when initializeFromArgs() is called
 * @then it fails
 */
TEST_F(AppConfigurationTest, MemoryLimitBelowInitialSize) {
  char const *args[] = {"/path/",
                        "--func-id",
                        "1",
                        "--memory-pages",
                        "3",
                        "--max-memory-pages",
                        "2"};
  ASSERT_FALSE(app_config_->initializeFromArgs(std::size(args), args));
}
