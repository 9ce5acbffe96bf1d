/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "application/app_configuration.hpp"

#include "log/logger.hpp"

#ifdef DECLARE_PROPERTY
#error DECLARE_PROPERTY already defined!
#endif  // DECLARE_PROPERTY
#define DECLARE_PROPERTY(T, N)                                                 \
 private:                                                                      \
  T N##_;                                                                      \
                                                                               \
 public:                                                                       \
  std::conditional<std::is_trivial<T>::value && (sizeof(T) <= sizeof(size_t)), \
                   T,                                                          \
                   const T &>::type                                            \
  N() const override {                                                         \
    return N##_;                                                               \
  }

namespace chainext::application {

  /**
   * Reads app configuration from command line arguments, falling back to
   * default values
   */
  class AppConfigurationImpl final : public AppConfiguration {
   public:
    explicit AppConfigurationImpl(log::Logger logger);
    ~AppConfigurationImpl() override = default;

    AppConfigurationImpl(const AppConfigurationImpl &) = delete;
    AppConfigurationImpl &operator=(const AppConfigurationImpl &) = delete;

    /**
     * @return false if arguments are invalid or only help was requested
     */
    [[nodiscard]] bool initializeFromArgs(int argc, const char **argv);

    DECLARE_PROPERTY(uint32_t, funcId);
    DECLARE_PROPERTY(common::Bytes, input);
    DECLARE_PROPERTY(uint32_t, outputCapacity);
    DECLARE_PROPERTY(bool, skipOutput);
    DECLARE_PROPERTY(runtime::Weight, gasLimit);
    DECLARE_PROPERTY(uint32_t, memoryPages);
    DECLARE_PROPERTY(std::optional<uint32_t>, maxMemoryPages);
    DECLARE_PROPERTY(bool, chainExtensionEnabled);
    DECLARE_PROPERTY(runtime::Schedule, schedule);
    DECLARE_PROPERTY(runtime::AccountId, caller);
    DECLARE_PROPERTY(runtime::BlockNumber, blockNumber);
    DECLARE_PROPERTY(std::vector<std::string>, log);

   private:
    log::Logger logger_;
  };

}  // namespace chainext::application

#undef DECLARE_PROPERTY
