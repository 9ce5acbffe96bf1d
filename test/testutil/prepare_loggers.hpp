/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <mutex>
#include <stdexcept>

#include "log/configurator.hpp"
#include "log/logger.hpp"

namespace testutil {

  inline std::once_flag initialized;

  // supposed to be called in SetUpTestCase
  inline void prepareLoggers(soralog::Level level = soralog::Level::INFO) {
    std::call_once(initialized, [] {
      auto testing_log_config = std::string(R"(
sinks:
  - name: console
    type: console
    capacity: 4
    latency: 0
groups:
  - name: main
    sink: console
    level: info
    is_fallback: true
    children:
      - name: chainext
        children:
          - name: application
          - name: runtime
            children:
              - name: gas_meter
              - name: memory
          - name: chain_extension
      - name: testing
        level: trace
)");

      auto logging_system = std::make_shared<soralog::LoggingSystem>(
          std::make_shared<chainext::log::Configurator>(testing_log_config));
      auto r = logging_system->configure();
      if (r.has_error) {
        throw std::runtime_error("Can't configure logger system: " + r.message);
      }

      // keeps the logging system alive, loggers only hold a weak reference
      static std::shared_ptr<soralog::LoggingSystem> holder = logging_system;
      chainext::log::setLoggingSystem(holder);
    });

    chainext::log::setLevelOfGroup(chainext::log::defaultGroupName, level);
  }
}  // namespace testutil
