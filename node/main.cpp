/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <filesystem>
#include <iostream>
#include <limits>

#include <soralog/impl/configurator_from_yaml.hpp>

#include "application/impl/app_configuration_impl.hpp"
#include "chain_extension/dispatcher.hpp"
#include "chain_extension/impl/storage_chain_extension.hpp"
#include "chain_extension/no_chain_extension.hpp"
#include "common/hexutil.hpp"
#include "log/configurator.hpp"
#include "log/logger.hpp"
#include "runtime/impl/in_memory_ext.hpp"
#include "runtime/impl/linear_memory.hpp"
#include "runtime/runtime.hpp"

using chainext::application::AppConfiguration;
using chainext::application::AppConfigurationImpl;

namespace {
  using namespace chainext;

  constexpr runtime::WasmPointer kInputPtr = 0;

  /// Guest memory layout: input, then output buffer, then output length
  struct Layout {
    runtime::WasmPointer input_ptr;
    runtime::WasmSize input_len;
    runtime::WasmPointer output_ptr;
    runtime::WasmPointer output_len_ptr;

    uint64_t end() const {
      return static_cast<uint64_t>(output_len_ptr) + sizeof(uint32_t);
    }
  };

  Layout makeLayout(const AppConfiguration &config) {
    auto align8 = [](uint64_t v) { return (v + 7) & ~uint64_t{7}; };
    auto input_len = static_cast<runtime::WasmSize>(config.input().size());
    auto output_ptr = align8(kInputPtr + input_len);
    auto output_len_ptr = align8(output_ptr + config.outputCapacity());
    return {kInputPtr,
            input_len,
            static_cast<runtime::WasmPointer>(output_ptr),
            static_cast<runtime::WasmPointer>(output_len_ptr)};
  }

  /// Simulates a guest which performs a single chain extension call
  outcome::result<runtime::ExecReturnValue> call(
      const AppConfiguration &config,
      runtime::Runtime &runtime,
      runtime::Memory &memory,
      const log::Logger &logger) {
    std::shared_ptr<chain_extension::ChainExtension> extension;
    if (config.chainExtensionEnabled()) {
      extension = std::make_shared<chain_extension::StorageChainExtension>(
          config.schedule());
    } else {
      extension = std::make_shared<chain_extension::NoChainExtension>();
    }
    chain_extension::ChainExtensionDispatcher dispatcher{extension};

    auto layout = makeLayout(config);
    if (layout.end() > std::numeric_limits<runtime::WasmSize>::max()) {
      return runtime::MemoryError::ACCESS_OUT_OF_BOUNDS;
    }
    if (layout.end() > memory.size()) {
      OUTCOME_TRY(memory.handle()->resize(layout.end()));
    }
    OUTCOME_TRY(memory.store(layout.input_ptr, config.input()));
    OUTCOME_TRY(
        memory.store32u(layout.output_len_ptr, config.outputCapacity()));

    auto output_ptr =
        config.skipOutput() ? runtime::kSentinel : layout.output_ptr;
    auto res = dispatcher.callChainExtension(runtime,
                                             config.funcId(),
                                             layout.input_ptr,
                                             layout.input_len,
                                             output_ptr,
                                             layout.output_len_ptr);
    if (res.has_error()) {
      return runtime.finish(res.error());
    }

    SL_INFO(logger, "Host call yields {}", res.value());
    if (not config.skipOutput()) {
      // holds the capacity unless the extension wrote an output
      OUTCOME_TRY(output_len, memory.load32u(layout.output_len_ptr));
      OUTCOME_TRY(output, memory.load(layout.output_ptr, output_len));
      SL_INFO(logger,
              "Output buffer ({} bytes): {}",
              output_len,
              common::hex_lower_0x(output));
    }
    return runtime.finish(outcome::success());
  }

  int run(const AppConfiguration &config) {
    auto logger = log::createLogger("Main", "application");

    runtime::InMemoryExt ext{{.caller = config.caller(),
                              .block_number = config.blockNumber()}};
    runtime::Memory memory{std::make_shared<runtime::LinearMemory>(
        config.memoryPages(), config.maxMemoryPages())};
    runtime::GasMeter gas_meter{config.gasLimit()};
    const auto &schedule = config.schedule();
    runtime::Runtime runtime{ext, memory, gas_meter, schedule};

    auto res = call(config, runtime, memory, logger);

    SL_INFO(logger,
            "Gas spent: {} of {}",
            gas_meter.gasSpent(),
            gas_meter.limit());
    if (res.has_error()) {
      SL_ERROR(logger, "Invocation failed: {}", res.error().message());
      return EXIT_FAILURE;
    }
    auto &ret = res.value();
    SL_INFO(logger,
            "Invocation finished with flags {:#x} and data {}",
            static_cast<uint32_t>(ret.flags),
            common::hex_lower_0x(ret.data));
    return ret.isSuccess() ? EXIT_SUCCESS : EXIT_FAILURE;
  }
}  // namespace

int main(int argc, const char **argv) {
  // Logging system
  auto logging_system = [&] {
    auto custom_log_config_path =
        chainext::log::Configurator::getLogConfigFile(argc, argv);
    if (custom_log_config_path.has_value()) {
      if (not std::filesystem::is_regular_file(
              custom_log_config_path.value())) {
        std::cerr << "Provided wrong path to config file of logging\n";
        exit(EXIT_FAILURE);
      }
    }

    auto configurator =
        custom_log_config_path.has_value()
            ? std::make_shared<chainext::log::Configurator>(
                  custom_log_config_path.value())
            : std::make_shared<chainext::log::Configurator>();

    return std::make_shared<soralog::LoggingSystem>(std::move(configurator));
  }();

  auto r = logging_system->configure();
  if (not r.message.empty()) {
    (r.has_error ? std::cerr : std::cout) << r.message << '\n';
  }
  if (r.has_error) {
    return EXIT_FAILURE;
  }

  chainext::log::setLoggingSystem(logging_system);

  AppConfigurationImpl configuration{
      chainext::log::createLogger("AppConfiguration", "application")};
  if (not configuration.initializeFromArgs(argc, argv)) {
    return EXIT_FAILURE;
  }

  chainext::log::tuneLoggingSystem(configuration.log());

  return run(configuration);
}
