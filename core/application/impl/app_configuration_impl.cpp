/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "application/impl/app_configuration_impl.hpp"

#include <algorithm>
#include <iostream>

#include <boost/program_options.hpp>

#include "common/hexutil.hpp"

namespace {
  template <typename T, typename Func>
  void find_argument(boost::program_options::variables_map &vm,
                     const char *name,
                     Func &&f) {
    if (auto it = vm.find(name); it != vm.end()) {
      if (it->second.defaulted()) {
        return;
      }
      std::forward<Func>(f)(it->second.as<T>());
    }
  }

  template <typename T>
  std::optional<T> find_argument(boost::program_options::variables_map &vm,
                                 const std::string &name) {
    if (auto it = vm.find(name); it != vm.end()) {
      if (!it->second.defaulted()) {
        return it->second.as<T>();
      }
    }
    return std::nullopt;
  }

  const uint32_t def_output_capacity = 1024;
  const chainext::runtime::Weight def_gas_limit = 10'000'000'000;
  const uint32_t def_memory_pages = 1;
  const chainext::runtime::HostFnWeights def_host_fn_weights{};
}  // namespace

namespace chainext::application {

  AppConfigurationImpl::AppConfigurationImpl(log::Logger logger)
      : funcId_{0},
        outputCapacity_{def_output_capacity},
        skipOutput_{false},
        gasLimit_{def_gas_limit},
        memoryPages_{def_memory_pages},
        chainExtensionEnabled_{true},
        caller_{},
        blockNumber_{0},
        logger_{std::move(logger)} {}

  bool AppConfigurationImpl::initializeFromArgs(int argc, const char **argv) {
    namespace po = boost::program_options;

    // clang-format off
    po::options_description desc("General options");
    desc.add_options()
        ("help,h", "show this help message")
        ("log,l", po::value<std::vector<std::string>>(),
          "Sets a custom logging filter. Syntax is `<target>=<level>`, e.g. -lruntime=debug.\n"
          "Log levels (most to least verbose) are trace, debug, verbose, info, warn, error, critical, off. By default, all targets log `info`.\n"
          "The global log level can be set with -l<level>.")
        ("logcfg", po::value<std::string>(), "Filepath to load logging configuration from.")
        ;

    po::options_description call_desc("Call options");
    call_desc.add_options()
        ("func-id", po::value<uint32_t>(), "required, chain extension function to call")
        ("input", po::value<std::string>(), "0x-prefixed hex of the input buffer")
        ("output-capacity", po::value<uint32_t>()->default_value(def_output_capacity),
          "size of the output buffer declared by the guest")
        ("skip-output", po::bool_switch(), "pass the sentinel as the output pointer")
        ("caller", po::value<std::string>(), "0x-prefixed hex of the 32-byte caller account")
        ("block-number", po::value<uint64_t>(), "current block number")
        ;

    po::options_description runtime_desc("Runtime options");
    runtime_desc.add_options()
        ("gas-limit", po::value<uint64_t>()->default_value(def_gas_limit), "gas available to the invocation")
        ("memory-pages", po::value<uint32_t>()->default_value(def_memory_pages), "initial size of the guest memory in 64KiB pages")
        ("max-memory-pages", po::value<uint32_t>(), "maximum size of the guest memory in 64KiB pages")
        ("disable-extension", po::bool_switch(), "dispatch calls to the disabled chain extension")
        ("call-weight", po::value<uint64_t>()->default_value(def_host_fn_weights.call_chain_extension),
          "base weight of a chain extension call")
        ("per-byte-weight", po::value<uint64_t>()->default_value(def_host_fn_weights.chain_extension_per_byte),
          "weight of a byte moved by a chain extension")
        ;
    // clang-format on

    desc.add(call_desc).add(runtime_desc);

    po::variables_map vm;
    try {
      po::store(po::parse_command_line(argc, argv, desc), vm);
      po::notify(vm);
    } catch (const std::exception &e) {
      std::cerr << "Error: " << e.what() << '\n'
                << "Try run with option '--help' for more information"
                << std::endl;
      return false;
    }

    if (vm.count("help") > 0) {
      std::cout << desc << std::endl;
      return false;
    }

    if (auto func_id = find_argument<uint32_t>(vm, "func-id")) {
      funcId_ = *func_id;
    } else {
      SL_ERROR(logger_, "Chain extension function is not provided");
      return false;
    }

    bool success = true;

    find_argument<std::string>(vm, "input", [&](const std::string &val) {
      if (auto res = common::unhexWith0x(val); res.has_value()) {
        input_ = std::move(res.value());
      } else {
        SL_ERROR(logger_, "Invalid input: {}", res.error().message());
        success = false;
      }
    });

    find_argument<std::string>(vm, "caller", [&](const std::string &val) {
      auto res = common::unhexWith0x(val);
      if (res.has_error()) {
        SL_ERROR(logger_, "Invalid caller: {}", res.error().message());
        success = false;
        return;
      }
      if (res.value().size() != caller_.size()) {
        SL_ERROR(logger_,
                 "Caller must be {} bytes, got {}",
                 caller_.size(),
                 res.value().size());
        success = false;
        return;
      }
      std::copy(res.value().begin(), res.value().end(), caller_.begin());
    });

    if (auto val = find_argument<uint64_t>(vm, "block-number")) {
      blockNumber_ = *val;
    }

    outputCapacity_ = vm["output-capacity"].as<uint32_t>();
    skipOutput_ = vm["skip-output"].as<bool>();
    gasLimit_ = vm["gas-limit"].as<uint64_t>();
    memoryPages_ = vm["memory-pages"].as<uint32_t>();
    maxMemoryPages_ = find_argument<uint32_t>(vm, "max-memory-pages");
    chainExtensionEnabled_ = not vm["disable-extension"].as<bool>();
    schedule_.host_fn_weights.call_chain_extension =
        vm["call-weight"].as<uint64_t>();
    schedule_.host_fn_weights.chain_extension_per_byte =
        vm["per-byte-weight"].as<uint64_t>();

    if (maxMemoryPages_ and *maxMemoryPages_ < memoryPages_) {
      SL_ERROR(logger_,
               "Max memory pages ({}) is less than initial memory pages ({})",
               *maxMemoryPages_,
               memoryPages_);
      success = false;
    }

    if (auto it = vm.find("log"); it != vm.end()) {
      log_ = it->second.as<std::vector<std::string>>();
    }

    return success;
  }

}  // namespace chainext::application
