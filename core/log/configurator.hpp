/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <filesystem>
#include <optional>

#include <soralog/impl/configurator_from_yaml.hpp>

namespace chainext::log {

  class Configurator : public soralog::ConfiguratorFromYAML {
   public:
    /// Uses the embedded group tree
    Configurator();

    explicit Configurator(std::string config);

    explicit Configurator(std::filesystem::path path);

    /// Extracts the value of `--logcfg` without parsing the rest of options
    static std::optional<std::filesystem::path> getLogConfigFile(
        int argc, const char **argv);
  };

}  // namespace chainext::log
