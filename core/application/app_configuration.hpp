/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

#include "common/bytes.hpp"
#include "runtime/schedule.hpp"
#include "runtime/types.hpp"

namespace chainext::application {

  /**
   * Parse and store application config.
   */
  class AppConfiguration {
   public:
    virtual ~AppConfiguration() = default;

    /**
     * @return chain extension function to call
     */
    virtual uint32_t funcId() const = 0;

    /**
     * @return bytes placed into the input buffer of the call
     */
    virtual const common::Bytes &input() const = 0;

    /**
     * @return size of the output buffer the simulated guest declares
     */
    virtual uint32_t outputCapacity() const = 0;

    /**
     * @return true if the output pointer is the sentinel, i.e. the guest
     * does not want the output
     */
    virtual bool skipOutput() const = 0;

    virtual runtime::Weight gasLimit() const = 0;

    virtual uint32_t memoryPages() const = 0;

    virtual const std::optional<uint32_t> &maxMemoryPages() const = 0;

    /**
     * @return false if calls must go to the disabled extension
     */
    virtual bool chainExtensionEnabled() const = 0;

    virtual const runtime::Schedule &schedule() const = 0;

    virtual const runtime::AccountId &caller() const = 0;

    virtual runtime::BlockNumber blockNumber() const = 0;

    /**
     * @return logging filters in the `-l` syntax
     */
    virtual const std::vector<std::string> &log() const = 0;
  };

}  // namespace chainext::application
