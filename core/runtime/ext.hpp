/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>

#include "common/bytes.hpp"
#include "outcome/outcome.hpp"
#include "runtime/types.hpp"

namespace chainext::runtime {

  /**
   * Execution context of the contract being executed. Gives host functions
   * access to the chain state on behalf of the guest.
   */
  class Ext {
   public:
    virtual ~Ext() = default;

    /// Account that called the contract being executed
    virtual const AccountId &caller() const = 0;

    /// Account of the contract being executed
    virtual const AccountId &address() const = 0;

    virtual Balance balance() const = 0;

    virtual Balance valueTransferred() const = 0;

    virtual BlockNumber blockNumber() const = 0;

    virtual std::optional<common::Bytes> getStorage(
        const StorageKey &key) const = 0;

    /**
     * Sets or, when `value` is nullopt, removes the contract storage entry
     */
    virtual outcome::result<void> setStorage(
        const StorageKey &key, std::optional<common::Bytes> value) = 0;
  };

}  // namespace chainext::runtime
