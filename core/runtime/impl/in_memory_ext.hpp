/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "runtime/ext.hpp"

#include <map>

namespace chainext::runtime {

  /**
   * Execution context over a plain map, for running a single contract
   * without a backing chain state
   */
  class InMemoryExt final : public Ext {
   public:
    struct Context {
      AccountId caller{};
      AccountId address{};
      Balance balance = 0;
      Balance value_transferred = 0;
      BlockNumber block_number = 0;
    };

    explicit InMemoryExt(Context context);

    const AccountId &caller() const override {
      return context_.caller;
    }

    const AccountId &address() const override {
      return context_.address;
    }

    Balance balance() const override {
      return context_.balance;
    }

    Balance valueTransferred() const override {
      return context_.value_transferred;
    }

    BlockNumber blockNumber() const override {
      return context_.block_number;
    }

    std::optional<common::Bytes> getStorage(
        const StorageKey &key) const override;

    outcome::result<void> setStorage(
        const StorageKey &key, std::optional<common::Bytes> value) override;

    const std::map<StorageKey, common::Bytes> &storage() const {
      return storage_;
    }

   private:
    Context context_;
    std::map<StorageKey, common::Bytes> storage_;
  };

}  // namespace chainext::runtime
