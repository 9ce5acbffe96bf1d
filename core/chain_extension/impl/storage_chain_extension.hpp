/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "chain_extension/chain_extension.hpp"
#include "log/logger.hpp"

namespace chainext::chain_extension {

  /**
   * Gives contracts raw access to their storage and to a few properties of
   * the execution context. Every function prices the bytes it moves with
   * `chain_extension_per_byte` of the schedule.
   */
  class StorageChainExtension final : public ChainExtension {
   public:
    enum class Function : uint32_t {
      /// in: key, out: value; yields 1 if there is no value
      READ_STORAGE = 1,
      /// in: key followed by value
      WRITE_STORAGE = 2,
      /// val0 must be 0; out: caller account id
      CALLER = 3,
      /// val0 selects the low (0) or high (1) half of the block number
      BLOCK_NUMBER = 4,
    };

    /// Yielded by READ_STORAGE when the key has no value
    static constexpr uint32_t kValueNotFound = 1;

    explicit StorageChainExtension(runtime::Schedule schedule);

    outcome::result<RetVal> call(uint32_t func_id,
                                 Environment<state::Init> env) override;

   private:
    outcome::result<RetVal> readStorage(Environment<state::BufInBufOut> env);
    outcome::result<RetVal> writeStorage(Environment<state::BufInBufOut> env);
    outcome::result<RetVal> caller(Environment<state::PrimInBufOut> env);
    outcome::result<RetVal> blockNumber(Environment<state::OnlyIn> env);

    runtime::Schedule schedule_;
    log::Logger logger_;
  };

}  // namespace chainext::chain_extension
