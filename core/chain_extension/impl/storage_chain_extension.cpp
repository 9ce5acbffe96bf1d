/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "chain_extension/impl/storage_chain_extension.hpp"

#include <algorithm>
#include <string_view>

#include "chain_extension/chain_extension_error.hpp"
#include "common/hexutil.hpp"

namespace chainext::chain_extension {

  namespace {
    constexpr std::string_view kInvalidArg = "invalid arg";

    outcome::result<runtime::StorageKey> takeKey(common::BytesIn input) {
      runtime::StorageKey key;
      if (input.size() < key.size()) {
        return ChainExtensionError::INVALID_INPUT;
      }
      std::copy_n(input.begin(), key.size(), key.begin());
      return key;
    }
  }  // namespace

  StorageChainExtension::StorageChainExtension(runtime::Schedule schedule)
      : schedule_{schedule},
        logger_{log::createLogger("StorageChainExtension", "chain_extension")} {
  }

  outcome::result<RetVal> StorageChainExtension::call(
      uint32_t func_id, Environment<state::Init> env) {
    switch (static_cast<Function>(func_id)) {
      case Function::READ_STORAGE:
        return readStorage(std::move(env).bufInBufOut());
      case Function::WRITE_STORAGE:
        return writeStorage(std::move(env).bufInBufOut());
      case Function::CALLER:
        return caller(std::move(env).primInBufOut());
      case Function::BLOCK_NUMBER:
        return blockNumber(std::move(env).onlyIn());
    }
    SL_DEBUG(logger_, "Unknown function {}", func_id);
    return ChainExtensionError::UNKNOWN_FUNCTION;
  }

  outcome::result<RetVal> StorageChainExtension::readStorage(
      Environment<state::BufInBufOut> env) {
    const auto per_byte = schedule_.host_fn_weights.chain_extension_per_byte;

    OUTCOME_TRY(
        env.chargeWeight(runtime::saturatingMul(per_byte, env.inLen())));
    OUTCOME_TRY(input, env.read());
    OUTCOME_TRY(key, takeKey(input));

    auto value = env.ext().getStorage(key);
    if (not value) {
      SL_TRACE(logger_, "No value at {}", common::hex_lower_0x(key));
      return Converging{kValueNotFound};
    }
    OUTCOME_TRY(env.write(*value, true, per_byte));
    return Converging{0};
  }

  outcome::result<RetVal> StorageChainExtension::writeStorage(
      Environment<state::BufInBufOut> env) {
    const auto per_byte = schedule_.host_fn_weights.chain_extension_per_byte;

    OUTCOME_TRY(
        env.chargeWeight(runtime::saturatingMul(per_byte, env.inLen())));
    OUTCOME_TRY(input, env.read());
    OUTCOME_TRY(key, takeKey(input));

    common::Bytes value(input.begin() + key.size(), input.end());
    SL_TRACE(logger_,
             "Set {} bytes at {}",
             value.size(),
             common::hex_lower_0x(key));
    OUTCOME_TRY(env.ext().setStorage(key, std::move(value)));
    return Converging{0};
  }

  outcome::result<RetVal> StorageChainExtension::caller(
      Environment<state::PrimInBufOut> env) {
    if (env.val0() != 0) {
      return Diverging{runtime::ReturnFlags::REVERT,
                       common::Bytes(kInvalidArg.begin(), kInvalidArg.end())};
    }
    const runtime::AccountId account = env.ext().caller();
    OUTCOME_TRY(env.write(
        account, true, schedule_.host_fn_weights.chain_extension_per_byte));
    return Converging{0};
  }

  outcome::result<RetVal> StorageChainExtension::blockNumber(
      Environment<state::OnlyIn> env) {
    const auto number = env.ext().blockNumber();
    switch (env.val0()) {
      case 0:
        return Converging{static_cast<uint32_t>(number)};
      case 1:
        return Converging{static_cast<uint32_t>(number >> 32)};
      default:
        return ChainExtensionError::INVALID_INPUT;
    }
  }

}  // namespace chainext::chain_extension
