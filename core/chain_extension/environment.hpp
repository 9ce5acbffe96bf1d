/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <exception>
#include <optional>
#include <utility>

#include <boost/assert.hpp>

#include "chain_extension/state.hpp"
#include "runtime/runtime.hpp"

namespace chainext::chain_extension {

  class ChainExtensionDispatcher;

  /**
   * Raw arguments of a chain extension call, as passed by the guest
   */
  struct CallWords {
    uint32_t val0 = 0;
    uint32_t val1 = 0;
    uint32_t val2 = 0;
    uint32_t val3 = 0;
  };

  /**
   * Access to the host runtime for a chain extension call.
   *
   * The state `S` fixes the calling convention and with it the set of
   * available accessors. An environment starts in `state::Init` and has to be
   * moved into one of the terminal states before any call word can be read:
   * @code
   *   auto env = std::move(init_env).bufInBufOut();
   *   OUTCOME_TRY(input, env.read());
   * @endcode
   *
   * Only the dispatcher can create an environment. It borrows the runtime
   * for the duration of a single call and must not be stored.
   */
  template <state::State S>
  class Environment final {
   public:
    Environment(const Environment &) = delete;
    Environment &operator=(const Environment &) = delete;
    Environment &operator=(Environment &&) = delete;

    Environment(Environment &&other) noexcept
        : runtime_{std::exchange(other.runtime_, nullptr)},
          words_{other.words_} {}

    ~Environment() = default;

    /**
     * Charges the given weight from the gas meter. Has to be called before
     * any memory access whose cost depends on the size of the data.
     */
    outcome::result<void> chargeWeight(runtime::Weight amount) {
      return runtime().chargeGas(runtime::RuntimeToken::chainExtension(amount));
    }

    runtime::Ext &ext() {
      return runtime().ext();
    }

    Environment<state::OnlyIn> onlyIn() &&
      requires std::same_as<S, state::Init>
    {
      return transit<state::OnlyIn>();
    }

    Environment<state::PrimInBufOut> primInBufOut() &&
      requires std::same_as<S, state::Init>
    {
      return transit<state::PrimInBufOut>();
    }

    Environment<state::BufInBufOut> bufInBufOut() &&
      requires std::same_as<S, state::Init>
    {
      return transit<state::BufInBufOut>();
    }

    uint32_t val0() const
      requires state::PrimIn<S>
    {
      return words_.val0;
    }

    uint32_t val1() const
      requires state::PrimIn<S>
    {
      return words_.val1;
    }

    uint32_t val2() const
      requires state::PrimOut<S>
    {
      return words_.val2;
    }

    uint32_t val3() const
      requires state::PrimOut<S>
    {
      return words_.val3;
    }

    /// Length of the input buffer, to price `read()` before doing it
    uint32_t inLen() const
      requires state::BufIn<S>
    {
      return words_.val1;
    }

    /**
     * Reads the input buffer: `val1` bytes at `val0`
     */
    outcome::result<common::Bytes> read() const
      requires state::BufIn<S>
    {
      return runtime().readSandboxMemory(words_.val0, words_.val1);
    }

    /**
     * Writes `buf` to the output buffer at `val2` and its length to `val3`
     * @param allow_skip nothing is written if the guest passed the sentinel
     * as the output pointer
     * @param weight_per_byte if set, `weight_per_byte * buf.size()` is charged
     * before writing
     */
    outcome::result<void> write(
        common::BytesIn buf,
        bool allow_skip,
        std::optional<runtime::Weight> weight_per_byte)
      requires state::BufOut<S>
    {
      return runtime().writeSandboxOutput(
          words_.val2,
          words_.val3,
          buf,
          allow_skip,
          [weight_per_byte](runtime::WasmSize len)
              -> std::optional<runtime::RuntimeToken> {
            if (not weight_per_byte) {
              return std::nullopt;
            }
            return runtime::RuntimeToken::chainExtension(
                runtime::saturatingMul(*weight_per_byte, len));
          });
    }

   private:
    template <state::State>
    friend class Environment;
    friend class ChainExtensionDispatcher;

    Environment(runtime::Runtime &runtime, CallWords words)
        : runtime_{&runtime}, words_{words} {}

    // A consumed environment is a broken extension, stop in every build
    template <state::State To>
    Environment<To> transit() {
      BOOST_ASSERT_MSG(runtime_ != nullptr,
                       "Environment is already moved to another state");
      if (runtime_ == nullptr) {
        std::terminate();
      }
      return Environment<To>{*std::exchange(runtime_, nullptr), words_};
    }

    runtime::Runtime &runtime() const {
      BOOST_ASSERT_MSG(runtime_ != nullptr,
                       "Environment is used after being moved from");
      if (runtime_ == nullptr) {
        std::terminate();
      }
      return *runtime_;
    }

    runtime::Runtime *runtime_;
    CallWords words_;
  };

}  // namespace chainext::chain_extension
