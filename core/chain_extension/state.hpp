/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <concepts>

/**
 * States of a chain extension environment and the capabilities they grant.
 * A state decides how the four raw call words are interpreted:
 *
 * | State        | PrimIn | PrimOut | BufIn | BufOut |
 * |--------------|--------|---------|-------|--------|
 * | Init         |        |         |       |        |
 * | OnlyIn       |   +    |    +    |       |        |
 * | PrimInBufOut |   +    |         |       |   +    |
 * | BufInBufOut  |        |         |   +   |   +    |
 */
namespace chainext::chain_extension::state {

  /// Entry state, no call word may be accessed
  struct Init final {
    Init() = delete;
  };

  /// All four words are primitive values
  struct OnlyIn final {
    OnlyIn() = delete;
  };

  /// Words 0 and 1 are primitive values, words 2 and 3 an output buffer
  struct PrimInBufOut final {
    PrimInBufOut() = delete;
  };

  /// Words 0 and 1 are an input buffer, words 2 and 3 an output buffer
  struct BufInBufOut final {
    BufInBufOut() = delete;
  };

  struct Capabilities {
    bool prim_in;
    bool prim_out;
    bool buf_in;
    bool buf_out;
  };

  template <typename S>
  inline constexpr bool kIsState =
      std::same_as<S, Init> or std::same_as<S, OnlyIn>
      or std::same_as<S, PrimInBufOut> or std::same_as<S, BufInBufOut>;

  template <typename S>
  concept State = kIsState<S>;

  template <State S>
  inline constexpr Capabilities kCapabilities{};

  template <>
  inline constexpr Capabilities kCapabilities<Init>{
      .prim_in = false, .prim_out = false, .buf_in = false, .buf_out = false};

  template <>
  inline constexpr Capabilities kCapabilities<OnlyIn>{
      .prim_in = true, .prim_out = true, .buf_in = false, .buf_out = false};

  template <>
  inline constexpr Capabilities kCapabilities<PrimInBufOut>{
      .prim_in = true, .prim_out = false, .buf_in = false, .buf_out = true};

  template <>
  inline constexpr Capabilities kCapabilities<BufInBufOut>{
      .prim_in = false, .prim_out = false, .buf_in = true, .buf_out = true};

  /// `val0()` and `val1()` are available
  template <typename S>
  concept PrimIn = State<S> and kCapabilities<S>.prim_in;

  /// `val2()` and `val3()` are available
  template <typename S>
  concept PrimOut = State<S> and kCapabilities<S>.prim_out;

  /// `read()` is available
  template <typename S>
  concept BufIn = State<S> and kCapabilities<S>.buf_in;

  /// `write()` is available
  template <typename S>
  concept BufOut = State<S> and kCapabilities<S>.buf_out;

}  // namespace chainext::chain_extension::state
