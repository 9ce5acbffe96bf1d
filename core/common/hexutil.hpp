/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string>
#include <string_view>

#include "common/bytes.hpp"
#include "outcome/outcome.hpp"

namespace chainext::common {

  /**
   * @brief error codes for exceptions that may occur during unhexing
   */
  enum class UnhexError {
    NOT_ENOUGH_INPUT = 1,
    NON_HEX_INPUT,
    MISSING_0X_PREFIX,
    UNKNOWN
  };
}  // namespace chainext::common

OUTCOME_HPP_DECLARE_ERROR(chainext::common, UnhexError);

namespace chainext::common {
  /**
   * @brief Converts bytes to lowercase hex representation with prefix 0x
   */
  std::string hex_lower_0x(BytesIn bytes);

  /**
   * @brief Converts hex representation to bytes
   * @note reads both uppercase and lowercase hexstrings
   */
  outcome::result<Bytes> unhex(std::string_view hex);

  /**
   * @brief Unhex hex-string with 0x in the beginning
   */
  outcome::result<Bytes> unhexWith0x(std::string_view hex_with_prefix);

}  // namespace chainext::common
