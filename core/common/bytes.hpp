/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <qtils/bytes.hpp>

namespace chainext::common {
  using qtils::Bytes;
  using qtils::BytesIn;
  using qtils::BytesOut;
}  // namespace chainext::common
