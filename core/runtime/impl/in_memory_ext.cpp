/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "runtime/impl/in_memory_ext.hpp"

namespace chainext::runtime {

  InMemoryExt::InMemoryExt(Context context) : context_{context} {}

  std::optional<common::Bytes> InMemoryExt::getStorage(
      const StorageKey &key) const {
    if (auto it = storage_.find(key); it != storage_.end()) {
      return it->second;
    }
    return std::nullopt;
  }

  outcome::result<void> InMemoryExt::setStorage(
      const StorageKey &key, std::optional<common::Bytes> value) {
    if (value) {
      storage_.insert_or_assign(key, std::move(*value));
    } else {
      storage_.erase(key);
    }
    return outcome::success();
  }

}  // namespace chainext::runtime
