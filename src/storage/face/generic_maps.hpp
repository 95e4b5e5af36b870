/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>

#include "storage/face/readable.hpp"
#include "storage/face/writeable.hpp"

namespace histsync::storage::face {

  /**
   * @brief Abstraction over a key-value storage supporting read and write.
   * @tparam K Key type.
   * @tparam V Value type.
   */
  template <typename K, typename V>
  struct GenericStorage : Readable<K, V>, Writeable<K, V> {
    /**
     * @brief Hint for approximate RAM usage.
     *
     * @return std::optional<size_t> Optional in-memory size in bytes,
     * or std::nullopt if no size hint is available.
     */
    [[nodiscard]] virtual std::optional<size_t> byteSizeHint() const {
      return std::nullopt;
    }
  };

}  // namespace histsync::storage::face
