/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>

#include <qtils/outcome.hpp>

#include "storage/face/owned_or_view.hpp"
#include "storage/face/view.hpp"

namespace histsync::storage::face {
  /**
   * @brief A mixin for read-only map.
   * @tparam K key type
   * @tparam V value type
   */
  template <typename K, typename V>
  struct Readable {
    virtual ~Readable() = default;

    [[nodiscard]] virtual outcome::result<bool> contains(
        const View<K> &key) const = 0;

    /**
     * @return value stored by key, or StorageError::NOT_FOUND
     */
    [[nodiscard]] virtual outcome::result<OwnedOrView<V>> get(
        const View<K> &key) const = 0;

    /**
     * @return value stored by key, or std::nullopt if there is none;
     * error only if the backend failed
     */
    [[nodiscard]] virtual outcome::result<std::optional<OwnedOrView<V>>> tryGet(
        const View<K> &key) const = 0;
  };
}  // namespace histsync::storage::face
