/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <qtils/outcome.hpp>

#include "storage/face/owned_or_view.hpp"
#include "storage/face/view.hpp"

namespace histsync::storage::face {

  /**
   * @brief A mixin for modifiable map.
   * @tparam K Key type.
   * @tparam V Value type.
   *
   * Each operation is applied to the underlying storage before returning;
   * a successful return means the write is durable for the backend.
   */
  template <typename K, typename V>
  struct Writeable {
    virtual ~Writeable() = default;

    /**
     * @brief Store or replace a value by key.
     * @param key Key to associate with the value.
     * @param value The value to store, either owned or a view.
     */
    virtual outcome::result<void> put(const View<K> &key,
                                      OwnedOrView<V> &&value) = 0;

    /**
     * @brief Remove a value by key. Removing an absent key is not an error.
     */
    virtual outcome::result<void> remove(const View<K> &key) = 0;
  };

}  // namespace histsync::storage::face
