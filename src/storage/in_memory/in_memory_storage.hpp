/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <map>
#include <memory>
#include <shared_mutex>

#include <qtils/byte_vec.hpp>
#include <qtils/outcome.hpp>

#include "storage/buffer_map_types.hpp"

namespace histsync::storage {

  /**
   * Map-backed storage used where a persistent database is not wanted,
   * mostly in tests. Safe for concurrent use.
   */
  class InMemoryStorage : public BufferStorage {
   public:
    ~InMemoryStorage() override = default;

    [[nodiscard]] outcome::result<ByteVecOrView> get(
        const ByteView &key) const override;

    [[nodiscard]] outcome::result<std::optional<ByteVecOrView>> tryGet(
        const ByteView &key) const override;

    outcome::result<void> put(const ByteView &key,
                              ByteVecOrView &&value) override;

    [[nodiscard]] outcome::result<bool> contains(
        const ByteView &key) const override;

    outcome::result<void> remove(const ByteView &key) override;

    [[nodiscard]] std::optional<size_t> byteSizeHint() const override;

   private:
    mutable std::shared_mutex mutex_;
    std::map<std::string, ByteVec> storage_;
    size_t size_ = 0;
  };

}  // namespace histsync::storage
