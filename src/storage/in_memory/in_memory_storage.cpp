/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "storage/in_memory/in_memory_storage.hpp"

#include <boost/assert.hpp>

#include "storage/storage_error.hpp"

namespace histsync::storage {

  outcome::result<ByteVecOrView> InMemoryStorage::get(
      const ByteView &key) const {
    OUTCOME_TRY(value, tryGet(key));
    if (not value.has_value()) {
      return StorageError::NOT_FOUND;
    }
    return std::move(value.value());
  }

  outcome::result<std::optional<ByteVecOrView>> InMemoryStorage::tryGet(
      const ByteView &key) const {
    std::shared_lock lock{mutex_};
    auto it = storage_.find(key.toHex());
    if (it == storage_.end()) {
      return std::nullopt;
    }
    // copy, since the entry may be replaced after the lock is released
    return ByteVecOrView{ByteVec{it->second}};
  }

  outcome::result<void> InMemoryStorage::put(const ByteView &key,
                                             ByteVecOrView &&value) {
    std::unique_lock lock{mutex_};
    auto it = storage_.find(key.toHex());
    if (it != storage_.end()) {
      size_t old_value_size = it->second.size();
      BOOST_ASSERT(size_ >= old_value_size);
      size_ -= old_value_size;
    }
    size_ += value.size();
    storage_[key.toHex()] = std::move(value).intoByteVec();
    return outcome::success();
  }

  outcome::result<bool> InMemoryStorage::contains(const ByteView &key) const {
    std::shared_lock lock{mutex_};
    return storage_.contains(key.toHex());
  }

  outcome::result<void> InMemoryStorage::remove(const ByteView &key) {
    std::unique_lock lock{mutex_};
    auto it = storage_.find(key.toHex());
    if (it != storage_.end()) {
      size_ -= it->second.size();
      storage_.erase(it);
    }
    return outcome::success();
  }

  std::optional<size_t> InMemoryStorage::byteSizeHint() const {
    std::shared_lock lock{mutex_};
    return size_;
  }
}  // namespace histsync::storage
