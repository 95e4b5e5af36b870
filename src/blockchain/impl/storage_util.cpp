/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "blockchain/impl/storage_util.hpp"

namespace histsync::blockchain {

  outcome::result<void> putToSpace(storage::SpacedStorage &storage,
                                   storage::Space space,
                                   qtils::ByteView key,
                                   qtils::ByteVecOrView &&value) {
    auto target_space = storage.getSpace(space);
    return target_space->put(key, std::move(value));
  }

  outcome::result<std::optional<qtils::ByteVecOrView>> getFromSpace(
      storage::SpacedStorage &storage,
      storage::Space space,
      qtils::ByteView key) {
    auto target_space = storage.getSpace(space);
    return target_space->tryGet(key);
  }

}  // namespace histsync::blockchain
