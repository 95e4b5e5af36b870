/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <qtils/byte_vec.hpp>

#include "serde/serialization.hpp"
#include "storage/spaced_storage.hpp"
#include "types/blobs_sidecar.hpp"
#include "types/types.hpp"

/**
 * Storage schema overview
 *
 * Space::Default keeps singleton records addressed by predefined lookup keys
 * (backfill status, origin checkpoint root, genesis root).
 * Space::Block maps block root to SSZ of the signed block.
 * Space::BlobSidecars maps slot (8 bytes, little-endian) to SSZ list of all
 * sidecars known for the slot.
 */

namespace histsync::blockchain {

  /// Upper bound of sidecars kept per slot (one per competing block)
  constexpr size_t kMaxBlobsSidecarsPerSlot = 16;

  /// Stored value of Space::BlobSidecars
  struct SlotBlobsSidecars : ssz::ssz_variable_size_container {
    ssz::list<BlobsSidecar, kMaxBlobsSidecarsPerSlot> sidecars;

    SSZ_CONT(sidecars);
  };

  /**
   * Convert slot into a short lookup key (LE representation)
   */
  inline qtils::ByteVec slotToLookupKey(Slot slot) {
    static_assert(std::is_same_v<decltype(slot), uint64_t>);
    return encode(slot);
  }

  /**
   * Put an entry to the key space \param space
   * @param storage to put the entry to
   * @param space keyspace for the entry value
   * @param key key that could be used to retrieve the value
   * @param value data to be put to the storage
   * @return storage error if any
   */
  outcome::result<void> putToSpace(storage::SpacedStorage &storage,
                                   storage::Space space,
                                   qtils::ByteView key,
                                   qtils::ByteVecOrView &&value);

  /**
   * Get an entry from the database
   * @return error, or an encoded entry, if any, or std::nullopt, if none
   */
  outcome::result<std::optional<qtils::ByteVecOrView>> getFromSpace(
      storage::SpacedStorage &storage,
      storage::Space space,
      qtils::ByteView key);

  /**
   * Get an entry from the database and decode it
   * @return error of read or decode, std::nullopt if there is no entry
   */
  template <typename T>
  outcome::result<std::optional<T>> getDecodedFromSpace(
      storage::SpacedStorage &storage,
      storage::Space space,
      qtils::ByteView key) {
    OUTCOME_TRY(encoded_opt, getFromSpace(storage, space, key));
    if (not encoded_opt.has_value()) {
      return std::nullopt;
    }
    OUTCOME_TRY(value, decode<T>(encoded_opt.value()));
    return std::make_optional(std::move(value));
  }

}  // namespace histsync::blockchain
