/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "blockchain/block_storage_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(histsync::blockchain, BlockStorageError, e) {
  using E = BlockStorageError;
  switch (e) {
    case E::GAP_STATUS_NOT_FOUND:
      return "Backfill status not found";
    case E::ORIGIN_CHECKPOINT_ROOT_NOT_FOUND:
      return "Origin checkpoint block root not found";
    case E::GENESIS_BLOCK_ROOT_NOT_FOUND:
      return "Genesis block root not found";
    case E::BLOCK_NOT_FOUND:
      return "Block not found";
    case E::TOO_MANY_SIDECARS:
      return "Too many blobs sidecars stored for one slot";
  }
  return "Unknown error";
}
