/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <sszpp/ssz++.hpp>

#include "types/types.hpp"

namespace histsync {

  /**
   * @struct BeaconBlock
   * Header-level view of a beacon block. Only the fields needed to place a
   * block in history are kept; the body is referenced by its root.
   */
  struct BeaconBlock : ssz::ssz_container {
    /// The block's slot number
    Slot slot = 0;
    /// Index of the validator that proposed the block
    ProposerIndex proposer_index = 0;
    /// Hash of the parent block
    BlockHash parent_root;
    /// Hash of the post-state after the block is processed
    StateRoot state_root;
    /// Hash tree root of the block's body
    BodyRoot body_root;

    SSZ_CONT(slot, proposer_index, parent_root, state_root, body_root);
  };

  struct SignedBeaconBlock : ssz::ssz_container {
    BeaconBlock message;
    BlsSignature signature;

    SSZ_CONT(message, signature);
  };

}  // namespace histsync
