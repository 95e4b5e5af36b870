/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <sszpp/ssz++.hpp>

#include "types/constants.hpp"
#include "types/slot.hpp"

namespace histsync {

  /// Request of blobs sidecars for slots [start_slot, start_slot + count)
  struct BlobsSidecarsByRangeRequest : ssz::ssz_container {
    Slot start_slot = 0;
    uint64_t count = 0;

    SSZ_CONT(start_slot, count);
  };

  /// Payload of a non-success response chunk
  struct ErrorMessage : ssz::ssz_variable_size_container {
    ssz::list<uint8_t, MAX_ERROR_MESSAGE_SIZE> message;

    SSZ_CONT(message);
  };

}  // namespace histsync
