/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>
#include <limits>

namespace histsync {
  using Slot = uint64_t;
  using Epoch = uint64_t;

  /**
   * Adds {@param count} slots to {@param slot}, saturating at the maximal
   * representable slot instead of wrapping around.
   */
  constexpr Slot addSlots(Slot slot, uint64_t count) {
    if (count > std::numeric_limits<Slot>::max() - slot) {
      return std::numeric_limits<Slot>::max();
    }
    return slot + count;
  }
}  // namespace histsync
