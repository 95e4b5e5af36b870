/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <sszpp/ssz++.hpp>

#include "log/formatters/block_index_ref.hpp"
#include "types/types.hpp"

namespace histsync {

  /**
   * @struct GapStatus
   * Boundaries of the history missing after checkpoint sync. Slots in the
   * open interval (low_slot, high_slot) are not guaranteed to be present
   * locally. Always replaced as a whole, never updated field by field.
   */
  struct GapStatus : ssz::ssz_container {
    /// Lower boundary of contiguous history
    Slot low_slot = 0;
    BlockHash low_root;
    /// Upper boundary of contiguous history
    Slot high_slot = 0;
    BlockHash high_root;
    /// Checkpoint sync origin; fixed once the status is created
    Slot origin_slot = 0;
    BlockHash origin_root;

    SSZ_CONT(low_slot,
             low_root,
             high_slot,
             high_root,
             origin_slot,
             origin_root);

    bool operator==(const GapStatus &other) const {
      return low_slot == other.low_slot and low_root == other.low_root
         and high_slot == other.high_slot and high_root == other.high_root
         and origin_slot == other.origin_slot
         and origin_root == other.origin_root;
    }
  };

}  // namespace histsync

template <>
struct fmt::formatter<histsync::GapStatus> {
  constexpr auto parse(format_parse_context &ctx) -> decltype(ctx.begin()) {
    return ctx.begin();
  }

  template <typename FormatContext>
  auto format(const histsync::GapStatus &v, FormatContext &ctx) const
      -> decltype(ctx.out()) {
    return fmt::format_to(
        ctx.out(),
        "low={:s}, high={:s}, origin={:s}",
        histsync::BlockIndexRef{v.low_slot, v.low_root},
        histsync::BlockIndexRef{v.high_slot, v.high_root},
        histsync::BlockIndexRef{v.origin_slot, v.origin_root});
  }
};
