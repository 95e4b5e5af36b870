/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <qtils/byte_arr.hpp>

namespace histsync {
  using BlockHash = qtils::ByteArr<32>;

  /// Placeholder root meaning "not associated with any block"
  constexpr BlockHash kZeroHash;
}  // namespace histsync
