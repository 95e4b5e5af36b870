/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cinttypes>

#include <fmt/format.h>
#include <qtils/byte_arr.hpp>
#include <qtils/tagged.hpp>

#include "types/block_hash.hpp"
#include "types/slot.hpp"

namespace histsync {

  using OpaqueHash = qtils::ByteArr<32>;

  using StateRoot = OpaqueHash;
  using BodyRoot = OpaqueHash;

  using ProposerIndex = uint64_t;

  using BlsSignature = qtils::ByteArr<96>;
  using KzgProof = qtils::ByteArr<48>;
}  // namespace histsync

template <typename T, typename U>
struct fmt::formatter<qtils::Tagged<T, U>> : formatter<T> {};
