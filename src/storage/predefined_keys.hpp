/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <qtils/byte_vec.hpp>
#include <qtils/literals.hpp>

namespace histsync::storage {

  using qtils::literals::operator""_vec;

  inline const qtils::ByteVec kBackfillStatusLookupKey =
      ":histsync:backfill_status"_vec;

  inline const qtils::ByteVec kOriginCheckpointBlockRootLookupKey =
      ":histsync:origin_checkpoint_root"_vec;

  inline const qtils::ByteVec kGenesisBlockRootLookupKey =
      ":histsync:genesis_block_root"_vec;

}  // namespace histsync::storage
