/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>

#include <qtils/enum_error_code.hpp>

namespace histsync::blockchain {

  enum class BlockStorageError : uint8_t {
    GAP_STATUS_NOT_FOUND = 1,
    ORIGIN_CHECKPOINT_ROOT_NOT_FOUND,
    GENESIS_BLOCK_ROOT_NOT_FOUND,
    BLOCK_NOT_FOUND,
    TOO_MANY_SIDECARS,
  };

}

OUTCOME_HPP_DECLARE_ERROR(histsync::blockchain, BlockStorageError);
