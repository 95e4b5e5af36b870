/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>

#include <qtils/enum_error_code.hpp>

namespace histsync::blockchain {

  enum class BackfillStatusError : uint8_t {
    FILL_FWD_PAST_UPPER = 1,
    FILL_BACK_PAST_LOWER,
    NIL_ORIGIN_BLOCK,
    GENESIS_ROOT_REQUIRED,
    NOT_INITIALIZED,
  };

}

OUTCOME_HPP_DECLARE_ERROR(histsync::blockchain, BackfillStatusError);
