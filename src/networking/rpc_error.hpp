/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>

#include <qtils/enum_error_code.hpp>

namespace histsync::networking {

  enum class RpcError : uint8_t {
    /// Something failed on the serving side; the request itself was fine
    GENERIC = 1,
    RATE_LIMITED,
    INVALID_REQUEST,
    UNKNOWN_TOPIC,
  };

}

OUTCOME_HPP_DECLARE_ERROR(histsync::networking, RpcError);
