/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>

namespace histsync::networking {

  /// First byte of every response chunk
  enum class ResponseCode : uint8_t {
    SUCCESS = 0,
    INVALID_REQUEST = 1,
    SERVER_ERROR = 2,
    RESOURCE_UNAVAILABLE = 3,
  };

}  // namespace histsync::networking
