/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "networking/rpc_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(histsync::networking, RpcError, e) {
  using E = RpcError;
  switch (e) {
    case E::GENERIC:
      return "internal service error";
    case E::RATE_LIMITED:
      return "rate limited";
    case E::INVALID_REQUEST:
      return "invalid range, step or count";
    case E::UNKNOWN_TOPIC:
      return "no rate limiter registered for protocol";
  }
  return "Unknown error";
}
