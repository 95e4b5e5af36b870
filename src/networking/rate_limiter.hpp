/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <chrono>
#include <memory>
#include <string>

#include <libp2p/coro/coro.hpp>
#include <qtils/outcome.hpp>

namespace histsync::networking {

  class RpcStream;

  /**
   * Token budget of all peers for one protocol
   */
  class QuotaTracker {
   public:
    virtual ~QuotaTracker() = default;

    /// Units the peer may still consume right now
    [[nodiscard]] virtual int64_t remaining(const std::string &key) const = 0;

    /// Time until the peer's budget is full again
    [[nodiscard]] virtual std::chrono::milliseconds timeUntilRefill(
        const std::string &key) const = 0;
  };

  /**
   * Per peer and per protocol rate limiting of served requests.
   * Safe for concurrent use by many stream handlers.
   */
  class RateLimiter {
   public:
    virtual ~RateLimiter() = default;

    /**
     * Pre-flight check that the stream's peer has at least {@param units}
     * (treated as at least 1) left for the stream's protocol. On rejection
     * writes a rate-limited error response to the stream.
     * @returns RpcError::RATE_LIMITED on rejection
     */
    virtual libp2p::CoroOutcome<void> checkBudget(
        std::shared_ptr<RpcStream> stream, uint64_t units) = 0;

    /// Charges units actually served to the stream's peer
    virtual void debit(const RpcStream &stream, uint64_t units) = 0;

    /**
     * @returns quota tracker holding the budget of {@param peer_key} for the
     * protocol {@param topic}, or RpcError::UNKNOWN_TOPIC if the protocol is
     * not registered
     */
    virtual outcome::result<std::shared_ptr<QuotaTracker>> quotaFor(
        const std::string &peer_key, const std::string &topic) = 0;
  };

}  // namespace histsync::networking
