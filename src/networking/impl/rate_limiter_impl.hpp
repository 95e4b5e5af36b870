/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <shared_mutex>
#include <unordered_map>

#include <qtils/shared_ref.hpp>

#include "clock/clock.hpp"
#include "log/logger.hpp"
#include "networking/impl/leaky_bucket_collector.hpp"
#include "networking/rate_limiter.hpp"

namespace histsync::app {
  class Configuration;
}

namespace histsync::networking {

  /**
   * Keeps one LeakyBucketCollector per protocol. Every peer may consume
   * block_batch_limit units per second, with bursts up to
   * block_batch_limit * block_batch_limit_burst_factor.
   */
  class RateLimiterImpl : public RateLimiter {
   public:
    RateLimiterImpl(qtils::SharedRef<log::LoggingSystem> logsys,
                    qtils::SharedRef<app::Configuration> app_config,
                    qtils::SharedRef<clock::SteadyClock> clock);

    /// Starts limiting requests of the protocol; repeated calls are no-op
    void registerTopic(const std::string &topic);

    libp2p::CoroOutcome<void> checkBudget(std::shared_ptr<RpcStream> stream,
                                          uint64_t units) override;

    void debit(const RpcStream &stream, uint64_t units) override;

    outcome::result<std::shared_ptr<QuotaTracker>> quotaFor(
        const std::string &peer_key, const std::string &topic) override;

   private:
    outcome::result<std::shared_ptr<LeakyBucketCollector>> collectorFor(
        const std::string &topic) const;

    log::Logger logger_;
    qtils::SharedRef<clock::SteadyClock> clock_;
    double rate_;
    int64_t capacity_;

    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<LeakyBucketCollector>>
        collectors_;
  };

}  // namespace histsync::networking
