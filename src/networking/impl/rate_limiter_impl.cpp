/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "networking/impl/rate_limiter_impl.hpp"

#include <mutex>

#include "app/configuration.hpp"
#include "networking/rpc_error.hpp"
#include "networking/rpc_stream.hpp"

namespace histsync::networking {

  RateLimiterImpl::RateLimiterImpl(
      qtils::SharedRef<log::LoggingSystem> logsys,
      qtils::SharedRef<app::Configuration> app_config,
      qtils::SharedRef<clock::SteadyClock> clock)
      : logger_{logsys->getLogger("RateLimiter", "rate_limiter")},
        clock_{std::move(clock)},
        rate_{static_cast<double>(app_config->sync().block_batch_limit)},
        capacity_{static_cast<int64_t>(
            app_config->sync().block_batch_limit
            * app_config->sync().block_batch_limit_burst_factor)} {}

  void RateLimiterImpl::registerTopic(const std::string &topic) {
    std::unique_lock lock{mutex_};
    if (collectors_.contains(topic)) {
      return;
    }
    collectors_.emplace(
        topic, std::make_shared<LeakyBucketCollector>(clock_, rate_, capacity_));
    SL_DEBUG(logger_,
             "Rate limiting of {}: {} per second, burst {}",
             topic,
             rate_,
             capacity_);
  }

  outcome::result<std::shared_ptr<LeakyBucketCollector>>
  RateLimiterImpl::collectorFor(const std::string &topic) const {
    std::shared_lock lock{mutex_};
    auto it = collectors_.find(topic);
    if (it == collectors_.end()) {
      return RpcError::UNKNOWN_TOPIC;
    }
    return it->second;
  }

  libp2p::CoroOutcome<void> RateLimiterImpl::checkBudget(
      std::shared_ptr<RpcStream> stream, uint64_t units) {
    auto collector_res = collectorFor(stream->protocol());
    if (collector_res.has_error()) {
      SL_WARN(logger_, "No rate limiter for topic {}", stream->protocol());
      co_return collector_res.as_failure();
    }
    auto &collector = collector_res.value();

    auto key = stream->remotePeerKey();
    // Treat each request as a minimum of 1
    units = std::max<uint64_t>(units, 1);
    auto remaining = collector->remaining(key);
    if (remaining >= 0 and units <= static_cast<uint64_t>(remaining)) {
      co_return outcome::success();
    }

    SL_DEBUG(logger_,
             "Peer {} rate limited on {}: requested {}, remaining {}",
             key,
             stream->protocol(),
             units,
             remaining);
    auto written = co_await stream->writeErrorResponse(
        ResponseCode::RESOURCE_UNAVAILABLE,
        make_error_code(RpcError::RATE_LIMITED).message());
    if (written.has_error()) {
      SL_DEBUG(logger_,
               "Failed to notify peer {} about rate limit: {}",
               key,
               written.error());
    }
    co_return RpcError::RATE_LIMITED;
  }

  void RateLimiterImpl::debit(const RpcStream &stream, uint64_t units) {
    auto collector_res = collectorFor(stream.protocol());
    if (collector_res.has_error()) {
      SL_WARN(logger_, "No rate limiter for topic {}", stream.protocol());
      return;
    }
    auto key = stream.remotePeerKey();
    auto left =
        collector_res.value()->add(key, static_cast<int64_t>(units));
    SL_TRACE(logger_, "Peer {} charged {}, remaining {}", key, units, left);
  }

  outcome::result<std::shared_ptr<QuotaTracker>> RateLimiterImpl::quotaFor(
      const std::string &peer_key, const std::string &topic) {
    auto collector_res = collectorFor(topic);
    if (collector_res.has_error()) {
      SL_WARN(logger_,
              "No rate limiter for topic {} (peer {})",
              topic,
              peer_key);
      return collector_res.as_failure();
    }
    return std::static_pointer_cast<QuotaTracker>(collector_res.value());
  }

}  // namespace histsync::networking
