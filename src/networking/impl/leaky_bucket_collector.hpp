/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <mutex>
#include <unordered_map>

#include <qtils/shared_ref.hpp>

#include "clock/clock.hpp"
#include "networking/rate_limiter.hpp"

namespace histsync::networking {

  /**
   * Token buckets keyed by peer. A bucket starts full with {@param capacity}
   * tokens and refills continuously at {@param rate} tokens per second.
   * Buckets that refilled completely are forgotten.
   */
  class LeakyBucketCollector : public QuotaTracker {
   public:
    LeakyBucketCollector(qtils::SharedRef<clock::SteadyClock> clock,
                         double rate,
                         int64_t capacity);

    int64_t remaining(const std::string &key) const override;

    std::chrono::milliseconds timeUntilRefill(
        const std::string &key) const override;

    /**
     * Takes {@param count} tokens from the peer's bucket. The bucket does not
     * go below empty.
     * @returns tokens remaining after the operation
     */
    int64_t add(const std::string &key, int64_t count);

    int64_t capacity() const {
      return capacity_;
    }

    /// Number of peers with a bucket that is not full
    size_t size() const;

   private:
    struct Bucket {
      double tokens;
      clock::SteadyClock::TimePoint last_refill;
    };

    /// Refills bucket up to now, returns current tokens. Requires lock.
    double refillLocked(const std::string &key) const;

    qtils::SharedRef<clock::SteadyClock> clock_;
    double rate_;
    int64_t capacity_;

    mutable std::mutex mutex_;
    mutable std::unordered_map<std::string, Bucket> buckets_;
  };

}  // namespace histsync::networking
