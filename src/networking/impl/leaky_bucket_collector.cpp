/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "networking/impl/leaky_bucket_collector.hpp"

#include <algorithm>
#include <cmath>

namespace histsync::networking {

  LeakyBucketCollector::LeakyBucketCollector(
      qtils::SharedRef<clock::SteadyClock> clock,
      double rate,
      int64_t capacity)
      : clock_{std::move(clock)}, rate_{rate}, capacity_{capacity} {}

  double LeakyBucketCollector::refillLocked(const std::string &key) const {
    auto it = buckets_.find(key);
    if (it == buckets_.end()) {
      return static_cast<double>(capacity_);
    }
    auto &bucket = it->second;
    auto now = clock_->now();
    std::chrono::duration<double> elapsed = now - bucket.last_refill;
    bucket.tokens = std::min(bucket.tokens + elapsed.count() * rate_,
                             static_cast<double>(capacity_));
    bucket.last_refill = now;
    if (bucket.tokens >= static_cast<double>(capacity_)) {
      buckets_.erase(it);
      return static_cast<double>(capacity_);
    }
    return bucket.tokens;
  }

  int64_t LeakyBucketCollector::remaining(const std::string &key) const {
    std::lock_guard lock{mutex_};
    return static_cast<int64_t>(std::floor(refillLocked(key)));
  }

  std::chrono::milliseconds LeakyBucketCollector::timeUntilRefill(
      const std::string &key) const {
    std::lock_guard lock{mutex_};
    auto missing = static_cast<double>(capacity_) - refillLocked(key);
    if (missing <= 0 or rate_ <= 0) {
      return std::chrono::milliseconds::zero();
    }
    return std::chrono::milliseconds(
        static_cast<int64_t>(std::ceil(missing / rate_ * 1000.0)));
  }

  int64_t LeakyBucketCollector::add(const std::string &key, int64_t count) {
    std::lock_guard lock{mutex_};
    auto tokens = refillLocked(key);
    tokens = std::max(tokens - static_cast<double>(count), 0.0);
    if (tokens < static_cast<double>(capacity_)) {
      buckets_.insert_or_assign(
          key, Bucket{.tokens = tokens, .last_refill = clock_->now()});
    }
    return static_cast<int64_t>(std::floor(tokens));
  }

  size_t LeakyBucketCollector::size() const {
    std::lock_guard lock{mutex_};
    return buckets_.size();
  }

}  // namespace histsync::networking
