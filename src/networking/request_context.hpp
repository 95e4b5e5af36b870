/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <libp2p/coro/coro.hpp>
#include <qtils/enum_error_code.hpp>
#include <qtils/outcome.hpp>

namespace histsync::networking {

  enum class ContextError : uint8_t {
    CANCELED = 1,
    DEADLINE_EXCEEDED,
  };

  /**
   * Cancellation and deadline scope of one request.
   *
   * A context is done once it is canceled, its deadline has passed, or its
   * parent is done. Children created by withTimeout() never outlive the
   * parent's deadline.
   *
   * Waiting (sleep) must happen on the context's io_context; cancel() may be
   * called from any thread.
   */
  class RequestContext : public std::enable_shared_from_this<RequestContext> {
   public:
    using Clock = std::chrono::steady_clock;

    /// Context without deadline, done only when canceled
    static std::shared_ptr<RequestContext> background(
        std::shared_ptr<boost::asio::io_context> io_context);

    ~RequestContext();

    /**
     * @returns child context with deadline at now + {@param timeout}, or at
     * the parent's deadline if that is earlier
     */
    std::shared_ptr<RequestContext> withTimeout(Clock::duration timeout);

    /// Makes this context and all its children done with CANCELED
    void cancel();

    [[nodiscard]] bool done() const;

    /**
     * @returns success while not done, otherwise CANCELED or
     * DEADLINE_EXCEEDED
     */
    [[nodiscard]] outcome::result<void> err() const;

    [[nodiscard]] std::optional<Clock::time_point> deadline() const {
      return deadline_;
    }

    /**
     * Suspends for {@param duration}, or until the deadline or cancellation,
     * whichever comes first.
     * @returns success if the whole duration passed, the context's error
     * otherwise
     */
    libp2p::CoroOutcome<void> sleep(Clock::duration duration);

   private:
    RequestContext(std::shared_ptr<boost::asio::io_context> io_context,
                   std::shared_ptr<RequestContext> parent,
                   std::optional<Clock::time_point> deadline);

    void finish(ContextError reason);

    std::shared_ptr<boost::asio::io_context> io_context_;
    std::shared_ptr<RequestContext> parent_;
    std::optional<Clock::time_point> deadline_;

    // 0 while active, value of ContextError when finished
    std::atomic<uint8_t> reason_{0};

    mutable std::mutex mutex_;
    std::vector<std::weak_ptr<RequestContext>> children_;
    std::vector<std::weak_ptr<boost::asio::steady_timer>> timers_;
  };

}  // namespace histsync::networking

OUTCOME_HPP_DECLARE_ERROR(histsync::networking, ContextError);
