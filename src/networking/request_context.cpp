/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "networking/request_context.hpp"

#include <algorithm>

#include <boost/asio/post.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>

OUTCOME_CPP_DEFINE_CATEGORY(histsync::networking, ContextError, e) {
  using E = histsync::networking::ContextError;
  switch (e) {
    case E::CANCELED:
      return "context canceled";
    case E::DEADLINE_EXCEEDED:
      return "context deadline exceeded";
  }
  return "Unknown error";
}

namespace histsync::networking {

  RequestContext::RequestContext(
      std::shared_ptr<boost::asio::io_context> io_context,
      std::shared_ptr<RequestContext> parent,
      std::optional<Clock::time_point> deadline)
      : io_context_{std::move(io_context)},
        parent_{std::move(parent)},
        deadline_{deadline} {}

  RequestContext::~RequestContext() {
    // A finished child no longer needs to be reachable from its parent
    if (parent_) {
      std::lock_guard lock{parent_->mutex_};
      std::erase_if(parent_->children_,
                    [](const auto &child) { return child.expired(); });
    }
  }

  std::shared_ptr<RequestContext> RequestContext::background(
      std::shared_ptr<boost::asio::io_context> io_context) {
    return std::shared_ptr<RequestContext>(
        new RequestContext(std::move(io_context), nullptr, std::nullopt));
  }

  std::shared_ptr<RequestContext> RequestContext::withTimeout(
      Clock::duration timeout) {
    auto deadline = Clock::now() + timeout;
    if (deadline_.has_value()) {
      deadline = std::min(deadline, deadline_.value());
    }
    auto child = std::shared_ptr<RequestContext>(
        new RequestContext(io_context_, shared_from_this(), deadline));

    std::lock_guard lock{mutex_};
    if (auto reason = reason_.load(); reason != 0) {
      child->reason_ = reason;
    } else {
      children_.emplace_back(child);
    }
    return child;
  }

  void RequestContext::cancel() {
    finish(ContextError::CANCELED);
  }

  void RequestContext::finish(ContextError reason) {
    uint8_t expected = 0;
    if (not reason_.compare_exchange_strong(expected,
                                            static_cast<uint8_t>(reason))) {
      return;
    }

    std::vector<std::weak_ptr<RequestContext>> children;
    std::vector<std::weak_ptr<boost::asio::steady_timer>> timers;
    {
      std::lock_guard lock{mutex_};
      children.swap(children_);
      timers.swap(timers_);
    }

    for (auto &weak_timer : timers) {
      boost::asio::post(*io_context_, [weak_timer] {
        if (auto timer = weak_timer.lock()) {
          timer->cancel();
        }
      });
    }
    for (auto &weak_child : children) {
      if (auto child = weak_child.lock()) {
        child->finish(reason);
      }
    }
  }

  bool RequestContext::done() const {
    return err().has_error();
  }

  outcome::result<void> RequestContext::err() const {
    if (auto reason = reason_.load(); reason != 0) {
      return static_cast<ContextError>(reason);
    }
    if (deadline_.has_value() and Clock::now() >= deadline_.value()) {
      return ContextError::DEADLINE_EXCEEDED;
    }
    if (parent_) {
      return parent_->err();
    }
    return outcome::success();
  }

  libp2p::CoroOutcome<void> RequestContext::sleep(Clock::duration duration) {
    BOOST_OUTCOME_CO_TRY(err());

    auto wake_at = Clock::now() + duration;
    if (deadline_.has_value()) {
      wake_at = std::min(wake_at, deadline_.value());
    }
    auto timer =
        std::make_shared<boost::asio::steady_timer>(*io_context_, wake_at);
    {
      std::lock_guard lock{mutex_};
      // canceled between the check above and registration
      if (reason_.load() != 0) {
        co_return static_cast<ContextError>(reason_.load());
      }
      std::erase_if(timers_, [](const auto &t) { return t.expired(); });
      timers_.emplace_back(timer);
    }

    boost::system::error_code ec;
    co_await timer->async_wait(
        boost::asio::redirect_error(boost::asio::use_awaitable, ec));

    co_return err();
  }

}  // namespace histsync::networking
