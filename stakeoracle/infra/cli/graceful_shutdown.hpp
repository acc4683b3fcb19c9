// Copyright 2025 The Stakeoracle Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <chrono>
#include <functional>
#include <string_view>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/steady_timer.hpp>

namespace stakeoracle::cmd::common {

enum class ShutdownReason {
    kNone,          // still running
    kCompleted,     // the drained work finished on its own
    kGraceExpired,  // the grace period elapsed before the work finished
    kForced,        // a second termination request arrived while draining
};

std::string_view to_string(ShutdownReason reason);

//! Sequences process termination: the first request asks the work to stop and arms a grace timer,
//! a second request or the timer expiry resolves the shutdown without waiting for the work.
//! \warning Not thread-safe: all notifications must happen on the executor passed at construction
class GracefulShutdown {
  public:
    GracefulShutdown(const boost::asio::any_io_executor& executor,
                     std::chrono::milliseconds grace_period,
                     std::function<void()> stop_requester);

    //! Set the callback invoked exactly once when the shutdown is resolved
    void on_resolved(std::function<void(ShutdownReason)> callback) { on_resolved_ = std::move(callback); }

    void notify_signal(int signal_number);
    void notify_completed();

    bool is_draining() const { return draining_; }
    ShutdownReason reason() const { return reason_; }

  private:
    void resolve(ShutdownReason reason);

    boost::asio::steady_timer grace_timer_;
    std::chrono::milliseconds grace_period_;
    std::function<void()> stop_requester_;
    std::function<void(ShutdownReason)> on_resolved_;
    bool draining_{false};
    ShutdownReason reason_{ShutdownReason::kNone};
};

}  // namespace stakeoracle::cmd::common
