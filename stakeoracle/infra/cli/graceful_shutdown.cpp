// Copyright 2025 The Stakeoracle Authors
// SPDX-License-Identifier: Apache-2.0

#include "graceful_shutdown.hpp"

#include <utility>

#include <stakeoracle/infra/common/log.hpp>

namespace stakeoracle::cmd::common {

std::string_view to_string(ShutdownReason reason) {
    switch (reason) {
        case ShutdownReason::kNone:
            return "none";
        case ShutdownReason::kCompleted:
            return "completed";
        case ShutdownReason::kGraceExpired:
            return "grace-expired";
        case ShutdownReason::kForced:
            return "forced";
    }
    return "unknown";
}

GracefulShutdown::GracefulShutdown(const boost::asio::any_io_executor& executor,
                                   std::chrono::milliseconds grace_period,
                                   std::function<void()> stop_requester)
    : grace_timer_{executor}, grace_period_{grace_period}, stop_requester_{std::move(stop_requester)} {}

void GracefulShutdown::notify_signal(int signal_number) {
    if (reason_ != ShutdownReason::kNone) return;

    if (draining_) {
        log::Warning("Shutdown", {"signal", std::to_string(signal_number)}) << "second termination request, forcing exit";
        resolve(ShutdownReason::kForced);
        return;
    }

    draining_ = true;
    log::Info("Shutdown", {"signal", std::to_string(signal_number), "grace", std::to_string(grace_period_.count()) + "ms"})
        << "draining in-flight work";
    grace_timer_.expires_after(grace_period_);
    grace_timer_.async_wait([this](const boost::system::error_code& ec) {
        if (ec == boost::asio::error::operation_aborted) return;
        log::Warning("Shutdown") << "grace period expired before work completion";
        resolve(ShutdownReason::kGraceExpired);
    });
    if (stop_requester_) {
        stop_requester_();
    }
}

void GracefulShutdown::notify_completed() {
    resolve(ShutdownReason::kCompleted);
}

void GracefulShutdown::resolve(ShutdownReason reason) {
    if (reason_ != ShutdownReason::kNone) return;
    reason_ = reason;
    grace_timer_.cancel();
    log::Debug("Shutdown", {"reason", std::string{to_string(reason)}});
    if (on_resolved_) {
        on_resolved_(reason);
    }
}

}  // namespace stakeoracle::cmd::common
