// Copyright 2025 The Stakeoracle Authors
// SPDX-License-Identifier: Apache-2.0

#include "stall_detector.hpp"

#include <boost/asio/error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/system/system_error.hpp>

#include <stakeoracle/infra/common/log.hpp>

namespace stakeoracle::oracle {

StallDetector::StallDetector(const boost::asio::any_io_executor& executor,
                             ModeState& state,
                             OracleMetrics& metrics,
                             StallThresholds thresholds,
                             std::chrono::milliseconds check_interval,
                             ClockFunction clock)
    : state_{state},
      metrics_{metrics},
      thresholds_{thresholds},
      check_interval_{check_interval},
      clock_{std::move(clock)},
      timer_{executor} {}

void StallDetector::observe_era_advance(TimePoint now) {
    state_.set_last_era_advance(now);
    reset(now);
}

void StallDetector::observe_confirmed_report(TimePoint now) {
    state_.set_last_confirmed_report(now);
    reset(now);
}

void StallDetector::reset(TimePoint now) {
    // Any sign of progress restarts both stall timers
    state_.set_last_era_advance(now);
    state_.set_last_confirmed_report(now);
    metrics_.era_update_delayed.set(0);
    metrics_.is_recovery_mode_active.set(0);
    if (state_.set_mode(OracleMode::kNormal, now)) {
        log::Info("Recovery mode is completed");
    }
}

OracleMode StallDetector::evaluate(TimePoint now) {
    const bool era_delayed{now - state_.last_era_advance() > thresholds_.era_update};
    const bool report_delayed{now - state_.last_confirmed_report() > thresholds_.report_delay};
    metrics_.era_update_delayed.set(era_delayed ? 1 : 0);

    if (era_delayed || report_delayed) {
        if (state_.set_mode(OracleMode::kRecovery, now)) {
            log::Warning("Starting recovery mode", {"era_update_delayed", era_delayed ? "true" : "false",
                                                    "report_delayed", report_delayed ? "true" : "false"});
        }
        metrics_.is_recovery_mode_active.set(1);
    }
    return state_.mode();
}

Task<void> StallDetector::run() {
    while (!stopped_) {
        timer_.expires_after(check_interval_);
        try {
            co_await timer_.async_wait(boost::asio::use_awaitable);
        } catch (const boost::system::system_error& se) {
            if (se.code() != boost::asio::error::operation_aborted) {
                throw;
            }
        }
        if (stopped_) {
            break;
        }
        evaluate(clock_());
    }
    log::Debug("StallDetector stopped");
}

void StallDetector::stop() {
    stopped_ = true;
    timer_.cancel();
}

}  // namespace stakeoracle::oracle
