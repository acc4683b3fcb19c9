// Copyright 2025 The Stakeoracle Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <chrono>
#include <functional>

#include <stakeoracle/infra/concurrency/task.hpp>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/steady_timer.hpp>

#include <stakeoracle/oracle/mode_state.hpp>
#include <stakeoracle/oracle/oracle_metrics.hpp>

namespace stakeoracle::oracle {

struct StallThresholds {
    //! Longest time without an active era advance
    std::chrono::seconds era_update;
    //! Longest time without a confirmed report
    std::chrono::seconds report_delay;
};

//! Switches the oracle to RECOVERY mode when the era or the reports stop advancing
class StallDetector {
  public:
    using Clock = ModeState::Clock;
    using TimePoint = ModeState::TimePoint;
    using ClockFunction = std::function<TimePoint()>;

    StallDetector(const boost::asio::any_io_executor& executor,
                  ModeState& state,
                  OracleMetrics& metrics,
                  StallThresholds thresholds,
                  std::chrono::milliseconds check_interval,
                  ClockFunction clock = Clock::now);

    //! A new active era has been seen on the relay chain
    void observe_era_advance(TimePoint now);

    //! A report has been confirmed on the parachain
    void observe_confirmed_report(TimePoint now);

    //! Evaluate the stall conditions at the given time
    OracleMode evaluate(TimePoint now);

    //! Evaluate the stall conditions every check interval until stopped
    Task<void> run();

    void stop();

    TimePoint now() const { return clock_(); }

  private:
    void reset(TimePoint now);

    ModeState& state_;
    OracleMetrics& metrics_;
    StallThresholds thresholds_;
    std::chrono::milliseconds check_interval_;
    ClockFunction clock_;
    boost::asio::steady_timer timer_;
    bool stopped_{false};
};

}  // namespace stakeoracle::oracle
