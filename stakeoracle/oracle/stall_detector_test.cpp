// Copyright 2025 The Stakeoracle Authors
// SPDX-License-Identifier: Apache-2.0

#include "stall_detector.hpp"

#include <catch2/catch_test_macros.hpp>

#include <stakeoracle/infra/test_util/log.hpp>
#include <stakeoracle/infra/test_util/task_runner.hpp>

namespace stakeoracle::oracle {

using namespace std::chrono_literals;

struct StallDetectorTest {
    stakeoracle::test_util::SetLogVerbosityGuard log_guard{log::Level::kNone};
    stakeoracle::test_util::TaskRunner runner;
    metrics::Registry registry;
    OracleMetrics metrics{registry};
    ModeState::TimePoint start{ModeState::Clock::now()};
    ModeState::TimePoint fake_now{start};
    ModeState state{start};
    StallDetector detector{runner.executor(), state, metrics, StallThresholds{.era_update = 360s, .report_delay = 600s},
                           1ms, [this] { return fake_now; }};
};

TEST_CASE_METHOD(StallDetectorTest, "StallDetector era update threshold", "[oracle][stall_detector]") {
    CHECK(detector.evaluate(start + 360s) == OracleMode::kNormal);
    CHECK(metrics.era_update_delayed.value() == 0);
    CHECK(metrics.is_recovery_mode_active.value() == 0);

    CHECK(detector.evaluate(start + 361s) == OracleMode::kRecovery);
    CHECK(state.mode() == OracleMode::kRecovery);
    CHECK(state.last_transition() == start + 361s);
    CHECK(metrics.era_update_delayed.value() == 1);
    CHECK(metrics.is_recovery_mode_active.value() == 1);

    detector.observe_era_advance(start + 400s);
    CHECK(state.mode() == OracleMode::kNormal);
    CHECK(metrics.era_update_delayed.value() == 0);
    CHECK(metrics.is_recovery_mode_active.value() == 0);
    CHECK(detector.evaluate(start + 700s) == OracleMode::kNormal);
}

TEST_CASE_METHOD(StallDetectorTest, "StallDetector report delay threshold", "[oracle][stall_detector]") {
    detector.observe_era_advance(start + 300s);
    CHECK(detector.evaluate(start + 600s) == OracleMode::kNormal);
    // Era keeps advancing while no report gets confirmed
    state.set_last_era_advance(start + 590s);
    CHECK(detector.evaluate(start + 601s) == OracleMode::kNormal);
    state.set_last_era_advance(start + 900s);
    CHECK(detector.evaluate(start + 901s) == OracleMode::kRecovery);
    CHECK(metrics.era_update_delayed.value() == 0);
    CHECK(metrics.is_recovery_mode_active.value() == 1);

    detector.observe_confirmed_report(start + 902s);
    CHECK(state.mode() == OracleMode::kNormal);
    CHECK(state.last_era_advance() == start + 902s);
}

TEST_CASE_METHOD(StallDetectorTest, "StallDetector periodic check", "[oracle][stall_detector]") {
    fake_now = start + 361s;
    auto running = runner.spawn_future(detector.run());
    while (state.mode() != OracleMode::kRecovery) {
        runner.ioc().run_one();
    }
    detector.stop();
    runner.poll_context_until_future_is_ready(running);
    CHECK_NOTHROW(running.get());
    CHECK(metrics.is_recovery_mode_active.value() == 1);
}

}  // namespace stakeoracle::oracle
