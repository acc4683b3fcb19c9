// Copyright 2025 The Stakeoracle Authors
// SPDX-License-Identifier: Apache-2.0

#include "graceful_shutdown.hpp"

#include <csignal>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>
#include <catch2/catch_test_macros.hpp>

#include <stakeoracle/infra/concurrency/sleep.hpp>
#include <stakeoracle/infra/test_util/log.hpp>

namespace stakeoracle::cmd::common {

using namespace std::chrono_literals;

//! Work that, once asked to stop, still needs `drain_time` to finish its in-flight step
struct DrainingWork {
    std::chrono::milliseconds drain_time;
    bool stop_requested{false};
    bool finished{false};

    Task<void> run(GracefulShutdown& shutdown) {
        while (!stop_requested) {
            co_await sleep(1ms);
        }
        co_await sleep(drain_time);
        finished = true;
        shutdown.notify_completed();
    }
};

static ShutdownReason run_scenario(DrainingWork& work, std::chrono::milliseconds grace, int signals) {
    boost::asio::io_context ioc;
    GracefulShutdown shutdown{ioc.get_executor(), grace, [&work]() { work.stop_requested = true; }};
    ShutdownReason resolved{ShutdownReason::kNone};
    shutdown.on_resolved([&](ShutdownReason reason) {
        resolved = reason;
        ioc.stop();
    });
    boost::asio::co_spawn(ioc, work.run(shutdown), boost::asio::detached);
    for (int i = 0; i < signals; ++i) {
        boost::asio::post(ioc, [&shutdown]() { shutdown.notify_signal(SIGTERM); });
    }
    ioc.run();
    return resolved;
}

TEST_CASE("GracefulShutdown", "[infra][cli][shutdown]") {
    test_util::SetLogVerbosityGuard log_guard{log::Level::kNone};

    SECTION("in-flight work completes within the grace period") {
        DrainingWork work{.drain_time = 20ms};
        CHECK(run_scenario(work, 2s, 1) == ShutdownReason::kCompleted);
        CHECK(work.stop_requested);
        CHECK(work.finished);
    }

    SECTION("grace period expiry does not wait for the work") {
        DrainingWork work{.drain_time = 5s};
        CHECK(run_scenario(work, 20ms, 1) == ShutdownReason::kGraceExpired);
        CHECK_FALSE(work.finished);
    }

    SECTION("second signal forces exit regardless of in-flight work") {
        DrainingWork work{.drain_time = 5s};
        CHECK(run_scenario(work, 10s, 2) == ShutdownReason::kForced);
        CHECK(work.stop_requested);
        CHECK_FALSE(work.finished);
    }

    SECTION("completion without any signal") {
        boost::asio::io_context ioc;
        bool stop_called{false};
        GracefulShutdown shutdown{ioc.get_executor(), 1s, [&]() { stop_called = true; }};
        shutdown.notify_completed();
        CHECK(shutdown.reason() == ShutdownReason::kCompleted);
        CHECK_FALSE(stop_called);
        shutdown.notify_signal(SIGINT);
        CHECK_FALSE(shutdown.is_draining());
    }
}

}  // namespace stakeoracle::cmd::common
