// Copyright 2025 The Stakeoracle Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <atomic>
#include <chrono>
#include <string_view>

namespace stakeoracle::oracle {

enum class OracleMode {
    kNormal,
    kRecovery,
};

std::string_view to_string(OracleMode mode);

//! Operating mode of the oracle with the timestamps driving it
//! \remarks Single writer, any number of readers
class ModeState {
  public:
    using Clock = std::chrono::steady_clock;
    using TimePoint = Clock::time_point;

    explicit ModeState(TimePoint now)
        : last_transition_{now}, last_era_advance_{now}, last_confirmed_report_{now} {}

    OracleMode mode() const { return mode_.load(); }

    //! \return true if the mode has changed
    bool set_mode(OracleMode mode, TimePoint now);

    TimePoint last_transition() const { return last_transition_.load(); }
    std::chrono::nanoseconds time_in_mode(TimePoint now) const { return now - last_transition(); }

    TimePoint last_era_advance() const { return last_era_advance_.load(); }
    void set_last_era_advance(TimePoint time) { last_era_advance_.store(time); }

    TimePoint last_confirmed_report() const { return last_confirmed_report_.load(); }
    void set_last_confirmed_report(TimePoint time) { last_confirmed_report_.store(time); }

  private:
    std::atomic<OracleMode> mode_{OracleMode::kNormal};
    std::atomic<TimePoint> last_transition_;
    std::atomic<TimePoint> last_era_advance_;
    std::atomic<TimePoint> last_confirmed_report_;
};

}  // namespace stakeoracle::oracle
