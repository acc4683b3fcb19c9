// Copyright 2025 The Stakeoracle Authors
// SPDX-License-Identifier: Apache-2.0

#include "mode_state.hpp"

namespace stakeoracle::oracle {

std::string_view to_string(OracleMode mode) {
    switch (mode) {
        case OracleMode::kNormal:
            return "normal";
        case OracleMode::kRecovery:
            return "recovery";
    }
    return "unknown";
}

bool ModeState::set_mode(OracleMode mode, TimePoint now) {
    if (mode_.exchange(mode) == mode) {
        return false;
    }
    last_transition_.store(now);
    return true;
}

}  // namespace stakeoracle::oracle
