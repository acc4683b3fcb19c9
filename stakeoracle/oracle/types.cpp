// Copyright 2025 The Stakeoracle Authors
// SPDX-License-Identifier: Apache-2.0

#include "types.hpp"

#include <stakeoracle/core/common/util.hpp>

namespace stakeoracle::oracle {

std::string_view to_string(Chain chain) {
    switch (chain) {
        case Chain::kRelay:
            return "relay";
        case Chain::kPara:
            return "para";
    }
    return "unknown";
}

std::string_view to_string(StakeStatus status) {
    switch (status) {
        case StakeStatus::kIdle:
            return "idle";
        case StakeStatus::kNominator:
            return "nominator";
        case StakeStatus::kValidator:
            return "validator";
        case StakeStatus::kNone:
            return "none";
    }
    return "unknown";
}

std::string_view to_string(SubmissionOutcome outcome) {
    switch (outcome) {
        case SubmissionOutcome::kConfirmed:
            return "confirmed";
        case SubmissionOutcome::kReverted:
            return "reverted";
        case SubmissionOutcome::kTimeout:
            return "timeout";
        case SubmissionOutcome::kNodeError:
            return "node_error";
        case SubmissionOutcome::kDryRun:
            return "dry_run";
    }
    return "unknown";
}

std::ostream& operator<<(std::ostream& out, const StakingParameters& params) {
    out << "stash: " << to_hex(params.stash_account)
        << " controller: " << to_hex(params.controller_account)
        << " status: " << to_string(params.stake_status)
        << " active: " << params.active_balance
        << " total: " << params.total_balance
        << " unlocking: [";
    for (size_t i{0}; i < params.unlocking.size(); ++i) {
        out << (i > 0 ? " " : "") << params.unlocking[i].balance << "@" << params.unlocking[i].era;
    }
    out << "] stash_balance: " << params.stash_balance
        << " slashing_spans: " << params.slashing_spans;
    return out;
}

}  // namespace stakeoracle::oracle
