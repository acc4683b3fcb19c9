// Copyright 2025 The Stakeoracle Authors
// SPDX-License-Identifier: Apache-2.0

#include "oracle_metrics.hpp"

#include <string>

#include <stakeoracle/core/common/util.hpp>

namespace stakeoracle::oracle {

OracleMetrics::OracleMetrics(metrics::Registry& registry)
    : active_era_id{registry.gauge("active_era_id", "active era index")},
      era_update_delayed{registry.gauge("era_update_delayed", "the era has not been updated for a long time")},
      is_recovery_mode_active{registry.gauge("is_recovery_mode_active", "1, if the recovery mode, otherwise - the default mode")},
      last_era_reported{registry.gauge("last_era_reported", "the last era that the oracle has reported")},
      last_failed_era{registry.gauge("last_failed_era", "the last era for which sending the report ended with a revert")},
      previous_era_change_block_number{registry.gauge("previous_era_change_block_number", "block number of the previous era change")},
      para_exceptions_count{registry.counter("para_exceptions_count", "parachain exceptions count")},
      relay_exceptions_count{registry.counter("relay_exceptions_count", "relay chain exceptions count")},
      tx_revert{registry.histogram("tx_revert", "reverted transactions")},
      tx_success{registry.histogram("tx_success", "successful transactions")},
      registry_{registry} {
    for (const auto outcome : {SubmissionOutcome::kConfirmed, SubmissionOutcome::kReverted, SubmissionOutcome::kTimeout,
                               SubmissionOutcome::kNodeError, SubmissionOutcome::kDryRun}) {
        tx_outcome(outcome);
    }
}

void OracleMetrics::count_exception(Chain chain) {
    switch (chain) {
        case Chain::kRelay:
            relay_exceptions_count.increment();
            break;
        case Chain::kPara:
            para_exceptions_count.increment();
            break;
    }
}

void OracleMetrics::set_oracle_balance(const evmc::address& oracle, const intx::uint256& balance) {
    registry_.gauge("oracle_balance", "oracle balance to pay for transactions", {{"address", to_hex(oracle)}})
        .set(to_double(balance));
}

metrics::Counter& OracleMetrics::tx_outcome(SubmissionOutcome outcome) {
    return registry_.counter("tx_outcome", "outcome of each report submission", {{"outcome", std::string{to_string(outcome)}}});
}

void OracleMetrics::record_outcome(EraId era, SubmissionOutcome outcome) {
    tx_outcome(outcome).increment();
    switch (outcome) {
        case SubmissionOutcome::kConfirmed:
            tx_success.observe(1);
            break;
        case SubmissionOutcome::kReverted:
            tx_revert.observe(1);
            last_failed_era.set(static_cast<double>(era));
            break;
        default:
            break;
    }
}

}  // namespace stakeoracle::oracle
