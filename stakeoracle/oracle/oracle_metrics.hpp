// Copyright 2025 The Stakeoracle Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <evmc/evmc.hpp>
#include <intx/intx.hpp>

#include <stakeoracle/infra/metrics/registry.hpp>
#include <stakeoracle/oracle/types.hpp>

namespace stakeoracle::oracle {

//! Metrics exported by the oracle, registered on construction
class OracleMetrics {
  public:
    explicit OracleMetrics(metrics::Registry& registry);

    OracleMetrics(const OracleMetrics&) = delete;
    OracleMetrics& operator=(const OracleMetrics&) = delete;

    void count_exception(Chain chain);
    void set_oracle_balance(const evmc::address& oracle, const intx::uint256& balance);

    //! Record the final outcome of one submit call
    void record_outcome(EraId era, SubmissionOutcome outcome);

    metrics::Gauge& active_era_id;
    metrics::Gauge& era_update_delayed;
    metrics::Gauge& is_recovery_mode_active;
    metrics::Gauge& last_era_reported;
    metrics::Gauge& last_failed_era;
    metrics::Gauge& previous_era_change_block_number;
    metrics::Counter& para_exceptions_count;
    metrics::Counter& relay_exceptions_count;
    metrics::Histogram& tx_revert;
    metrics::Histogram& tx_success;

    metrics::Counter& tx_outcome(SubmissionOutcome outcome);

  private:
    metrics::Registry& registry_;
};

}  // namespace stakeoracle::oracle
