// Copyright 2025 The Stakeoracle Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <chrono>
#include <functional>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <stakeoracle/infra/concurrency/task.hpp>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/steady_timer.hpp>
#include <evmc/evmc.hpp>

#include <stakeoracle/oracle/oracle_master.hpp>
#include <stakeoracle/oracle/oracle_metrics.hpp>
#include <stakeoracle/oracle/relay_chain.hpp>
#include <stakeoracle/oracle/stall_detector.hpp>
#include <stakeoracle/oracle/transaction_submitter.hpp>
#include <stakeoracle/oracle/types.hpp>

namespace stakeoracle::oracle {

//! Unrecoverable condition terminating the oracle
class FatalError : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
};

struct EraCycleSettings {
    uint64_t era_duration_in_blocks{0};
    std::chrono::seconds era_duration{0};
    std::chrono::seconds frequency_of_requests{180};
    //! Pause before retrying a failed cycle or reconnecting
    std::chrono::seconds timeout{60};
    //! Longest endpoint outage tolerated before giving up
    std::chrono::seconds recovery_patience{600};
    std::chrono::milliseconds finalization_poll_interval{1000};
    evmc::address oracle;
};

struct StashFailure {
    StashAccount stash;
    std::string error;
};

//! Result of one era cycle pass
struct CycleSummary {
    EraId active_era{0};
    //! Era the reports of this pass are about, i.e. the one before the active era
    EraId reported_era{0};
    bool new_era{false};
    //! Every stash had already been reported
    bool skipped{false};
    size_t submissions{0};
    size_t errors{0};
    std::map<SubmissionOutcome, size_t> outcomes;
    std::vector<StashFailure> failures;
    //! Some stashes still need a report for the era
    bool retry_pending{false};
};

//! Drives the per-era reporting: reads the relay staking state at the end of each era and reports it per stash
class EraCycle {
  public:
    using Reconnector = std::function<Task<void>()>;

    EraCycle(const boost::asio::any_io_executor& executor,
             RelayChain& relay,
             OracleMaster& master,
             TransactionSubmitter& submitter,
             StallDetector& stall_detector,
             OracleMetrics& metrics,
             Reconnector reconnector,
             EraCycleSettings settings);

    EraCycle(const EraCycle&) = delete;
    EraCycle& operator=(const EraCycle&) = delete;

    //! Load the last reported era of each stash from the contract
    Task<void> restore_state();

    //! Run one pass of the cycle
    Task<CycleSummary> run_once();

    //! Locate the last block of the era preceding the given one
    //! \throws std::runtime_error if the era change is not within the last era_duration_in_blocks finalized blocks
    Task<BlockRef> find_last_block(EraId era);

    //! Wait until a new active era is observed or a stop is requested
    Task<void> wait_next_era();

    //! Loop over the cycle passes until a stop is requested
    //! \throws FatalError if the endpoints stay unavailable beyond the recovery patience
    Task<void> run();

    //! Let the in-flight submission finish, then stop before the next stash or wake-up
    void request_stop();

    bool stop_requested() const { return stop_requested_; }

    std::optional<EraId> last_era_reported(const StashAccount& stash) const;

  private:
    Task<EraId> era_at(BlockNum block_num);

    //! \return false if a stop has been requested meanwhile
    Task<bool> wait_until_finalized(const BlockRef& block);

    Task<void> check_contract_era(EraId active_era);
    Task<void> update_oracle_balance();

    //! Sleep for the given duration unless a stop is requested
    Task<void> pause(std::chrono::milliseconds duration);

    RelayChain& relay_;
    OracleMaster& master_;
    TransactionSubmitter& submitter_;
    StallDetector& stall_detector_;
    OracleMetrics& metrics_;
    Reconnector reconnector_;
    EraCycleSettings settings_;
    boost::asio::steady_timer timer_;
    bool stop_requested_{false};

    std::map<StashAccount, EraId> last_era_reported_;
    std::optional<EraId> last_seen_era_;
    //! Active era whose previous era has been completely reported
    std::optional<EraId> completed_era_;
    StallDetector::TimePoint era_seen_at_;
};

}  // namespace stakeoracle::oracle
