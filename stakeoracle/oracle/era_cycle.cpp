// Copyright 2025 The Stakeoracle Authors
// SPDX-License-Identifier: Apache-2.0

#include "era_cycle.hpp"

#include <algorithm>

#include <boost/asio/error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/system/system_error.hpp>

#include <stakeoracle/core/common/util.hpp>
#include <stakeoracle/infra/common/log.hpp>
#include <stakeoracle/oracle/endpoint_pool.hpp>
#include <stakeoracle/oracle/report_builder.hpp>

namespace stakeoracle::oracle {

EraCycle::EraCycle(const boost::asio::any_io_executor& executor,
                   RelayChain& relay,
                   OracleMaster& master,
                   TransactionSubmitter& submitter,
                   StallDetector& stall_detector,
                   OracleMetrics& metrics,
                   Reconnector reconnector,
                   EraCycleSettings settings)
    : relay_{relay},
      master_{master},
      submitter_{submitter},
      stall_detector_{stall_detector},
      metrics_{metrics},
      reconnector_{std::move(reconnector)},
      settings_{settings},
      timer_{executor},
      era_seen_at_{stall_detector.now()} {}

std::optional<EraId> EraCycle::last_era_reported(const StashAccount& stash) const {
    const auto it{last_era_reported_.find(stash)};
    if (it == last_era_reported_.end()) {
        return std::nullopt;
    }
    return it->second;
}

Task<void> EraCycle::restore_state() {
    log::Info("Restoring the state for each stash");
    const auto stashes = co_await master_.stash_accounts();
    for (const auto& stash : stashes) {
        const auto state = co_await master_.is_reported_last_era(stash);
        last_era_reported_[stash] = state.reported_era();
        log::Debug("Stash state restored", {"stash", to_hex(stash), "last_era_reported", std::to_string(state.reported_era())});
    }
    log::Info("States for each stash restored", {"stashes", std::to_string(stashes.size())});
    co_await update_oracle_balance();
}

Task<void> EraCycle::update_oracle_balance() {
    const auto balance = co_await master_.balance(settings_.oracle);
    metrics_.set_oracle_balance(settings_.oracle, balance);
}

Task<void> EraCycle::check_contract_era(EraId active_era) {
    const auto contract_era = co_await master_.current_era_id();
    if (contract_era != active_era) {
        log::Warning("OracleMaster era differs from the relay active era", {"relay", std::to_string(active_era),
                                                                           "contract", std::to_string(contract_era)});
    }
}

Task<CycleSummary> EraCycle::run_once() {
    CycleSummary summary;

    const auto era = co_await relay_.active_era(std::nullopt);
    summary.active_era = era.index;
    if (last_seen_era_ && era.index < *last_seen_era_) {
        // Eras never go back: the node is lagging behind the others
        log::Warning("Active era went backwards: ignored", {"era", std::to_string(era.index),
                                                            "last_seen_era", std::to_string(*last_seen_era_)});
        co_return summary;
    }
    metrics_.active_era_id.set(static_cast<double>(era.index));
    if (!last_seen_era_ || era.index > *last_seen_era_) {
        if (last_seen_era_) {
            log::Info("A new era has started", {"era", std::to_string(era.index)});
        }
        last_seen_era_ = era.index;
        era_seen_at_ = stall_detector_.now();
        stall_detector_.observe_era_advance(era_seen_at_);
    }
    co_await check_contract_era(era.index);

    if (era.index == 0 || (completed_era_ && *completed_era_ >= era.index)) {
        co_return summary;
    }
    summary.new_era = true;
    summary.reported_era = era.index - 1;
    const auto reported_era{std::to_string(summary.reported_era)};
    log::Info("Handling era change", {"active_era", std::to_string(era.index),
                                      "start", era.start ? std::to_string(*era.start) : "none"});

    const auto stashes = co_await master_.stash_accounts();
    if (stashes.empty()) {
        log::Info("No stash accounts found: waiting for the next era");
        completed_era_ = era.index;
        co_return summary;
    }

    std::vector<StashAccount> pending;
    for (const auto& stash : stashes) {
        auto& last_reported{last_era_reported_[stash]};
        if (last_reported < summary.reported_era) {
            const auto state = co_await master_.is_reported_last_era(stash);
            last_reported = std::max(last_reported, state.reported_era());
        }
        if (last_reported >= summary.reported_era) {
            log::Info("The report has already been sent", {"era", reported_era, "stash", to_hex(stash)});
            continue;
        }
        pending.push_back(stash);
    }
    if (pending.empty()) {
        summary.skipped = true;
        completed_era_ = era.index;
        metrics_.last_era_reported.set(static_cast<double>(summary.reported_era));
        co_return summary;
    }

    const auto last_block = co_await find_last_block(era.index);
    if (!co_await wait_until_finalized(last_block)) {
        summary.retry_pending = true;
        co_return summary;
    }
    metrics_.previous_era_change_block_number.set(static_cast<double>(last_block.number));

    for (const auto& stash : pending) {
        if (stop_requested_) {
            summary.retry_pending = true;
            break;
        }
        const auto stash_hex{to_hex(stash)};
        std::optional<std::string> failure;
        try {
            const auto params = co_await relay_.staking_parameters(stash, last_block.hash);
            log::Info("Staking parameters read", {"era", reported_era, "stash", stash_hex});
            STAKE_DEBUG << "EraCycle::run_once " << params;

            const auto outcome = co_await submitter_.submit(build_report(summary.reported_era, stash, params));
            ++summary.submissions;
            ++summary.outcomes[outcome];
            switch (outcome) {
                case SubmissionOutcome::kConfirmed:
                    stall_detector_.observe_confirmed_report(stall_detector_.now());
                    last_era_reported_[stash] = summary.reported_era;
                    break;
                case SubmissionOutcome::kReverted:
                case SubmissionOutcome::kDryRun:
                    last_era_reported_[stash] = summary.reported_era;
                    break;
                case SubmissionOutcome::kTimeout:
                case SubmissionOutcome::kNodeError:
                    summary.retry_pending = true;
                    break;
            }
            co_await update_oracle_balance();
        } catch (const NoHealthyEndpointError&) {
            throw;
        } catch (const std::exception& e) {
            failure = e.what();
        }
        if (failure) {
            log::Error("Stash report failed", {"era", reported_era, "stash", stash_hex, "error", *failure});
            ++summary.errors;
            summary.failures.push_back(StashFailure{stash, *failure});
            summary.retry_pending = true;
        }
    }

    if (!summary.retry_pending) {
        completed_era_ = era.index;
        metrics_.last_era_reported.set(static_cast<double>(summary.reported_era));
        log::Info("Waiting for the next era", {"reported_era", reported_era});
    }
    co_return summary;
}

Task<EraId> EraCycle::era_at(BlockNum block_num) {
    const auto hash = co_await relay_.block_hash(block_num);
    const auto era = co_await relay_.active_era(hash);
    co_return era.index;
}

Task<BlockRef> EraCycle::find_last_block(EraId era) {
    const auto finalized = co_await relay_.finalized_head_number();
    const BlockNum lowest{finalized > settings_.era_duration_in_blocks ? finalized - settings_.era_duration_in_blocks : 0};

    // Lower bound of the first block whose active era is at least the given one in [lowest, finalized]
    BlockNum low{lowest};
    BlockNum high{finalized + 1};
    while (low < high) {
        const BlockNum mid{low + (high - low) / 2};
        const auto mid_era = co_await era_at(mid);
        if (mid_era < era) {
            low = mid + 1;
        } else {
            high = mid;
        }
    }

    if (low > finalized || low == 0) {
        throw std::runtime_error{"start of era " + std::to_string(era) + " not found up to block " + std::to_string(finalized)};
    }
    const auto first_era = co_await era_at(low);
    if (first_era != era) {
        throw std::runtime_error{"era " + std::to_string(era) + " skipped at block " + std::to_string(low)};
    }
    if (low == lowest) {
        const auto previous_era = co_await era_at(low - 1);
        if (previous_era >= era) {
            throw std::runtime_error{"start of era " + std::to_string(era) + " is older than block " + std::to_string(lowest)};
        }
    }

    const auto last_hash = co_await relay_.block_hash(low - 1);
    const BlockRef last_block{.number = low - 1, .hash = last_hash};
    log::Info("Last block of the previous era found", {"number", std::to_string(last_block.number),
                                                        "hash", to_hex(last_block.hash)});
    co_return last_block;
}

Task<bool> EraCycle::wait_until_finalized(const BlockRef& block) {
    log::Debug("Waiting until the block is finalized", {"number", std::to_string(block.number)});
    while (co_await relay_.finalized_head_number() < block.number) {
        co_await pause(settings_.finalization_poll_interval);
        if (stop_requested_) {
            co_return false;
        }
    }
    const auto finalized_hash = co_await relay_.block_hash(block.number);
    if (finalized_hash != block.hash) {
        throw std::runtime_error{"block " + std::to_string(block.number) + " has been replaced before finalization"};
    }
    co_return true;
}

Task<void> EraCycle::wait_next_era() {
    const auto deadline{era_seen_at_ + settings_.era_duration};
    while (!stop_requested_) {
        std::chrono::milliseconds wait{settings_.frequency_of_requests};
        const auto now{stall_detector_.now()};
        if (deadline > now && deadline - now < wait) {
            wait = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        }
        log::Debug("Sleeping until the next request", {"ms", std::to_string(wait.count())});
        co_await pause(wait);
        if (stop_requested_) {
            break;
        }
        const auto era = co_await relay_.active_era(std::nullopt);
        if (!completed_era_ || era.index > *completed_era_) {
            co_return;
        }
    }
}

Task<void> EraCycle::pause(std::chrono::milliseconds duration) {
    if (stop_requested_) {
        co_return;
    }
    timer_.expires_after(duration);
    try {
        co_await timer_.async_wait(boost::asio::use_awaitable);
    } catch (const boost::system::system_error& se) {
        if (se.code() != boost::asio::error::operation_aborted) {
            throw;
        }
    }
}

Task<void> EraCycle::run() {
    bool restored{false};
    std::optional<StallDetector::TimePoint> outage_start;

    while (!stop_requested_) {
        bool no_endpoint{false};
        bool retry{false};
        std::optional<std::string> error;
        try {
            if (!restored) {
                co_await restore_state();
                restored = true;
            }
            const auto summary = co_await run_once();
            if (summary.retry_pending) {
                retry = true;
            } else if (!stop_requested_) {
                co_await wait_next_era();
            }
        } catch (const NoHealthyEndpointError& e) {
            no_endpoint = true;
            error = e.what();
        } catch (const std::exception& e) {
            error = e.what();
        }

        if (!no_endpoint) {
            // An endpoint answered: a later outage is measured from scratch
            outage_start.reset();
        }
        if (no_endpoint) {
            const auto now{stall_detector_.now()};
            if (!outage_start) {
                outage_start = now;
            } else if (now - *outage_start > settings_.recovery_patience) {
                throw FatalError{"no healthy endpoint for " + std::to_string(settings_.recovery_patience.count()) +
                                 " seconds: " + *error};
            }
            log::Warning("Starting reconnection", {"error", *error, "wait", std::to_string(settings_.timeout.count()) + "s"});
            co_await pause(settings_.timeout);
            if (stop_requested_) {
                break;
            }
            std::optional<std::string> reconnect_error;
            try {
                co_await reconnector_();
                outage_start.reset();
                log::Info("Reconnection completed");
            } catch (const NoHealthyEndpointError& e) {
                reconnect_error = e.what();
            }
            if (reconnect_error) {
                log::Warning("Reconnection failed", {"error", *reconnect_error});
            }
        } else if (error) {
            log::Error("Era cycle failed", {"active_era", last_seen_era_ ? std::to_string(*last_seen_era_) : "unknown",
                                            "error", *error});
            co_await pause(settings_.timeout);
        } else if (retry) {
            log::Info("Retrying the pending reports", {"wait", std::to_string(settings_.timeout.count()) + "s"});
            co_await pause(settings_.timeout);
        }
    }
    log::Info("Era cycle stopped");
}

void EraCycle::request_stop() {
    stop_requested_ = true;
    timer_.cancel();
}

}  // namespace stakeoracle::oracle
