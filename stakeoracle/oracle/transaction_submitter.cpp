// Copyright 2025 The Stakeoracle Authors
// SPDX-License-Identifier: Apache-2.0

#include "transaction_submitter.hpp"

#include <stakeoracle/core/common/util.hpp>
#include <stakeoracle/infra/common/log.hpp>
#include <stakeoracle/infra/concurrency/sleep.hpp>
#include <stakeoracle/oracle/endpoint_pool.hpp>
#include <stakeoracle/rpc/transport.hpp>

namespace stakeoracle::oracle {

static SubmissionOutcome outcome_of(const TransactionReceipt& receipt) {
    return receipt.success ? SubmissionOutcome::kConfirmed : SubmissionOutcome::kReverted;
}

Task<SubmissionOutcome> ContractSubmitter::submit(const Report& report) {
    SubmissionOutcome outcome{SubmissionOutcome::kNodeError};
    try {
        outcome = co_await do_submit(report);
    } catch (const NoHealthyEndpointError&) {
        metrics_.record_outcome(report.era, SubmissionOutcome::kNodeError);
        throw;
    }
    metrics_.record_outcome(report.era, outcome);
    log::Info("Report submitted", {"era", std::to_string(report.era),
                                   "stash", to_hex(report.stash),
                                   "outcome", std::string{to_string(outcome)}});
    co_return outcome;
}

Task<SubmissionOutcome> ContractSubmitter::do_submit(const Report& report) {
    const auto era{std::to_string(report.era)};
    const auto stash{to_hex(report.stash)};

    std::vector<evmc::bytes32> sent_hashes;
    std::optional<Transaction> last_sent;
    SubmissionOutcome outcome{SubmissionOutcome::kNodeError};

    for (int attempt{1}; attempt <= kMaxAttempts; ++attempt) {
        bool reverted_before_broadcast{false};
        try {
            if (!sent_hashes.empty()) {
                // The transaction sent before may have been mined meanwhile
                const auto receipt = co_await find_receipt(sent_hashes);
                if (receipt) {
                    co_return outcome_of(*receipt);
                }
            }

            std::optional<rpc::RpcError> revert;
            try {
                co_await master_.dry_run(report.calldata, builder_.settings().gas_limit);
            } catch (const rpc::RpcError& error) {
                revert = error;
            }
            if (revert) {
                log::Warning("Report would revert", {"era", era, "stash", stash, "reason", revert->message()});
                reverted_before_broadcast = true;
            } else {
                const auto txn = co_await builder_.build(report, last_sent ? &*last_sent : nullptr);
                log::Debug("Sending report transaction", {"era", era,
                                                          "stash", stash,
                                                          "nonce", std::to_string(txn.nonce),
                                                          "attempt", std::to_string(attempt)});
                const auto hash = co_await master_.send_raw_transaction(raw_transaction(txn));
                sent_hashes.push_back(hash);
                last_sent = txn;

                const auto receipt = co_await wait_receipt(sent_hashes);
                if (receipt) {
                    co_return outcome_of(*receipt);
                }
                log::Warning("Report transaction not mined in time", {"era", era, "stash", stash, "hash", to_hex(hash)});
                outcome = SubmissionOutcome::kTimeout;
            }
        } catch (const NoHealthyEndpointError&) {
            throw;
        } catch (const std::exception& e) {
            log::Warning("Report submission failed", {"era", era, "stash", stash, "error", e.what()});
            outcome = SubmissionOutcome::kNodeError;
        }
        if (reverted_before_broadcast) {
            co_return SubmissionOutcome::kReverted;
        }
    }
    co_return outcome;
}

Task<std::optional<TransactionReceipt>> ContractSubmitter::find_receipt(const std::vector<evmc::bytes32>& hashes) {
    for (const auto& hash : hashes) {
        auto receipt = co_await master_.transaction_receipt(hash);
        if (receipt) {
            co_return receipt;
        }
    }
    co_return std::nullopt;
}

Task<std::optional<TransactionReceipt>> ContractSubmitter::wait_receipt(const std::vector<evmc::bytes32>& hashes) {
    for (uint32_t attempt{1}; attempt <= polling_.attempts; ++attempt) {
        auto receipt = co_await find_receipt(hashes);
        if (receipt) {
            co_return receipt;
        }
        if (attempt < polling_.attempts) {
            co_await sleep(polling_.interval);
        }
    }
    co_return std::nullopt;
}

Task<SubmissionOutcome> DryRunSubmitter::submit(const Report& report) {
    const auto txn = co_await builder_.build(report);
    last_raw_transaction_ = raw_transaction(txn);
    metrics_.record_outcome(report.era, SubmissionOutcome::kDryRun);
    log::Info("Dry run: report not sent", {"era", std::to_string(report.era),
                                           "stash", to_hex(report.stash),
                                           "hash", to_hex(txn.hash())});
    co_return SubmissionOutcome::kDryRun;
}

}  // namespace stakeoracle::oracle
