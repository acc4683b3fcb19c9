// Copyright 2025 The Stakeoracle Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <chrono>
#include <optional>
#include <vector>

#include <stakeoracle/infra/concurrency/task.hpp>

#include <stakeoracle/oracle/oracle_master.hpp>
#include <stakeoracle/oracle/oracle_metrics.hpp>
#include <stakeoracle/oracle/transaction_builder.hpp>
#include <stakeoracle/oracle/types.hpp>

namespace stakeoracle::oracle {

//! Delivers the reports to the OracleMaster contract
class TransactionSubmitter {
  public:
    virtual ~TransactionSubmitter() = default;

    //! Submit the report, recording exactly one outcome in the metrics
    //! \throws NoHealthyEndpointError when the parachain runs out of endpoints
    virtual Task<SubmissionOutcome> submit(const Report& report) = 0;
};

struct ReceiptPolling {
    uint32_t attempts{60};
    std::chrono::milliseconds interval{std::chrono::seconds{2}};
};

//! Signs and broadcasts the reports, waiting for their receipts
class ContractSubmitter : public TransactionSubmitter {
  public:
    //! Broadcasts per submit call: the original transaction and at most one replacement
    static constexpr int kMaxAttempts{2};

    ContractSubmitter(OracleMaster& master, TransactionBuilder& builder, OracleMetrics& metrics, ReceiptPolling polling)
        : master_{master}, builder_{builder}, metrics_{metrics}, polling_{polling} {}

    Task<SubmissionOutcome> submit(const Report& report) override;

  private:
    Task<SubmissionOutcome> do_submit(const Report& report);

    //! Look for the receipt of any of the given transactions
    Task<std::optional<TransactionReceipt>> find_receipt(const std::vector<evmc::bytes32>& hashes);

    //! Poll the receipts up to the configured number of attempts
    Task<std::optional<TransactionReceipt>> wait_receipt(const std::vector<evmc::bytes32>& hashes);

    OracleMaster& master_;
    TransactionBuilder& builder_;
    OracleMetrics& metrics_;
    ReceiptPolling polling_;
};

//! Builds and signs the report transactions without ever broadcasting them
class DryRunSubmitter : public TransactionSubmitter {
  public:
    DryRunSubmitter(TransactionBuilder& builder, OracleMetrics& metrics) : builder_{builder}, metrics_{metrics} {}

    Task<SubmissionOutcome> submit(const Report& report) override;

    const Bytes& last_raw_transaction() const { return last_raw_transaction_; }

  private:
    TransactionBuilder& builder_;
    OracleMetrics& metrics_;
    Bytes last_raw_transaction_;
};

}  // namespace stakeoracle::oracle
