// Copyright 2025 The Stakeoracle Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <optional>
#include <utility>

#include <stakeoracle/infra/concurrency/task.hpp>

#include <evmc/evmc.hpp>
#include <intx/intx.hpp>

#include <stakeoracle/core/types/transaction.hpp>
#include <stakeoracle/oracle/oracle_key.hpp>
#include <stakeoracle/oracle/oracle_master.hpp>

namespace stakeoracle::oracle {

struct GasSettings {
    uint64_t gas_limit{10'000'000};
    intx::uint256 max_priority_fee{0};
    //! Derived from the base fee of the latest block if missing
    std::optional<intx::uint256> max_fee;
};

//! Builds and signs the EIP-1559 transactions carrying the reports
class TransactionBuilder {
  public:
    TransactionBuilder(OracleMaster& master, const OracleKey& key, const evmc::address& contract, GasSettings settings)
        : master_{master}, key_{key}, contract_{contract}, settings_{std::move(settings)} {}

    //! Build the transaction of the report with the fresh nonce and fees of the oracle account
    //! \param replaced the pending transaction to replace, whose fees are then bumped by at least 1/8
    Task<Transaction> build(const Report& report, const UnsignedTransaction* replaced = nullptr);

    const GasSettings& settings() const { return settings_; }

  private:
    OracleMaster& master_;
    const OracleKey& key_;
    evmc::address contract_;
    GasSettings settings_;
    std::optional<uint64_t> chain_id_;
};

//! Raw network form of the signed transaction
Bytes raw_transaction(const Transaction& txn);

}  // namespace stakeoracle::oracle
