// Copyright 2025 The Stakeoracle Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <optional>
#include <vector>

#include <stakeoracle/infra/concurrency/task.hpp>

#include <evmc/evmc.hpp>
#include <intx/intx.hpp>

#include <stakeoracle/core/common/bytes.hpp>
#include <stakeoracle/oracle/types.hpp>

namespace stakeoracle::oracle {

//! Answer of isReportedLastEra for one oracle and stash
struct ReportedState {
    EraId era{0};
    bool reported{false};

    //! Last era reported by the oracle for the stash
    EraId reported_era() const { return reported ? era : era - 1; }
};

struct TransactionReceipt {
    evmc::bytes32 transaction_hash;
    BlockNum block_number{0};
    uint64_t gas_used{0};
    bool success{false};
};

//! OracleMaster contract and oracle account queries on the parachain
class OracleMaster {
  public:
    virtual ~OracleMaster() = default;

    virtual Task<EraId> current_era_id() = 0;
    virtual Task<ReportedState> is_reported_last_era(const StashAccount& stash) = 0;
    virtual Task<std::vector<StashAccount>> stash_accounts() = 0;

    virtual Task<intx::uint256> balance(const evmc::address& account) = 0;
    virtual Task<uint64_t> transaction_count(const evmc::address& account) = 0;
    virtual Task<uint64_t> chain_id() = 0;

    //! Base fee per gas of the latest block, zero before London
    virtual Task<intx::uint256> base_fee() = 0;

    //! Execute the contract call from the oracle address without committing it
    //! \throws rpc::RpcError if the call reverts
    virtual Task<void> dry_run(ByteView calldata, uint64_t gas_limit) = 0;

    virtual Task<evmc::bytes32> send_raw_transaction(ByteView raw_transaction) = 0;

    //! \return nullopt while the transaction is pending
    virtual Task<std::optional<TransactionReceipt>> transaction_receipt(const evmc::bytes32& hash) = 0;

    //! Code deployed at the contract address
    virtual Task<Bytes> code() = 0;
};

}  // namespace stakeoracle::oracle
