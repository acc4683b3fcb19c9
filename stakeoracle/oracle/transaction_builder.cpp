// Copyright 2025 The Stakeoracle Authors
// SPDX-License-Identifier: Apache-2.0

#include "transaction_builder.hpp"

#include <algorithm>

namespace stakeoracle::oracle {

static intx::uint256 bumped(const intx::uint256& fee) {
    return fee + fee / 8;
}

Task<Transaction> TransactionBuilder::build(const Report& report, const UnsignedTransaction* replaced) {
    if (!chain_id_) {
        chain_id_ = co_await master_.chain_id();
    }

    const auto nonce = co_await master_.transaction_count(key_.address());

    UnsignedTransaction txn{
        .chain_id = *chain_id_,
        .nonce = nonce,
        .max_priority_fee_per_gas = settings_.max_priority_fee,
        .gas_limit = settings_.gas_limit,
        .to = contract_,
        .data = report.calldata,
    };
    if (settings_.max_fee) {
        txn.max_fee_per_gas = *settings_.max_fee;
    } else {
        const auto base_fee = co_await master_.base_fee();
        txn.max_fee_per_gas = base_fee + base_fee + txn.max_priority_fee_per_gas;
    }

    if (replaced && replaced->nonce == txn.nonce) {
        txn.max_priority_fee_per_gas = std::max(txn.max_priority_fee_per_gas, bumped(replaced->max_priority_fee_per_gas));
        txn.max_fee_per_gas = std::max(txn.max_fee_per_gas, bumped(replaced->max_fee_per_gas));
    }
    txn.max_fee_per_gas = std::max(txn.max_fee_per_gas, txn.max_priority_fee_per_gas);

    co_return key_.sign(txn);
}

Bytes raw_transaction(const Transaction& txn) {
    Bytes raw;
    rlp::encode(raw, txn);
    return raw;
}

}  // namespace stakeoracle::oracle
