// Copyright 2025 The Stakeoracle Authors
// SPDX-License-Identifier: Apache-2.0

#include "report_builder.hpp"

#include <stakeoracle/core/abi/codec.hpp>

namespace stakeoracle::oracle {

Report build_report(EraId era, const StashAccount& stash, const StakingParameters& params) {
    std::vector<abi::Value> unlocking;
    unlocking.reserve(params.unlocking.size());
    for (const auto& chunk : params.unlocking) {
        unlocking.push_back(abi::Value::tuple({
            abi::Value::uint(intx::uint256{chunk.balance}),
            abi::Value::uint(chunk.era),
        }));
    }

    std::vector<abi::Value> claimed_rewards;
    claimed_rewards.reserve(params.claimed_rewards.size());
    for (const auto era_index : params.claimed_rewards) {
        claimed_rewards.push_back(abi::Value::uint(era_index));
    }

    auto oracle_data{abi::Value::tuple({
        abi::Value::bytes32(params.stash_account),
        abi::Value::bytes32(params.controller_account),
        abi::Value::uint(static_cast<uint8_t>(params.stake_status)),
        abi::Value::uint(intx::uint256{params.active_balance}),
        abi::Value::uint(intx::uint256{params.total_balance}),
        abi::Value::array(std::move(unlocking)),
        abi::Value::array(std::move(claimed_rewards)),
        abi::Value::uint(intx::uint256{params.stash_balance}),
        abi::Value::uint(params.slashing_spans),
    })};

    return Report{
        .era = era,
        .stash = stash,
        .calldata = abi::encode_call(kReportRelaySignature, {abi::Value::uint(era), std::move(oracle_data)}),
    };
}

}  // namespace stakeoracle::oracle
