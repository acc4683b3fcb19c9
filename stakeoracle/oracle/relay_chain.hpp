// Copyright 2025 The Stakeoracle Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <optional>

#include <stakeoracle/infra/concurrency/task.hpp>

#include <evmc/evmc.hpp>

#include <stakeoracle/oracle/types.hpp>

namespace stakeoracle::oracle {

//! Staking queries against the relay chain
class RelayChain {
  public:
    virtual ~RelayChain() = default;

    //! Active era at the given block or at the best block if none
    virtual Task<Era> active_era(std::optional<evmc::bytes32> block_hash) = 0;

    //! Staking parameters of the stash at the given block
    virtual Task<StakingParameters> staking_parameters(const StashAccount& stash, const evmc::bytes32& block_hash) = 0;

    virtual Task<BlockNum> finalized_head_number() = 0;

    //! Hash of the canonical block with the given number
    //! \throws std::runtime_error if there is no such block
    virtual Task<evmc::bytes32> block_hash(BlockNum block_num) = 0;
};

}  // namespace stakeoracle::oracle
