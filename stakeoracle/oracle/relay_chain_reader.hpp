// Copyright 2025 The Stakeoracle Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <functional>
#include <optional>
#include <string>

#include <stakeoracle/core/common/bytes.hpp>
#include <stakeoracle/oracle/chain_client.hpp>
#include <stakeoracle/oracle/relay_chain.hpp>

namespace stakeoracle::oracle {

//! RelayChain implementation reading SCALE-encoded runtime storage through state_getStorage
class RelayChainReader : public RelayChain {
  public:
    explicit RelayChainReader(ChainClient& client) : client_{client} {}

    Task<Era> active_era(std::optional<evmc::bytes32> block_hash) override;
    Task<StakingParameters> staking_parameters(const StashAccount& stash, const evmc::bytes32& block_hash) override;
    Task<BlockNum> finalized_head_number() override;
    Task<evmc::bytes32> block_hash(BlockNum block_num) override;

  private:
    //! Decoder of a storage value, the value being nullopt if the key is absent
    template <typename T>
    using StorageDecoder = std::function<T(const std::optional<Bytes>&)>;

    template <typename T>
    Task<T> storage(const Bytes& key, const std::optional<evmc::bytes32>& block_hash, StorageDecoder<T> decode);

    Task<StakeStatus> stake_status(const StashAccount& stash, const evmc::bytes32& block_hash);

    ChainClient& client_;
};

}  // namespace stakeoracle::oracle
