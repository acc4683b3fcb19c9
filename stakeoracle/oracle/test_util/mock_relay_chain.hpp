// Copyright 2025 The Stakeoracle Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <optional>

#include <gmock/gmock.h>

#include <stakeoracle/oracle/relay_chain.hpp>

namespace stakeoracle::oracle::test_util {

//! \brief gMock mock class for RelayChain
class MockRelayChain : public RelayChain {
  public:
    MOCK_METHOD((Task<Era>), active_era, (std::optional<evmc::bytes32>), (override));
    MOCK_METHOD((Task<StakingParameters>), staking_parameters, (const StashAccount&, const evmc::bytes32&), (override));
    MOCK_METHOD((Task<BlockNum>), finalized_head_number, (), (override));
    MOCK_METHOD((Task<evmc::bytes32>), block_hash, (BlockNum), (override));
};

}  // namespace stakeoracle::oracle::test_util
