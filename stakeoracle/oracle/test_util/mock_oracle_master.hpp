// Copyright 2025 The Stakeoracle Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <optional>
#include <vector>

#include <gmock/gmock.h>

#include <stakeoracle/oracle/oracle_master.hpp>

namespace stakeoracle::oracle::test_util {

//! \brief gMock mock class for OracleMaster
class MockOracleMaster : public OracleMaster {
  public:
    MOCK_METHOD((Task<EraId>), current_era_id, (), (override));
    MOCK_METHOD((Task<ReportedState>), is_reported_last_era, (const StashAccount&), (override));
    MOCK_METHOD((Task<std::vector<StashAccount>>), stash_accounts, (), (override));
    MOCK_METHOD((Task<intx::uint256>), balance, (const evmc::address&), (override));
    MOCK_METHOD((Task<uint64_t>), transaction_count, (const evmc::address&), (override));
    MOCK_METHOD((Task<uint64_t>), chain_id, (), (override));
    MOCK_METHOD((Task<intx::uint256>), base_fee, (), (override));
    MOCK_METHOD((Task<void>), dry_run, (ByteView, uint64_t), (override));
    MOCK_METHOD((Task<evmc::bytes32>), send_raw_transaction, (ByteView), (override));
    MOCK_METHOD((Task<std::optional<TransactionReceipt>>), transaction_receipt, (const evmc::bytes32&), (override));
    MOCK_METHOD((Task<Bytes>), code, (), (override));
};

}  // namespace stakeoracle::oracle::test_util
