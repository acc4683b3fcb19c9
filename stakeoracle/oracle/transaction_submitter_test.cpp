// Copyright 2025 The Stakeoracle Authors
// SPDX-License-Identifier: Apache-2.0

#include "transaction_submitter.hpp"

#include <map>

#include <catch2/catch_test_macros.hpp>
#include <gmock/gmock.h>

#include <stakeoracle/core/common/util.hpp>
#include <stakeoracle/infra/test_util/log.hpp>
#include <stakeoracle/infra/test_util/task_runner.hpp>
#include <stakeoracle/oracle/endpoint_pool.hpp>
#include <stakeoracle/oracle/test_util/mock_oracle_master.hpp>
#include <stakeoracle/oracle/test_util/task_results.hpp>

namespace stakeoracle::oracle {

using namespace std::chrono_literals;
using namespace evmc::literals;
using testing::_;
using testing::Invoke;
using testing::InvokeWithoutArgs;

static constexpr auto kContract{0x4fa2d0c1bd9a5e0bd1e2a5a35c45f0dba5c0f6c9_address};
static constexpr auto kFirstHash{0x0101010101010101010101010101010101010101010101010101010101010101_bytes32};
static constexpr auto kSecondHash{0x0202020202020202020202020202020202020202020202020202020202020202_bytes32};
static constexpr uint64_t kEra{4201};

struct SubmitterTest {
    SubmitterTest() {
        ON_CALL(master, chain_id()).WillByDefault(InvokeWithoutArgs([]() { return test_util::ready<uint64_t>(1287); }));
        ON_CALL(master, transaction_count(_)).WillByDefault(InvokeWithoutArgs([]() { return test_util::ready<uint64_t>(3); }));
        ON_CALL(master, base_fee()).WillByDefault(InvokeWithoutArgs([]() {
            return test_util::ready(intx::uint256{1'000'000'000});
        }));
        ON_CALL(master, dry_run(_, _)).WillByDefault(InvokeWithoutArgs([]() { return test_util::ready(); }));
        ON_CALL(master, send_raw_transaction(_)).WillByDefault(Invoke([this](ByteView raw) {
            sent.emplace_back(raw);
            return test_util::ready(sent.size() == 1 ? kFirstHash : kSecondHash);
        }));
        ON_CALL(master, transaction_receipt(_)).WillByDefault(Invoke([this](const evmc::bytes32& hash) {
            receipt_queries.push_back(hash);
            return test_util::ready(receipts(hash));
        }));
    }

    std::optional<TransactionReceipt> receipts(const evmc::bytes32& hash) const {
        const auto it{mined.find(hash)};
        if (it == mined.end()) {
            return std::nullopt;
        }
        return TransactionReceipt{.transaction_hash = hash, .block_number = 100, .gas_used = 50'000, .success = it->second};
    }

    stakeoracle::test_util::SetLogVerbosityGuard log_guard{log::Level::kNone};
    stakeoracle::test_util::TaskRunner runner;
    testing::NiceMock<test_util::MockOracleMaster> master;
    metrics::Registry registry;
    OracleMetrics metrics{registry};
    OracleKey key{OracleKey::from_hex("0x0000000000000000000000000000000000000000000000000000000000000001")};
    TransactionBuilder builder{master, key, kContract, GasSettings{.gas_limit = 200'000, .max_priority_fee = 100}};
    ContractSubmitter submitter{master, builder, metrics, ReceiptPolling{.attempts = 3, .interval = 0ms}};
    Report report{.era = kEra, .stash = 0x11_bytes32, .calldata = *from_hex("0x12345678")};

    std::vector<Bytes> sent;
    std::vector<evmc::bytes32> receipt_queries;
    std::map<evmc::bytes32, bool> mined;
};

TEST_CASE_METHOD(SubmitterTest, "ContractSubmitter confirmed", "[oracle][transaction_submitter]") {
    mined[kFirstHash] = true;
    CHECK(runner.run(submitter.submit(report)) == SubmissionOutcome::kConfirmed);
    REQUIRE(sent.size() == 1);

    const auto expected{key.sign(UnsignedTransaction{
        .chain_id = 1287,
        .nonce = 3,
        .max_priority_fee_per_gas = 100,
        .max_fee_per_gas = 2'000'000'100,
        .gas_limit = 200'000,
        .to = kContract,
        .data = report.calldata,
    })};
    CHECK(sent[0] == raw_transaction(expected));

    CHECK(metrics.tx_outcome(SubmissionOutcome::kConfirmed).value() == 1);
    CHECK(metrics.tx_success.count() == 1);
    CHECK(metrics.tx_revert.count() == 0);
}

TEST_CASE_METHOD(SubmitterTest, "ContractSubmitter pre-flight revert", "[oracle][transaction_submitter]") {
    EXPECT_CALL(master, dry_run(_, 200'000)).WillOnce(InvokeWithoutArgs([]() {
        return test_util::failed<void>(rpc::RpcError{3, "execution reverted: era already reported"});
    }));
    EXPECT_CALL(master, send_raw_transaction(_)).Times(0);

    CHECK(runner.run(submitter.submit(report)) == SubmissionOutcome::kReverted);
    CHECK(sent.empty());
    CHECK(metrics.tx_outcome(SubmissionOutcome::kReverted).value() == 1);
    CHECK(metrics.tx_revert.count() == 1);
    CHECK(metrics.last_failed_era.value() == kEra);
}

TEST_CASE_METHOD(SubmitterTest, "ContractSubmitter reverted receipt", "[oracle][transaction_submitter]") {
    mined[kFirstHash] = false;
    CHECK(runner.run(submitter.submit(report)) == SubmissionOutcome::kReverted);
    CHECK(sent.size() == 1);
    CHECK(metrics.last_failed_era.value() == kEra);
}

TEST_CASE_METHOD(SubmitterTest, "ContractSubmitter timeout resubmits once", "[oracle][transaction_submitter]") {
    CHECK(runner.run(submitter.submit(report)) == SubmissionOutcome::kTimeout);
    REQUIRE(sent.size() == 2);
    CHECK(sent[0] != sent[1]);

    // Same nonce with both fees bumped by 1/8
    const auto replacement{key.sign(UnsignedTransaction{
        .chain_id = 1287,
        .nonce = 3,
        .max_priority_fee_per_gas = 112,
        .max_fee_per_gas = 2'250'000'112,
        .gas_limit = 200'000,
        .to = kContract,
        .data = report.calldata,
    })};
    CHECK(sent[1] == raw_transaction(replacement));

    CHECK(metrics.tx_outcome(SubmissionOutcome::kTimeout).value() == 1);
    CHECK(metrics.tx_outcome(SubmissionOutcome::kConfirmed).value() == 0);
}

TEST_CASE_METHOD(SubmitterTest, "ContractSubmitter replacement confirmed", "[oracle][transaction_submitter]") {
    mined[kSecondHash] = true;
    CHECK(runner.run(submitter.submit(report)) == SubmissionOutcome::kConfirmed);
    CHECK(sent.size() == 2);
    CHECK(metrics.tx_outcome(SubmissionOutcome::kConfirmed).value() == 1);
}

TEST_CASE_METHOD(SubmitterTest, "ContractSubmitter original mined while replacing", "[oracle][transaction_submitter]") {
    // Mined right after the last poll of the first attempt
    ON_CALL(master, transaction_receipt(_)).WillByDefault(Invoke([this](const evmc::bytes32& hash) {
        receipt_queries.push_back(hash);
        if (receipt_queries.size() > 3) {
            mined[kFirstHash] = true;
        }
        return test_util::ready(receipts(hash));
    }));
    CHECK(runner.run(submitter.submit(report)) == SubmissionOutcome::kConfirmed);
    CHECK(sent.size() == 1);
}

TEST_CASE_METHOD(SubmitterTest, "ContractSubmitter node error retried once", "[oracle][transaction_submitter]") {
    mined[kFirstHash] = true;

    SECTION("retry succeeds") {
        EXPECT_CALL(master, send_raw_transaction(_))
            .WillOnce(InvokeWithoutArgs([]() {
                return test_util::failed<evmc::bytes32>(rpc::TransportError{"connection reset"});
            }))
            .WillOnce(Invoke([this](ByteView raw) {
                sent.emplace_back(raw);
                return test_util::ready(kFirstHash);
            }));
        CHECK(runner.run(submitter.submit(report)) == SubmissionOutcome::kConfirmed);
        CHECK(sent.size() == 1);
    }

    SECTION("retry fails") {
        EXPECT_CALL(master, send_raw_transaction(_))
            .Times(2)
            .WillRepeatedly(InvokeWithoutArgs([]() {
                return test_util::failed<evmc::bytes32>(rpc::RpcError{-32000, "nonce too low"});
            }));
        CHECK(runner.run(submitter.submit(report)) == SubmissionOutcome::kNodeError);
        CHECK(metrics.tx_outcome(SubmissionOutcome::kNodeError).value() == 1);
    }
}

TEST_CASE_METHOD(SubmitterTest, "ContractSubmitter without parachain endpoints", "[oracle][transaction_submitter]") {
    EXPECT_CALL(master, dry_run(_, _)).WillOnce(InvokeWithoutArgs([]() {
        return test_util::failed<void>(NoHealthyEndpointError{Chain::kPara});
    }));
    CHECK_THROWS_AS(runner.run(submitter.submit(report)), NoHealthyEndpointError);
    CHECK(metrics.tx_outcome(SubmissionOutcome::kNodeError).value() == 1);
}

TEST_CASE_METHOD(SubmitterTest, "DryRunSubmitter", "[oracle][transaction_submitter]") {
    DryRunSubmitter dry_run_submitter{builder, metrics};
    EXPECT_CALL(master, send_raw_transaction(_)).Times(0);
    CHECK(runner.run(dry_run_submitter.submit(report)) == SubmissionOutcome::kDryRun);
    CHECK(metrics.tx_outcome(SubmissionOutcome::kDryRun).value() == 1);
    CHECK(metrics.tx_success.count() == 0);
    testing::Mock::VerifyAndClearExpectations(&master);

    // The same transaction is what a live submission would broadcast
    mined[kFirstHash] = true;
    CHECK(runner.run(submitter.submit(report)) == SubmissionOutcome::kConfirmed);
    REQUIRE(sent.size() == 1);
    CHECK(dry_run_submitter.last_raw_transaction() == sent[0]);
}

}  // namespace stakeoracle::oracle
