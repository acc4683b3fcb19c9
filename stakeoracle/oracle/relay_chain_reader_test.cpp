// Copyright 2025 The Stakeoracle Authors
// SPDX-License-Identifier: Apache-2.0

#include "relay_chain_reader.hpp"

#include <map>

#include <catch2/catch_test_macros.hpp>

#include <stakeoracle/core/common/util.hpp>
#include <stakeoracle/infra/test_util/log.hpp>
#include <stakeoracle/infra/test_util/task_runner.hpp>
#include <stakeoracle/oracle/relay_storage.hpp>
#include <stakeoracle/oracle/test_util/fake_node.hpp>

namespace stakeoracle::oracle {

using namespace std::chrono_literals;
using namespace evmc::literals;

static constexpr auto kStash{0x1111111111111111111111111111111111111111111111111111111111111111_bytes32};
static constexpr auto kController{0x2222222222222222222222222222222222222222222222222222222222222222_bytes32};
static constexpr auto kBlockHash{0xabababababababababababababababababababababababababababababababab_bytes32};

static const std::string kAccountInfo{
    "0x05000000010000000100000000000000cb444271764eb6429d020000000000000000000000000000000000000000000000000000"
    "0000000000000000000000000000000000000000000000000000"};
static const std::string kLedger{
    "0x1111111111111111111111111111111111111111111111111111111111111111"
    "070010a5d4e8070088526a7404070088526a74a141080410000005100000"};
static const std::string kSlashingSpans{"0x02000000640000005a000000080a00000014000000"};

TEST_CASE("RelayChainReader", "[oracle][relay_chain_reader]") {
    stakeoracle::test_util::SetLogVerbosityGuard log_guard{log::Level::kNone};
    stakeoracle::test_util::TaskRunner runner;
    test_util::FakeNetwork network;
    metrics::Registry registry;
    OracleMetrics metrics{registry};
    EndpointPool pool{network.factory(), {"ws://relay:9944"}, {"ws://para:9944"}, 1s};
    ChainClient client{pool, metrics};
    RelayChainReader reader{client};

    auto& node{network.node("ws://relay:9944")};
    std::map<std::string, std::string> state;
    std::vector<nlohmann::json> storage_params;
    node.on("state_getStorage", [&](const nlohmann::json& params) -> nlohmann::json {
        storage_params.push_back(params);
        const auto it{state.find(params[0].get<std::string>())};
        if (it == state.end()) {
            return nullptr;
        }
        return it->second;
    });
    const auto key = [](const Bytes& k) { return to_hex(k, /*with_prefix=*/true); };

    SECTION("active era at best block") {
        state[key(relay_storage::active_era_key())] = "0x2a0000000100e40b5402000000";
        const auto era{runner.run(reader.active_era(std::nullopt))};
        CHECK(era.index == 42);
        CHECK(era.start == 10'000'000'000u);
        REQUIRE(storage_params.size() == 1);
        CHECK(storage_params[0].size() == 1);
    }

    SECTION("active era at given block") {
        state[key(relay_storage::active_era_key())] = "0x2a00000000";
        const auto era{runner.run(reader.active_era(kBlockHash))};
        CHECK(era.index == 42);
        CHECK_FALSE(era.start);
        REQUIRE(storage_params.size() == 1);
        CHECK(storage_params[0][1] == to_hex(kBlockHash));
    }

    SECTION("missing active era") {
        CHECK_THROWS_AS(runner.run(reader.active_era(std::nullopt)), std::runtime_error);
        CHECK(metrics.relay_exceptions_count.value() == 1);
        CHECK(pool.endpoints(Chain::kRelay)[0]->state() == EndpointState::kFailed);
    }

    SECTION("malformed active era") {
        state[key(relay_storage::active_era_key())] = "0x2a000000";
        CHECK_THROWS_AS(runner.run(reader.active_era(std::nullopt)), std::runtime_error);
        CHECK(metrics.relay_exceptions_count.value() == 1);
    }

    SECTION("staking parameters") {
        state[key(relay_storage::system_account_key(kStash))] = kAccountInfo;
        state[key(relay_storage::bonded_key(kStash))] = to_hex(kController);
        state[key(relay_storage::ledger_key(kController))] = kLedger;
        state[key(relay_storage::slashing_spans_key(kController))] = kSlashingSpans;

        SECTION("nominator") {
            state[key(relay_storage::nominators_key(kStash))] = "0x00";
            const auto params{runner.run(reader.staking_parameters(kStash, kBlockHash))};
            CHECK(params.stash_account == kStash);
            CHECK(params.controller_account == kController);
            CHECK(params.stake_status == StakeStatus::kNominator);
            CHECK(params.total_balance == 1'000'000'000'000);
            CHECK(params.active_balance == 500'000'000'000);
            REQUIRE(params.unlocking.size() == 1);
            CHECK(params.unlocking[0] == UnlockingChunk{500'000'000'000, 4200});
            CHECK(params.claimed_rewards.empty());
            CHECK(params.stash_balance == intx::from_string<intx::uint128>("12345678901234567890123"));
            CHECK(params.slashing_spans == 2);
            for (const auto& p : storage_params) {
                CHECK(p[1] == to_hex(kBlockHash));
            }
        }

        SECTION("validator") {
            state[key(relay_storage::session_validators_key())] = "0x04" + to_hex(kStash, /*with_prefix=*/false);
            const auto params{runner.run(reader.staking_parameters(kStash, kBlockHash))};
            CHECK(params.stake_status == StakeStatus::kValidator);
        }

        SECTION("idle") {
            state[key(relay_storage::session_validators_key())] = "0x04" + to_hex(kController, /*with_prefix=*/false);
            const auto params{runner.run(reader.staking_parameters(kStash, kBlockHash))};
            CHECK(params.stake_status == StakeStatus::kIdle);
        }

        SECTION("no slashing spans") {
            state.erase(key(relay_storage::slashing_spans_key(kController)));
            state[key(relay_storage::nominators_key(kStash))] = "0x00";
            const auto params{runner.run(reader.staking_parameters(kStash, kBlockHash))};
            CHECK(params.slashing_spans == 0);
        }
    }

    SECTION("stash without bond") {
        state[key(relay_storage::system_account_key(kStash))] = kAccountInfo;
        const auto params{runner.run(reader.staking_parameters(kStash, kBlockHash))};
        CHECK(params.stake_status == StakeStatus::kNone);
        CHECK(params.controller_account == kStash);
        CHECK(params.total_balance == 0);
        CHECK(params.active_balance == 0);
        CHECK(params.unlocking.empty());
        CHECK(params.slashing_spans == 0);
        CHECK(params.stash_balance == intx::from_string<intx::uint128>("12345678901234567890123"));
    }

    SECTION("finalized head number") {
        node.reply("chain_getFinalizedHead", to_hex(kBlockHash));
        node.on("chain_getHeader", [](const nlohmann::json& params) -> nlohmann::json {
            if (params[0] != to_hex(kBlockHash)) {
                return nullptr;
            }
            return {{"number", "0x1a2b"}, {"parentHash", to_hex(kController)}};
        });
        CHECK(runner.run(reader.finalized_head_number()) == 0x1a2b);
    }

    SECTION("block hash") {
        node.on("chain_getBlockHash", [](const nlohmann::json& params) -> nlohmann::json {
            if (params[0] == 100) {
                return to_hex(kBlockHash);
            }
            return nullptr;
        });
        CHECK(runner.run(reader.block_hash(100)) == kBlockHash);
        CHECK_THROWS_AS(runner.run(reader.block_hash(101)), std::runtime_error);
    }
}

TEST_CASE("RelayChainReader fails over on unusable storage replies", "[oracle][relay_chain_reader]") {
    stakeoracle::test_util::SetLogVerbosityGuard log_guard{log::Level::kNone};
    stakeoracle::test_util::TaskRunner runner;
    test_util::FakeNetwork network;
    metrics::Registry registry;
    OracleMetrics metrics{registry};
    EndpointPool pool{network.factory(), {"ws://relay-1:9944", "ws://relay-2:9944"}, {"ws://para:9944"}, 1s};
    ChainClient client{pool, metrics};
    RelayChainReader reader{client};

    auto& lagging{network.node("ws://relay-1:9944")};
    auto& synced{network.node("ws://relay-2:9944")};
    synced.reply("state_getStorage", "0x2a0000000100e40b5402000000");

    SECTION("empty active era") {
        lagging.reply("state_getStorage", nullptr);
    }

    SECTION("invalid hex") {
        lagging.reply("state_getStorage", "0xzz");
    }

    SECTION("undecodable value") {
        lagging.reply("state_getStorage", "0x2a");
    }

    SECTION("not a string") {
        lagging.reply("state_getStorage", {{"value", 42}});
    }

    const auto era{runner.run(reader.active_era(std::nullopt))};
    CHECK(era.index == 42);
    CHECK(metrics.relay_exceptions_count.value() == 1);
    CHECK(metrics.para_exceptions_count.value() == 0);
    CHECK(pool.endpoints(Chain::kRelay)[0]->state() == EndpointState::kFailed);
    CHECK(synced.calls.size() == 1);
}

}  // namespace stakeoracle::oracle
