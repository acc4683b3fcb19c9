// Copyright 2025 The Stakeoracle Authors
// SPDX-License-Identifier: Apache-2.0

#include "abi_checker.hpp"

#include <fstream>

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include <stakeoracle/infra/test_util/log.hpp>

namespace stakeoracle::oracle {

static const char* kOracleMasterAbi = R"([
  {"type": "constructor", "inputs": []},
  {"type": "event", "name": "ReportSubmitted", "inputs": [{"name": "eraId", "type": "uint64"}]},
  {"type": "function", "name": "getCurrentEraId", "inputs": [], "outputs": [{"type": "uint64"}]},
  {"type": "function", "name": "getStashAccounts", "inputs": [], "outputs": [{"type": "bytes32[]"}]},
  {"type": "function", "name": "isReportedLastEra", "inputs": [
    {"name": "_oracle", "type": "address"},
    {"name": "_stash", "type": "bytes32"}
  ]},
  {"type": "function", "name": "reportRelay", "inputs": [
    {"name": "_eraId", "type": "uint64"},
    {"name": "_report", "type": "tuple", "components": [
      {"name": "stashAccount", "type": "bytes32"},
      {"name": "controllerAccount", "type": "bytes32"},
      {"name": "stakeStatus", "type": "uint8"},
      {"name": "activeBalance", "type": "uint128"},
      {"name": "totalBalance", "type": "uint128"},
      {"name": "unlocking", "type": "tuple[]", "components": [
        {"name": "balance", "type": "uint128"},
        {"name": "era", "type": "uint64"}
      ]},
      {"name": "claimedRewards", "type": "uint32[]"},
      {"name": "stashBalance", "type": "uint128"},
      {"name": "slashingSpans", "type": "uint32"}
    ]}
  ]}
])";

TEST_CASE("canonical_signature", "[oracle][abi_checker]") {
    const auto abi{nlohmann::json::parse(kOracleMasterAbi)};
    CHECK(canonical_signature(abi[2]) == "getCurrentEraId()");
    CHECK(canonical_signature(abi[4]) == "isReportedLastEra(address,bytes32)");
    CHECK(canonical_signature(abi[5]) ==
          "reportRelay(uint64,(bytes32,bytes32,uint8,uint128,uint128,(uint128,uint64)[],uint32[],uint128,uint32))");
}

TEST_CASE("check_oracle_master_abi", "[oracle][abi_checker]") {
    stakeoracle::test_util::SetLogVerbosityGuard log_guard{log::Level::kNone};
    auto abi{nlohmann::json::parse(kOracleMasterAbi)};
    CHECK_NOTHROW(check_oracle_master_abi(abi));

    SECTION("missing function") {
        abi.erase(3);
        CHECK_THROWS_WITH(check_oracle_master_abi(abi), Catch::Matchers::ContainsSubstring("getStashAccounts()"));
    }

    SECTION("report with a different layout") {
        abi[5]["inputs"][1]["components"].erase(8);
        CHECK_THROWS_AS(check_oracle_master_abi(abi), std::invalid_argument);
    }
}

TEST_CASE("load_abi", "[oracle][abi_checker]") {
    const auto path{std::filesystem::temp_directory_path() / "stakeoracle_abi_checker_test.json"};

    SECTION("build artifact") {
        {
            std::ofstream file{path};
            file << R"({"contractName": "OracleMaster", "abi": )" << kOracleMasterAbi << "}";
        }
        CHECK(load_abi(path).size() == 6);
    }

    SECTION("bare array") {
        {
            std::ofstream file{path};
            file << kOracleMasterAbi;
        }
        CHECK(load_abi(path).size() == 6);
    }

    SECTION("not an ABI") {
        {
            std::ofstream file{path};
            file << R"({"contractName": "OracleMaster"})";
        }
        CHECK_THROWS_AS(load_abi(path), std::invalid_argument);
    }

    SECTION("invalid JSON") {
        {
            std::ofstream file{path};
            file << "[{";
        }
        CHECK_THROWS_AS(load_abi(path), std::invalid_argument);
    }

    std::filesystem::remove(path);
    CHECK_THROWS_AS(load_abi(path), std::invalid_argument);
}

}  // namespace stakeoracle::oracle
