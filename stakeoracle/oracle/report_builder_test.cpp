// Copyright 2025 The Stakeoracle Authors
// SPDX-License-Identifier: Apache-2.0

#include "report_builder.hpp"

#include <catch2/catch_test_macros.hpp>

#include <stakeoracle/core/abi/codec.hpp>
#include <stakeoracle/core/common/util.hpp>

namespace stakeoracle::oracle {

using namespace evmc::literals;

static constexpr auto kStash{0x1111111111111111111111111111111111111111111111111111111111111111_bytes32};
static constexpr auto kController{0x2222222222222222222222222222222222222222222222222222222222222222_bytes32};

static StakingParameters sample_parameters() {
    return StakingParameters{
        .stash_account = kStash,
        .controller_account = kController,
        .stake_status = StakeStatus::kNominator,
        .active_balance = 500'000'000'000,
        .total_balance = 1'000'000'000'000,
        .unlocking = {UnlockingChunk{500'000'000'000, 4200}},
        .claimed_rewards = {},
        .stash_balance = 1'200'000'000'000,
        .slashing_spans = 2,
    };
}

static std::string word_at(const Bytes& calldata, size_t index) {
    return to_hex(ByteView{calldata}.substr(kSelectorLength + index * abi::kWordSize, abi::kWordSize));
}

static std::string word(uint64_t value) {
    return to_hex(abi::encode({abi::Value::uint(value)}));
}

TEST_CASE("build_report", "[oracle][report_builder]") {
    const auto params{sample_parameters()};
    const auto report{build_report(4201, kStash, params)};

    CHECK(report.era == 4201);
    CHECK(report.stash == kStash);

    SECTION("same inputs give identical calldata") {
        CHECK(build_report(4201, kStash, sample_parameters()).calldata == report.calldata);
        CHECK(build_report(4202, kStash, params).calldata != report.calldata);
    }

    SECTION("layout") {
        const auto& calldata{report.calldata};
        REQUIRE(calldata.size() == kSelectorLength + 15 * abi::kWordSize);
        const auto selector{abi::selector(kReportRelaySignature)};
        CHECK(ByteView{calldata}.substr(0, kSelectorLength) == ByteView{selector});

        CHECK(word_at(calldata, 0) == word(4201));
        CHECK(word_at(calldata, 1) == word(0x40));  // offset of the dynamic tuple
        // Tuple head
        CHECK(word_at(calldata, 2) == to_hex(kStash, /*with_prefix=*/false));
        CHECK(word_at(calldata, 3) == to_hex(kController, /*with_prefix=*/false));
        CHECK(word_at(calldata, 4) == word(1));
        CHECK(word_at(calldata, 5) == word(500'000'000'000));
        CHECK(word_at(calldata, 6) == word(1'000'000'000'000));
        CHECK(word_at(calldata, 7) == word(9 * 32));
        CHECK(word_at(calldata, 8) == word(12 * 32));
        CHECK(word_at(calldata, 9) == word(1'200'000'000'000));
        CHECK(word_at(calldata, 10) == word(2));
        // Unlocking chunks
        CHECK(word_at(calldata, 11) == word(1));
        CHECK(word_at(calldata, 12) == word(500'000'000'000));
        CHECK(word_at(calldata, 13) == word(4200));
        // Claimed rewards
        CHECK(word_at(calldata, 14) == word(0));
    }

    SECTION("stash without bond") {
        StakingParameters unbonded{.stash_account = kStash, .controller_account = kStash};
        const auto calldata{build_report(4201, kStash, unbonded).calldata};
        REQUIRE(calldata.size() == kSelectorLength + 13 * abi::kWordSize);
        CHECK(word_at(calldata, 3) == to_hex(kStash, /*with_prefix=*/false));
        CHECK(word_at(calldata, 4) == word(3));
        CHECK(word_at(calldata, 8) == word(10 * 32));
    }
}

}  // namespace stakeoracle::oracle
