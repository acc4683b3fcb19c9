// Copyright 2025 The Stakeoracle Authors
// SPDX-License-Identifier: Apache-2.0

#include "util.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

namespace stakeoracle {

using namespace evmc::literals;

TEST_CASE("Hex", "[core][common][util]") {
    CHECK_FALSE(decode_hex_digit('g').has_value());

    auto parsed_bytes = from_hex("");
    CHECK((parsed_bytes.has_value() && parsed_bytes->empty()));

    parsed_bytes = from_hex("0x");
    CHECK((parsed_bytes.has_value() && parsed_bytes->empty()));

    CHECK_FALSE(from_hex("0xg").has_value());

    parsed_bytes = from_hex("0xa1f");
    CHECK((parsed_bytes.has_value() && parsed_bytes.value() == Bytes{0x0a, 0x1f}));

    CHECK(to_hex(*from_hex("0x00FF10")) == "00ff10");
    CHECK(to_hex(*from_hex("abcd"), /*with_prefix=*/true) == "0xabcd");
}

TEST_CASE("Fixed size hex values", "[core][common][util]") {
    const auto address{address_from_hex("0x8a5a1b5b2b2ab27a1b2ec22a4fa7d9f4ac3c0e3c")};
    REQUIRE(address);
    CHECK(*address == 0x8a5a1b5b2b2ab27a1b2ec22a4fa7d9f4ac3c0e3c_address);
    CHECK(to_hex(*address) == "0x8a5a1b5b2b2ab27a1b2ec22a4fa7d9f4ac3c0e3c");

    CHECK_FALSE(address_from_hex("0x8a5a1b5b2b2ab27a1b2ec22a4fa7d9f4ac3c0e").has_value());
    CHECK_FALSE(bytes32_from_hex("0x01").has_value());

    const auto hash{bytes32_from_hex("0x000000000000000000000000000000000000000000000000000000000000002a")};
    REQUIRE(hash);
    CHECK(hash->bytes[31] == 0x2a);
}

TEST_CASE("JSON-RPC quantities", "[core][common][util]") {
    CHECK(to_quantity(uint64_t{0}) == "0x0");
    CHECK(to_quantity(uint64_t{1024}) == "0x400");
    CHECK(to_quantity(intx::uint256{10'000'000}) == "0x989680");

    CHECK(parse_quantity("0x400") == 1024u);
    CHECK(parse_quantity("0x0") == 0u);
    CHECK_FALSE(parse_quantity("400").has_value());
    CHECK_FALSE(parse_quantity("0x").has_value());
    CHECK_FALSE(parse_quantity("0x10000000000000000").has_value());
    CHECK(parse_quantity256("0x10000000000000000") == intx::uint256{1} << 64);
}

TEST_CASE("to_double", "[core][common][util]") {
    CHECK(to_double(intx::uint256{0}) == 0.0);
    CHECK(to_double(intx::uint256{1'000'000'000'000'000'000ull}) == Catch::Approx(1e18));
}

TEST_CASE("iequals", "[core][common][util]") {
    CHECK(iequals("DEBUG", "debug"));
    CHECK_FALSE(iequals("info", "infos"));
}

}  // namespace stakeoracle
