// Copyright 2025 The Stakeoracle Authors
// SPDX-License-Identifier: Apache-2.0

#include "hashers.hpp"

#include <numeric>
#include <string_view>

#include <catch2/catch_test_macros.hpp>

#include <stakeoracle/core/common/util.hpp>

namespace stakeoracle::crypto {

static ByteView as_bytes(std::string_view s) {
    return {reinterpret_cast<const uint8_t*>(s.data()), s.size()};
}

TEST_CASE("twox hashers", "[core][crypto]") {
    CHECK(to_hex(twox_64(ByteView{})) == "99e9d85137db46ef");
    CHECK(to_hex(twox_128(as_bytes("Staking"))) == "5f3e4907f716ac89b6347d15ececedca");
    CHECK(to_hex(twox_128(as_bytes("ActiveEra"))) == "487df464e44a534ba6b0cbb32407b587");
    CHECK(to_hex(twox_128(as_bytes("System"))) == "26aa394eea5630e07c48ae0c9558cef7");
    CHECK(to_hex(twox_128(as_bytes("Account"))) == "b99d880ec681799c0cf30e8886371da9");

    std::array<uint8_t, 32> account{};
    std::iota(account.begin(), account.end(), uint8_t{0});
    CHECK(to_hex(twox_64(account)) == "b432ff16519cf5cb");
}

TEST_CASE("blake2 hashers", "[core][crypto]") {
    std::array<uint8_t, 32> account{};
    std::iota(account.begin(), account.end(), uint8_t{0});
    CHECK(to_hex(blake2_128(account)) == "f39a2cad58411cd49f577e5086b8031f");
    CHECK(to_hex(blake2_256(as_bytes("abc"))) == "bddd813c634239723171ef3fee98579b94964e3bb1cb3e427262c8c068d52319");
}

}  // namespace stakeoracle::crypto
