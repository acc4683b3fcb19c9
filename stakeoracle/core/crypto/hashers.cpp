// Copyright 2025 The Stakeoracle Authors
// SPDX-License-Identifier: Apache-2.0

#include "hashers.hpp"

#include <sodium.h>
#include <xxhash.h>

#include <intx/intx.hpp>

namespace stakeoracle::crypto {

static void store_xxh64(uint8_t* out, ByteView data, XXH64_hash_t seed) {
    const XXH64_hash_t hash{XXH64(data.data(), data.size(), seed)};
    intx::le::unsafe::store(out, static_cast<uint64_t>(hash));
}

std::array<uint8_t, 8> twox_64(ByteView data) {
    std::array<uint8_t, 8> out{};
    store_xxh64(out.data(), data, 0);
    return out;
}

std::array<uint8_t, 16> twox_128(ByteView data) {
    std::array<uint8_t, 16> out{};
    store_xxh64(out.data(), data, 0);
    store_xxh64(out.data() + 8, data, 1);
    return out;
}

template <size_t N>
static std::array<uint8_t, N> blake2b(ByteView data) {
    std::array<uint8_t, N> out{};
    crypto_generichash_blake2b(out.data(), out.size(), data.data(), data.size(), nullptr, 0);
    return out;
}

std::array<uint8_t, 16> blake2_128(ByteView data) {
    return blake2b<16>(data);
}

std::array<uint8_t, 32> blake2_256(ByteView data) {
    return blake2b<32>(data);
}

}  // namespace stakeoracle::crypto
