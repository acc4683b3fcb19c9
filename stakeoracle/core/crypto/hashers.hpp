// Copyright 2025 The Stakeoracle Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

// Storage hashers used by Substrate runtimes to derive storage keys

#include <array>
#include <cstdint>

#include <stakeoracle/core/common/bytes.hpp>

namespace stakeoracle::crypto {

//! xxHash64 with seed 0, little endian
std::array<uint8_t, 8> twox_64(ByteView data);

//! Concatenation of xxHash64 with seeds 0 and 1, each little endian
std::array<uint8_t, 16> twox_128(ByteView data);

//! BLAKE2b with a 16-byte digest and no key
std::array<uint8_t, 16> blake2_128(ByteView data);

//! BLAKE2b with a 32-byte digest and no key
std::array<uint8_t, 32> blake2_256(ByteView data);

}  // namespace stakeoracle::crypto
