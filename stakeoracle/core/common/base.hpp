// Copyright 2025 The Stakeoracle Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

// The most common and basic concepts, types, and constants.

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <limits>

#include <intx/intx.hpp>

#include <stakeoracle/core/common/assert.hpp>

namespace stakeoracle {

using namespace std::string_view_literals;

template <class T>
concept UnsignedIntegral = std::unsigned_integral<T> || std::same_as<T, intx::uint128> ||
                           std::same_as<T, intx::uint256>;

//! Block number on either chain
using BlockNum = uint64_t;

//! Staking era index on the relay chain
using EraId = uint64_t;

inline constexpr size_t kAddressLength{20};

inline constexpr size_t kHashLength{32};

//! Length of a relay chain account identifier (sr25519/ed25519 public key)
inline constexpr size_t kAccountIdLength{32};

//! Length of an Ethereum function selector
inline constexpr size_t kSelectorLength{4};

}  // namespace stakeoracle
