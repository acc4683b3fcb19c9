// Copyright 2025 The Stakeoracle Authors
// SPDX-License-Identifier: Apache-2.0

// RLP encoding of transaction envelopes as per
// https://ethereum.org/en/developers/docs/data-structures-and-encoding/rlp/

#pragma once

#include <intx/intx.hpp>

#include <stakeoracle/core/common/base.hpp>
#include <stakeoracle/core/common/bytes.hpp>

namespace stakeoracle::rlp {

struct Header {
    bool list{false};
    size_t payload_length{0};
};

inline constexpr uint8_t kEmptyStringCode{0x80};
inline constexpr uint8_t kEmptyListCode{0xC0};

//! \brief Big endian form of the value with leading zero bytes stripped (empty for zero)
Bytes big_compact(const intx::uint256& value);

void encode_header(Bytes& to, Header header);

void encode(Bytes& to, ByteView str);

template <UnsignedIntegral T>
void encode(Bytes& to, const T& n) {
    if (n == 0) {
        to.push_back(kEmptyStringCode);
    } else if (n < kEmptyStringCode) {
        to.push_back(static_cast<uint8_t>(n));
    } else {
        const Bytes be{big_compact(intx::uint256{n})};
        encode_header(to, {.list = false, .payload_length = be.size()});
        to.append(be);
    }
}

size_t length_of_length(uint64_t payload_length) noexcept;

size_t length(ByteView) noexcept;

template <UnsignedIntegral T>
size_t length(const T& n) noexcept {
    if (n < kEmptyStringCode) {
        return 1;
    }
    const size_t n_bytes{intx::count_significant_bytes(intx::uint256{n})};
    return n_bytes + length_of_length(n_bytes);
}

}  // namespace stakeoracle::rlp
