// Copyright 2025 The Stakeoracle Authors
// SPDX-License-Identifier: Apache-2.0

#include "reader.hpp"

#include <cstring>

namespace stakeoracle::scale {

static intx::uint128 load_le_u128(const uint8_t* src) {
    const auto lo{intx::le::unsafe::load<uint64_t>(src)};
    const auto hi{intx::le::unsafe::load<uint64_t>(src + 8)};
    return intx::uint128{lo, hi};
}

DecodingResult Reader::take(size_t count, ByteView& out) {
    if (data_.size() < count) {
        return tl::unexpected{DecodingError::kInputTooShort};
    }
    out = data_.substr(0, count);
    data_.remove_prefix(count);
    return {};
}

DecodingResult Reader::skip(size_t count) {
    ByteView ignored;
    return take(count, ignored);
}

DecodingResult Reader::read_u8(uint8_t& out) {
    ByteView bytes;
    if (auto res{take(1, bytes)}; !res) return res;
    out = bytes[0];
    return {};
}

DecodingResult Reader::read_u32(uint32_t& out) {
    ByteView bytes;
    if (auto res{take(sizeof(uint32_t), bytes)}; !res) return res;
    out = intx::le::unsafe::load<uint32_t>(bytes.data());
    return {};
}

DecodingResult Reader::read_u64(uint64_t& out) {
    ByteView bytes;
    if (auto res{take(sizeof(uint64_t), bytes)}; !res) return res;
    out = intx::le::unsafe::load<uint64_t>(bytes.data());
    return {};
}

DecodingResult Reader::read_u128(intx::uint128& out) {
    ByteView bytes;
    if (auto res{take(16, bytes)}; !res) return res;
    out = load_le_u128(bytes.data());
    return {};
}

DecodingResult Reader::read_compact(intx::uint128& out) {
    if (data_.empty()) {
        return tl::unexpected{DecodingError::kInputTooShort};
    }
    const uint8_t prefix{data_[0]};
    ByteView bytes;
    switch (prefix & 0b11) {
        case 0b00:
            if (auto res{take(1, bytes)}; !res) return res;
            out = prefix >> 2;
            return {};
        case 0b01:
            if (auto res{take(2, bytes)}; !res) return res;
            out = intx::le::unsafe::load<uint16_t>(bytes.data()) >> 2;
            return {};
        case 0b10:
            if (auto res{take(4, bytes)}; !res) return res;
            out = intx::le::unsafe::load<uint32_t>(bytes.data()) >> 2;
            return {};
        default:
            break;
    }

    // Big-integer mode: the upper six bits hold the byte count minus four
    const size_t length{static_cast<size_t>(prefix >> 2) + 4};
    if (length > 16) {
        return tl::unexpected{DecodingError::kOverflow};
    }
    if (auto res{skip(1)}; !res) return res;
    if (auto res{take(length, bytes)}; !res) return res;
    uint8_t padded[16]{};
    std::memcpy(padded, bytes.data(), length);
    out = load_le_u128(padded);
    return {};
}

DecodingResult Reader::read_length(size_t& out) {
    intx::uint128 value;
    if (auto res{read_compact(value)}; !res) return res;
    if (value > std::numeric_limits<uint32_t>::max()) {
        return tl::unexpected{DecodingError::kOverflow};
    }
    out = static_cast<size_t>(value);
    return {};
}

DecodingResult Reader::read_option_tag(bool& is_some) {
    uint8_t tag{0};
    if (auto res{read_u8(tag)}; !res) return res;
    if (tag > 1) {
        return tl::unexpected{DecodingError::kInvalidOptionTag};
    }
    is_some = tag == 1;
    return {};
}

DecodingResult Reader::read_account_id(evmc::bytes32& out) {
    ByteView bytes;
    if (auto res{take(kAccountIdLength, bytes)}; !res) return res;
    std::memcpy(out.bytes, bytes.data(), kAccountIdLength);
    return {};
}

}  // namespace stakeoracle::scale
