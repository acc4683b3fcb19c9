// Copyright 2025 The Stakeoracle Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <iomanip>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

#include <ethash/keccak.hpp>
#include <evmc/evmc.hpp>
#include <intx/intx.hpp>

#include <stakeoracle/core/common/base.hpp>
#include <stakeoracle/core/common/bytes.hpp>
#include <stakeoracle/core/common/decoding_result.hpp>

// intx does not include operator<< overloading for uint<N>
namespace intx {

template <unsigned N>
inline std::ostream& operator<<(std::ostream& out, const uint<N>& value) {
    out << intx::to_string(value);
    return out;
}

}  // namespace intx

namespace stakeoracle {

//! \brief Strips leftmost zeroed bytes from byte sequence
ByteView zeroless_view(ByteView data);

inline bool has_hex_prefix(std::string_view s) {
    return s.length() >= 2 && s[0] == '0' && (s[1] == 'x' || s[1] == 'X');
}

//! \brief Returns a string representing the hex form of provided string of bytes
std::string to_hex(ByteView bytes, bool with_prefix = false);

inline std::string to_hex(const evmc::address& address, bool with_prefix = true) {
    return to_hex(ByteView{address.bytes}, with_prefix);
}

inline std::string to_hex(const evmc::bytes32& hash, bool with_prefix = true) {
    return to_hex(ByteView{hash.bytes}, with_prefix);
}

//! \brief Abridges a string to given length and eventually adds an ellipsis if input length is gt required length
std::string abridge(std::string_view input, size_t length);

std::optional<uint8_t> decode_hex_digit(char ch) noexcept;

//! \brief Parses a hex string, optionally 0x-prefixed, odd lengths being left-padded with a zero nibble
std::optional<Bytes> from_hex(std::string_view hex) noexcept;

//! \brief Parses an exact 20-byte hex address
std::optional<evmc::address> address_from_hex(std::string_view hex) noexcept;

//! \brief Parses an exact 32-byte hex value
std::optional<evmc::bytes32> bytes32_from_hex(std::string_view hex) noexcept;

//! \brief Encodes an unsigned quantity in the JSON-RPC hex form (0x-prefixed, no leading zeros)
std::string to_quantity(uint64_t value);
std::string to_quantity(const intx::uint256& value);

//! \brief Parses a JSON-RPC hex quantity, nullopt if malformed or overflowing
std::optional<uint64_t> parse_quantity(std::string_view hex) noexcept;
std::optional<intx::uint256> parse_quantity256(std::string_view hex) noexcept;

//! \brief Compares two strings for equality with case insensitivity
bool iequals(std::string_view a, std::string_view b);

inline ethash::hash256 keccak256(ByteView view) { return ethash::keccak256(view.data(), view.size()); }

//! \brief Lossy conversion used to export wei amounts as floating point metrics
double to_double(const intx::uint256& n) noexcept;

inline std::ostream& operator<<(std::ostream& out, ByteView bytes) {
    for (const auto& b : bytes) {
        out << std::hex << std::setw(2) << std::setfill('0') << int{b};
    }
    out << std::dec;
    return out;
}

}  // namespace stakeoracle
