// Copyright 2025 The Stakeoracle Authors
// SPDX-License-Identifier: Apache-2.0

#include "util.hpp"

#include <algorithm>
#include <cctype>
#include <cstring>

namespace stakeoracle {

ByteView zeroless_view(ByteView data) {
    const auto is_zero_byte = [](const auto& b) { return b == 0x0; };
    const auto first_nonzero_byte_it{std::ranges::find_if_not(data, is_zero_byte)};
    return data.substr(static_cast<size_t>(std::distance(data.begin(), first_nonzero_byte_it)));
}

std::string to_hex(ByteView bytes, bool with_prefix) {
    static const char* kHexDigits{"0123456789abcdef"};
    std::string out(bytes.size() * 2 + (with_prefix ? 2 : 0), '\0');
    char* dest{out.data()};
    if (with_prefix) {
        *dest++ = '0';
        *dest++ = 'x';
    }
    for (const auto& b : bytes) {
        *dest++ = kHexDigits[b >> 4];    // Hi
        *dest++ = kHexDigits[b & 0x0f];  // Lo
    }
    return out;
}

std::string abridge(std::string_view input, size_t length) {
    if (input.length() <= length) {
        return std::string(input);
    }
    return std::string(input.substr(0, length)) + "...";
}

std::optional<uint8_t> decode_hex_digit(char ch) noexcept {
    if (ch >= '0' && ch <= '9') return static_cast<uint8_t>(ch - '0');
    if (ch >= 'a' && ch <= 'f') return static_cast<uint8_t>(ch - 'a' + 10);
    if (ch >= 'A' && ch <= 'F') return static_cast<uint8_t>(ch - 'A' + 10);
    return std::nullopt;
}

std::optional<Bytes> from_hex(std::string_view hex) noexcept {
    if (has_hex_prefix(hex)) {
        hex.remove_prefix(2);
    }
    if (hex.empty()) {
        return Bytes{};
    }

    const size_t pos(hex.length() & 1);  // "[0x]1" is legit and has to be treated as "[0x]01"
    Bytes out((hex.length() + pos) / 2, '\0');
    auto dst{out.begin()};
    if (pos) {
        const auto lo{decode_hex_digit(hex[0])};
        if (!lo) return std::nullopt;
        *dst++ = *lo;
    }
    for (size_t i{pos}; i < hex.length(); i += 2) {
        const auto hi{decode_hex_digit(hex[i])};
        const auto lo{decode_hex_digit(hex[i + 1])};
        if (!hi || !lo) return std::nullopt;
        *dst++ = static_cast<uint8_t>((*hi << 4) | *lo);
    }
    return out;
}

std::optional<evmc::address> address_from_hex(std::string_view hex) noexcept {
    const auto bytes{from_hex(hex)};
    if (!bytes || bytes->size() != kAddressLength) {
        return std::nullopt;
    }
    evmc::address address;
    std::memcpy(address.bytes, bytes->data(), kAddressLength);
    return address;
}

std::optional<evmc::bytes32> bytes32_from_hex(std::string_view hex) noexcept {
    const auto bytes{from_hex(hex)};
    if (!bytes || bytes->size() != kHashLength) {
        return std::nullopt;
    }
    evmc::bytes32 value;
    std::memcpy(value.bytes, bytes->data(), kHashLength);
    return value;
}

std::string to_quantity(uint64_t value) {
    return "0x" + intx::hex(intx::uint256{value});
}

std::string to_quantity(const intx::uint256& value) {
    return "0x" + intx::hex(value);
}

std::optional<uint64_t> parse_quantity(std::string_view hex) noexcept {
    const auto value{parse_quantity256(hex)};
    if (!value || *value > std::numeric_limits<uint64_t>::max()) {
        return std::nullopt;
    }
    return static_cast<uint64_t>(*value);
}

std::optional<intx::uint256> parse_quantity256(std::string_view hex) noexcept {
    if (!has_hex_prefix(hex)) {
        return std::nullopt;
    }
    hex.remove_prefix(2);
    if (hex.empty() || hex.length() > 64) {
        return std::nullopt;
    }
    intx::uint256 value{0};
    for (const char ch : hex) {
        const auto digit{decode_hex_digit(ch)};
        if (!digit) return std::nullopt;
        value = (value << 4) | intx::uint256{*digit};
    }
    return value;
}

inline bool case_insensitive_char_comparer(char a, char b) { return (tolower(a) == tolower(b)); }

bool iequals(const std::string_view a, const std::string_view b) {
    return (a.size() == b.size() && std::equal(a.begin(), a.end(), b.begin(), case_insensitive_char_comparer));
}

double to_double(const intx::uint256& n) noexcept {
    static constexpr double k2_64{18446744073709551616.};  // 2^64
    double res{static_cast<double>(n[3])};
    res = k2_64 * res + static_cast<double>(n[2]);
    res = k2_64 * res + static_cast<double>(n[1]);
    res = k2_64 * res + static_cast<double>(n[0]);
    return res;
}

std::string_view to_string(DecodingError error) {
    switch (error) {
        case DecodingError::kInputTooShort:
            return "input too short";
        case DecodingError::kInputTooLong:
            return "input too long";
        case DecodingError::kOverflow:
            return "overflow";
        case DecodingError::kInvalidCompactPrefix:
            return "invalid compact prefix";
        case DecodingError::kInvalidOptionTag:
            return "invalid option tag";
        case DecodingError::kInvalidBool:
            return "invalid bool";
        case DecodingError::kInvalidOffset:
            return "invalid offset";
        case DecodingError::kUnexpectedLength:
            return "unexpected length";
    }
    return "unknown decoding error";
}

}  // namespace stakeoracle
