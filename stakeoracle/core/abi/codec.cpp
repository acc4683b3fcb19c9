// Copyright 2025 The Stakeoracle Authors
// SPDX-License-Identifier: Apache-2.0

#include "codec.hpp"

#include <algorithm>
#include <limits>
#include <cstring>
#include <ranges>

#include <stakeoracle/core/common/assert.hpp>
#include <stakeoracle/core/common/util.hpp>

namespace stakeoracle::abi {

Selector selector(std::string_view signature) {
    const auto hash{keccak256(ByteView{reinterpret_cast<const uint8_t*>(signature.data()), signature.size()})};
    Selector out{};
    std::memcpy(out.data(), hash.bytes, kSelectorLength);
    return out;
}

static evmc::bytes32 to_word(const intx::uint256& value) {
    evmc::bytes32 word;
    intx::be::store(word.bytes, value);
    return word;
}

Value Value::uint(const intx::uint256& value) {
    return Value{Kind::kWord, to_word(value), {}};
}

Value Value::boolean(bool value) {
    return uint(value ? 1 : 0);
}

Value Value::address(const evmc::address& value) {
    evmc::bytes32 word;
    std::memcpy(word.bytes + kWordSize - kAddressLength, value.bytes, kAddressLength);
    return Value{Kind::kWord, word, {}};
}

Value Value::bytes32(const evmc::bytes32& value) {
    return Value{Kind::kWord, value, {}};
}

Value Value::array(std::vector<Value> items) {
    return Value{Kind::kArray, {}, std::move(items)};
}

Value Value::tuple(std::vector<Value> items) {
    return Value{Kind::kTuple, {}, std::move(items)};
}

bool Value::is_dynamic() const {
    switch (kind_) {
        case Kind::kWord:
            return false;
        case Kind::kArray:
            return true;
        case Kind::kTuple:
            return std::ranges::any_of(items_, [](const Value& v) { return v.is_dynamic(); });
    }
    return false;
}

size_t Value::head_size() const {
    if (kind_ == Kind::kTuple && !is_dynamic()) {
        size_t size{0};
        for (const auto& item : items_) size += item.head_size();
        return size;
    }
    return kWordSize;
}

static void encode_members(Bytes& to, const std::vector<Value>& members) {
    size_t head_size{0};
    for (const auto& member : members) {
        head_size += member.head_size();
    }

    const size_t head_start{to.size()};
    Bytes tail;
    for (const auto& member : members) {
        if (member.is_dynamic()) {
            to.append(to_word(head_size + tail.size()).bytes, kWordSize);
            member.encode(tail);
        } else {
            member.encode(to);
        }
    }
    STAKEORACLE_ASSERT(to.size() - head_start == head_size);
    to.append(tail);
}

void Value::encode(Bytes& to) const {
    switch (kind_) {
        case Kind::kWord:
            to.append(word_.bytes, kWordSize);
            break;
        case Kind::kArray:
            to.append(to_word(items_.size()).bytes, kWordSize);
            encode_members(to, items_);
            break;
        case Kind::kTuple:
            encode_members(to, items_);
            break;
    }
}

Bytes encode(const std::vector<Value>& values) {
    Bytes out;
    encode_members(out, values);
    return out;
}

Bytes encode_call(std::string_view signature, const std::vector<Value>& arguments) {
    const Selector function_selector{selector(signature)};
    Bytes out{function_selector.data(), function_selector.size()};
    encode_members(out, arguments);
    return out;
}

DecodingResult Decoder::word_at_offset(size_t offset, evmc::bytes32& out) const {
    if (offset > data_.size() || data_.size() - offset < kWordSize) {
        return tl::unexpected{DecodingError::kInputTooShort};
    }
    std::memcpy(out.bytes, data_.data() + offset, kWordSize);
    return {};
}

DecodingResult Decoder::word_at(size_t index, evmc::bytes32& out) const {
    return word_at_offset(index * kWordSize, out);
}

DecodingResult Decoder::uint256_at(size_t index, intx::uint256& out) const {
    evmc::bytes32 word;
    if (auto res{word_at(index, word)}; !res) return res;
    out = intx::be::load<intx::uint256>(word.bytes);
    return {};
}

DecodingResult Decoder::uint64_at(size_t index, uint64_t& out) const {
    intx::uint256 value;
    if (auto res{uint256_at(index, value)}; !res) return res;
    if (value > std::numeric_limits<uint64_t>::max()) {
        return tl::unexpected{DecodingError::kOverflow};
    }
    out = static_cast<uint64_t>(value);
    return {};
}

DecodingResult Decoder::boolean_at(size_t index, bool& out) const {
    intx::uint256 value;
    if (auto res{uint256_at(index, value)}; !res) return res;
    if (value > 1) {
        return tl::unexpected{DecodingError::kInvalidBool};
    }
    out = value == 1;
    return {};
}

DecodingResult Decoder::bytes32_array_at(size_t index, std::vector<evmc::bytes32>& out) const {
    uint64_t offset{0};
    if (auto res{uint64_at(index, offset)}; !res) return res;
    if (offset % kWordSize != 0 || offset > data_.size()) {
        return tl::unexpected{DecodingError::kInvalidOffset};
    }
    evmc::bytes32 word;
    if (auto res{word_at_offset(offset, word)}; !res) return res;
    const auto length{intx::be::load<intx::uint256>(word.bytes)};
    const size_t available_words{(data_.size() - offset) / kWordSize - 1};
    if (length > available_words) {
        return tl::unexpected{DecodingError::kInputTooShort};
    }
    out.clear();
    out.reserve(static_cast<size_t>(length));
    for (size_t i{0}; i < static_cast<size_t>(length); ++i) {
        if (auto res{word_at_offset(offset + (i + 1) * kWordSize, word)}; !res) return res;
        out.push_back(word);
    }
    return {};
}

}  // namespace stakeoracle::abi
