// Copyright 2025 The Stakeoracle Authors
// SPDX-License-Identifier: Apache-2.0

// Contract ABI encoding and decoding as per
// https://docs.soliditylang.org/en/latest/abi-spec.html
// restricted to the static word types, dynamic arrays and tuples used by the OracleMaster contract

#pragma once

#include <array>
#include <string_view>
#include <vector>

#include <evmc/evmc.hpp>
#include <intx/intx.hpp>

#include <stakeoracle/core/common/base.hpp>
#include <stakeoracle/core/common/bytes.hpp>
#include <stakeoracle/core/common/decoding_result.hpp>

namespace stakeoracle::abi {

inline constexpr size_t kWordSize{32};

using Selector = std::array<uint8_t, kSelectorLength>;

//! \brief First 4 bytes of the Keccak hash of the canonical function signature
Selector selector(std::string_view signature);

//! Value of an ABI parameter: a single 32-byte word (uintN, bool, address, bytes32), a dynamic array T[] or a tuple
class Value {
  public:
    enum class Kind {
        kWord,
        kArray,
        kTuple,
    };

    static Value uint(const intx::uint256& value);
    static Value boolean(bool value);
    static Value address(const evmc::address& value);
    static Value bytes32(const evmc::bytes32& value);
    static Value array(std::vector<Value> items);
    static Value tuple(std::vector<Value> items);

    Kind kind() const { return kind_; }
    bool is_dynamic() const;

    //! Size of the encoding in the head of the enclosing tuple
    size_t head_size() const;

    void encode(Bytes& to) const;

  private:
    Value(Kind kind, evmc::bytes32 word, std::vector<Value> items)
        : kind_{kind}, word_{word}, items_{std::move(items)} {}

    Kind kind_;
    evmc::bytes32 word_;
    std::vector<Value> items_;
};

//! \brief Encode the values as the members of a tuple
Bytes encode(const std::vector<Value>& values);

//! \brief Encode a function call: selector followed by the encoded arguments
Bytes encode_call(std::string_view signature, const std::vector<Value>& arguments);

//! Random access reader over ABI-encoded return data
class Decoder {
  public:
    explicit Decoder(ByteView data) : data_{data} {}

    //! Read the word at the given head position (0-based word index)
    DecodingResult word_at(size_t index, evmc::bytes32& out) const;

    DecodingResult uint64_at(size_t index, uint64_t& out) const;
    DecodingResult boolean_at(size_t index, bool& out) const;
    DecodingResult uint256_at(size_t index, intx::uint256& out) const;

    //! Read the bytes32[] whose offset is stored at the given head position
    DecodingResult bytes32_array_at(size_t index, std::vector<evmc::bytes32>& out) const;

  private:
    DecodingResult word_at_offset(size_t offset, evmc::bytes32& out) const;

    ByteView data_;
};

}  // namespace stakeoracle::abi
