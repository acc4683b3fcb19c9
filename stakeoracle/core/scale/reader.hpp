// Copyright 2025 The Stakeoracle Authors
// SPDX-License-Identifier: Apache-2.0

// SCALE (Simple Concatenated Aggregate Little-Endian) decoding as per
// https://docs.substrate.io/reference/scale-codec/

#pragma once

#include <cstdint>

#include <evmc/evmc.hpp>
#include <intx/intx.hpp>

#include <stakeoracle/core/common/base.hpp>
#include <stakeoracle/core/common/bytes.hpp>
#include <stakeoracle/core/common/decoding_result.hpp>

namespace stakeoracle::scale {

//! Sequential reader over SCALE-encoded storage values; each read consumes input only on success
class Reader {
  public:
    explicit Reader(ByteView data) : data_{data} {}

    DecodingResult read_u8(uint8_t& out);
    DecodingResult read_u32(uint32_t& out);
    DecodingResult read_u64(uint64_t& out);
    DecodingResult read_u128(intx::uint128& out);

    //! Compact<u128>
    DecodingResult read_compact(intx::uint128& out);

    //! Compact<u32> used as collection length prefix
    DecodingResult read_length(size_t& out);

    //! Option<T> discriminant
    DecodingResult read_option_tag(bool& is_some);

    //! AccountId32
    DecodingResult read_account_id(evmc::bytes32& out);

    DecodingResult skip(size_t count);

    size_t remaining() const { return data_.size(); }
    bool empty() const { return data_.empty(); }

  private:
    DecodingResult take(size_t count, ByteView& out);

    ByteView data_;
};

}  // namespace stakeoracle::scale
