// Copyright 2025 The Stakeoracle Authors
// SPDX-License-Identifier: Apache-2.0

#include "encode.hpp"

#include <stakeoracle/core/common/util.hpp>

namespace stakeoracle::rlp {

Bytes big_compact(const intx::uint256& value) {
    uint8_t full[32];
    intx::be::store(full, value);
    return Bytes{zeroless_view(ByteView{full})};
}

void encode_header(Bytes& to, Header header) {
    if (header.payload_length < 56) {
        const uint8_t code{header.list ? kEmptyListCode : kEmptyStringCode};
        to.push_back(static_cast<uint8_t>(code + header.payload_length));
    } else {
        const Bytes len_be{big_compact(intx::uint256{header.payload_length})};
        const uint8_t code = header.list ? 0xF7 : 0xB7;
        to.push_back(static_cast<uint8_t>(code + len_be.size()));
        to.append(len_be);
    }
}

size_t length_of_length(uint64_t payload_length) noexcept {
    if (payload_length < 56) {
        return 1;
    }
    return 1 + intx::count_significant_bytes(payload_length);
}

void encode(Bytes& to, ByteView s) {
    if (s.size() != 1 || s[0] >= kEmptyStringCode) {
        encode_header(to, {.list = false, .payload_length = s.size()});
    }
    to.append(s);
}

size_t length(ByteView s) noexcept {
    size_t len{s.size()};
    if (s.size() != 1 || s[0] >= kEmptyStringCode) {
        len += length_of_length(s.size());
    }
    return len;
}

}  // namespace stakeoracle::rlp
