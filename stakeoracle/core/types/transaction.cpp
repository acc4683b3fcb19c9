// Copyright 2025 The Stakeoracle Authors
// SPDX-License-Identifier: Apache-2.0

#include "transaction.hpp"

#include <bit>
#include <cstring>

#include <stakeoracle/core/common/util.hpp>
#include <stakeoracle/core/rlp/encode.hpp>

namespace stakeoracle {

ethash::hash256 UnsignedTransaction::signing_hash() const {
    Bytes payload;
    rlp::encode_for_signing(payload, *this);
    return keccak256(payload);
}

evmc::bytes32 Transaction::hash() const {
    Bytes raw;
    rlp::encode(raw, *this);
    return std::bit_cast<evmc_bytes32>(keccak256(raw));
}

namespace rlp {

    static Header header_base(const UnsignedTransaction& txn) {
        Header h{.list = true};
        h.payload_length += length(txn.chain_id);
        h.payload_length += length(txn.nonce);
        h.payload_length += length(txn.max_priority_fee_per_gas);
        h.payload_length += length(txn.max_fee_per_gas);
        h.payload_length += length(txn.gas_limit);
        h.payload_length += kAddressLength + 1;
        h.payload_length += length(txn.value);
        h.payload_length += length(ByteView{txn.data});
        h.payload_length += 1;  // empty access list
        return h;
    }

    static void encode_base(Bytes& to, const UnsignedTransaction& txn, Header h) {
        to.push_back(kDynamicFeeTransactionType);
        encode_header(to, h);
        encode(to, txn.chain_id);
        encode(to, txn.nonce);
        encode(to, txn.max_priority_fee_per_gas);
        encode(to, txn.max_fee_per_gas);
        encode(to, txn.gas_limit);
        encode(to, ByteView{txn.to.bytes});
        encode(to, txn.value);
        encode(to, ByteView{txn.data});
        encode_header(to, {.list = true, .payload_length = 0});
    }

    void encode_for_signing(Bytes& to, const UnsignedTransaction& txn) {
        encode_base(to, txn, header_base(txn));
    }

    void encode(Bytes& to, const Transaction& txn) {
        Header h{header_base(txn)};
        h.payload_length += length(uint8_t{txn.odd_y_parity});
        h.payload_length += length(txn.r);
        h.payload_length += length(txn.s);

        encode_base(to, txn, h);
        encode(to, uint8_t{txn.odd_y_parity});
        encode(to, txn.r);
        encode(to, txn.s);
    }

}  // namespace rlp

}  // namespace stakeoracle
