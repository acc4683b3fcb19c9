// Copyright 2025 The Stakeoracle Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>

#include <ethash/hash_types.hpp>
#include <evmc/evmc.hpp>
#include <intx/intx.hpp>

#include <stakeoracle/core/common/base.hpp>
#include <stakeoracle/core/common/bytes.hpp>

namespace stakeoracle {

//! EIP-2718 type of the only envelope the oracle emits
inline constexpr uint8_t kDynamicFeeTransactionType{0x02};

//! EIP-1559 transaction calling a contract, with an empty access list
struct UnsignedTransaction {
    uint64_t chain_id{0};
    uint64_t nonce{0};
    intx::uint256 max_priority_fee_per_gas{0};
    intx::uint256 max_fee_per_gas{0};
    uint64_t gas_limit{0};
    evmc::address to;
    intx::uint256 value{0};
    Bytes data;

    //! Keccak hash of the signing payload: keccak256(0x02 || rlp([chain_id, ..., access_list]))
    ethash::hash256 signing_hash() const;

    friend bool operator==(const UnsignedTransaction&, const UnsignedTransaction&) = default;
};

struct Transaction : public UnsignedTransaction {
    bool odd_y_parity{false};
    intx::uint256 r{0};
    intx::uint256 s{0};

    //! Hash of the network form, i.e. the transaction id returned by eth_sendRawTransaction
    evmc::bytes32 hash() const;

    friend bool operator==(const Transaction&, const Transaction&) = default;
};

namespace rlp {

    void encode_for_signing(Bytes& to, const UnsignedTransaction& txn);

    //! Network (raw) form as accepted by eth_sendRawTransaction
    void encode(Bytes& to, const Transaction& txn);

}  // namespace rlp

}  // namespace stakeoracle
