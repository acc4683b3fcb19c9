// Copyright 2025 The Stakeoracle Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <filesystem>
#include <string>
#include <string_view>

#include <evmc/evmc.hpp>

#include <stakeoracle/core/common/bytes.hpp>
#include <stakeoracle/core/types/transaction.hpp>

namespace stakeoracle::oracle {

//! secp256k1 key pair of the oracle account on the parachain
class OracleKey {
  public:
    //! \throws std::invalid_argument if the data is not a valid secp256k1 private key
    explicit OracleKey(Bytes private_key_data);

    //! Parse a hex private key, with or without 0x prefix
    static OracleKey from_hex(std::string_view hex);

    //! Load the hex private key stored in the file, surrounding whitespace ignored
    static OracleKey from_file(const std::filesystem::path& path);

    //! Ethereum address: last 20 bytes of the Keccak hash of the uncompressed public key
    const evmc::address& address() const { return address_; }

    Transaction sign(const UnsignedTransaction& txn) const;

  private:
    Bytes private_key_;
    evmc::address address_;
};

}  // namespace stakeoracle::oracle
