// Copyright 2025 The Stakeoracle Authors
// SPDX-License-Identifier: Apache-2.0

#include "oracle_key.hpp"

#include <cstring>
#include <fstream>
#include <stdexcept>

#include <stakeoracle/core/common/util.hpp>
#include <stakeoracle/core/crypto/secp256k1_context.hpp>

namespace stakeoracle::oracle {

OracleKey::OracleKey(Bytes private_key_data) : private_key_(std::move(private_key_data)) {
    SecP256K1Context ctx{/* allow_verify = */ false, /* allow_sign = */ true};
    if (!ctx.verify_private_key_data(private_key_)) {
        throw std::invalid_argument("Invalid oracle private key");
    }

    secp256k1_pubkey public_key;
    if (!ctx.create_public_key(&public_key, private_key_)) {
        throw std::invalid_argument("OracleKey failed to create a corresponding public key");
    }
    const Bytes serialized{ctx.serialize_public_key(&public_key, /* is_compressed = */ false)};
    // Skip the 0x04 prefix of the uncompressed form
    const auto hash{keccak256(ByteView{serialized}.substr(1))};
    std::memcpy(address_.bytes, hash.bytes + kHashLength - kAddressLength, kAddressLength);
}

OracleKey OracleKey::from_hex(std::string_view hex) {
    auto data{::stakeoracle::from_hex(hex)};
    if (!data) {
        throw std::invalid_argument("Oracle private key is not a hex string");
    }
    return OracleKey{std::move(*data)};
}

OracleKey OracleKey::from_file(const std::filesystem::path& path) {
    std::ifstream file{path};
    if (!file) {
        throw std::invalid_argument("Cannot open oracle private key file " + path.string());
    }
    std::string contents;
    file >> contents;
    if (contents.empty()) {
        throw std::invalid_argument("Oracle private key file " + path.string() + " is empty");
    }
    return from_hex(contents);
}

Transaction OracleKey::sign(const UnsignedTransaction& txn) const {
    SecP256K1Context ctx{/* allow_verify = */ false, /* allow_sign = */ true};
    const auto signing_hash{txn.signing_hash()};

    secp256k1_ecdsa_recoverable_signature signature;
    if (!ctx.sign_recoverable(&signature, ByteView{signing_hash.bytes}, private_key_)) {
        throw std::runtime_error("OracleKey::sign failed to sign the transaction");
    }
    const auto [compact, recovery_id] = ctx.serialize_recoverable_signature(&signature);

    Transaction signed_txn{txn};
    signed_txn.odd_y_parity = recovery_id != 0;
    signed_txn.r = intx::be::unsafe::load<intx::uint256>(compact.data());
    signed_txn.s = intx::be::unsafe::load<intx::uint256>(compact.data() + kHashLength);
    return signed_txn;
}

}  // namespace stakeoracle::oracle
