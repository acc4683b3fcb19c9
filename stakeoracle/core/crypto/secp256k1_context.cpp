// Copyright 2025 The Stakeoracle Authors
// SPDX-License-Identifier: Apache-2.0

#include "secp256k1_context.hpp"

namespace stakeoracle {

Bytes SecP256K1Context::serialize_public_key(const secp256k1_pubkey* public_key, bool is_compressed) const {
    size_t data_size = is_compressed ? kPublicKeySizeCompressed : kPublicKeySizeUncompressed;
    Bytes data(data_size, 0);
    unsigned int flags = is_compressed ? SECP256K1_EC_COMPRESSED : SECP256K1_EC_UNCOMPRESSED;
    secp256k1_ec_pubkey_serialize(context_, data.data(), &data_size, public_key, flags);
    data.resize(data_size);
    return data;
}

std::pair<Bytes, uint8_t> SecP256K1Context::serialize_recoverable_signature(const secp256k1_ecdsa_recoverable_signature* signature) {
    Bytes data(64, 0);
    int recovery_id{0};
    secp256k1_ecdsa_recoverable_signature_serialize_compact(context_, data.data(), &recovery_id, signature);
    return {data, static_cast<uint8_t>(recovery_id)};
}

unsigned int SecP256K1Context::flags(bool allow_verify, bool allow_sign) {
    unsigned int value = SECP256K1_CONTEXT_NONE;
    if (allow_verify) {
        value |= SECP256K1_CONTEXT_VERIFY;
    }
    if (allow_sign) {
        value |= SECP256K1_CONTEXT_SIGN;
    }
    return value;
}

}  // namespace stakeoracle
