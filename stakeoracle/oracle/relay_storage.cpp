// Copyright 2025 The Stakeoracle Authors
// SPDX-License-Identifier: Apache-2.0

#include "relay_storage.hpp"

#include <limits>
#include <string_view>

#include <stakeoracle/core/crypto/hashers.hpp>
#include <stakeoracle/core/scale/reader.hpp>

namespace stakeoracle::oracle::relay_storage {

static ByteView as_bytes(std::string_view s) {
    return {reinterpret_cast<const uint8_t*>(s.data()), s.size()};
}

static Bytes storage_prefix(std::string_view pallet, std::string_view item) {
    Bytes key;
    const auto pallet_hash{crypto::twox_128(as_bytes(pallet))};
    const auto item_hash{crypto::twox_128(as_bytes(item))};
    key.append(pallet_hash.data(), pallet_hash.size());
    key.append(item_hash.data(), item_hash.size());
    return key;
}

static Bytes twox64_concat_key(std::string_view pallet, std::string_view item, const evmc::bytes32& account) {
    Bytes key{storage_prefix(pallet, item)};
    const auto hash{crypto::twox_64(ByteView{account.bytes})};
    key.append(hash.data(), hash.size());
    key.append(account.bytes, sizeof(account.bytes));
    return key;
}

static Bytes blake2_128_concat_key(std::string_view pallet, std::string_view item, const evmc::bytes32& account) {
    Bytes key{storage_prefix(pallet, item)};
    const auto hash{crypto::blake2_128(ByteView{account.bytes})};
    key.append(hash.data(), hash.size());
    key.append(account.bytes, sizeof(account.bytes));
    return key;
}

Bytes active_era_key() {
    return storage_prefix("Staking", "ActiveEra");
}

Bytes system_account_key(const evmc::bytes32& account) {
    return blake2_128_concat_key("System", "Account", account);
}

Bytes bonded_key(const evmc::bytes32& stash) {
    return twox64_concat_key("Staking", "Bonded", stash);
}

Bytes ledger_key(const evmc::bytes32& controller) {
    return blake2_128_concat_key("Staking", "Ledger", controller);
}

Bytes nominators_key(const evmc::bytes32& stash) {
    return twox64_concat_key("Staking", "Nominators", stash);
}

Bytes slashing_spans_key(const evmc::bytes32& account) {
    return twox64_concat_key("Staking", "SlashingSpans", account);
}

Bytes session_validators_key() {
    return storage_prefix("Session", "Validators");
}

DecodingResult decode_active_era(ByteView data, ActiveEraInfo& out) {
    scale::Reader reader{data};
    if (auto res{reader.read_u32(out.index)}; !res) return res;
    bool has_start{false};
    if (auto res{reader.read_option_tag(has_start)}; !res) return res;
    if (has_start) {
        uint64_t start{0};
        if (auto res{reader.read_u64(start)}; !res) return res;
        out.start = start;
    } else {
        out.start.reset();
    }
    if (!reader.empty()) {
        return tl::unexpected{DecodingError::kInputTooLong};
    }
    return {};
}

DecodingResult decode_free_balance(ByteView data, intx::uint128& out) {
    scale::Reader reader{data};
    // nonce, consumers, providers, sufficients
    if (auto res{reader.skip(4 * sizeof(uint32_t))}; !res) return res;
    return reader.read_u128(out);
}

DecodingResult decode_account_id(ByteView data, evmc::bytes32& out) {
    if (data.size() != kAccountIdLength) {
        return tl::unexpected{DecodingError::kUnexpectedLength};
    }
    scale::Reader reader{data};
    return reader.read_account_id(out);
}

DecodingResult decode_staking_ledger(ByteView data, StakingLedger& out) {
    scale::Reader reader{data};
    if (auto res{reader.read_account_id(out.stash)}; !res) return res;
    if (auto res{reader.read_compact(out.total)}; !res) return res;
    if (auto res{reader.read_compact(out.active)}; !res) return res;
    size_t count{0};
    if (auto res{reader.read_length(count)}; !res) return res;
    if (count > reader.remaining()) {
        return tl::unexpected{DecodingError::kInputTooShort};
    }
    out.unlocking.clear();
    out.unlocking.reserve(count);
    for (size_t i{0}; i < count; ++i) {
        UnlockingChunk chunk;
        if (auto res{reader.read_compact(chunk.balance)}; !res) return res;
        intx::uint128 era{0};
        if (auto res{reader.read_compact(era)}; !res) return res;
        if (era > std::numeric_limits<uint32_t>::max()) {
            return tl::unexpected{DecodingError::kOverflow};
        }
        chunk.era = static_cast<uint64_t>(era);
        out.unlocking.push_back(chunk);
    }
    return {};
}

DecodingResult decode_slashing_spans_count(ByteView data, uint32_t& out) {
    scale::Reader reader{data};
    // span_index, last_start, last_nonzero_slash
    if (auto res{reader.skip(3 * sizeof(uint32_t))}; !res) return res;
    size_t count{0};
    if (auto res{reader.read_length(count)}; !res) return res;
    if (reader.remaining() != count * sizeof(uint32_t)) {
        return tl::unexpected{DecodingError::kUnexpectedLength};
    }
    out = static_cast<uint32_t>(count);
    return {};
}

DecodingResult decode_account_ids(ByteView data, std::vector<evmc::bytes32>& out) {
    scale::Reader reader{data};
    size_t count{0};
    if (auto res{reader.read_length(count)}; !res) return res;
    if (reader.remaining() != count * kAccountIdLength) {
        return tl::unexpected{DecodingError::kUnexpectedLength};
    }
    out.resize(count);
    for (auto& account : out) {
        if (auto res{reader.read_account_id(account)}; !res) return res;
    }
    return {};
}

}  // namespace stakeoracle::oracle::relay_storage
