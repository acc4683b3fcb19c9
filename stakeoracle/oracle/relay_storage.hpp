// Copyright 2025 The Stakeoracle Authors
// SPDX-License-Identifier: Apache-2.0

// Storage keys and SCALE layouts of the relay chain runtime items read by the oracle

#pragma once

#include <cstdint>
#include <optional>
#include <vector>

#include <evmc/evmc.hpp>
#include <intx/intx.hpp>

#include <stakeoracle/core/common/bytes.hpp>
#include <stakeoracle/core/common/decoding_result.hpp>
#include <stakeoracle/oracle/types.hpp>

namespace stakeoracle::oracle::relay_storage {

//! Staking.ActiveEra: plain ActiveEraInfo value
Bytes active_era_key();

//! System.Account: Blake2_128Concat(AccountId) -> AccountInfo
Bytes system_account_key(const evmc::bytes32& account);

//! Staking.Bonded: Twox64Concat(stash) -> controller AccountId
Bytes bonded_key(const evmc::bytes32& stash);

//! Staking.Ledger: Blake2_128Concat(controller) -> StakingLedger
Bytes ledger_key(const evmc::bytes32& controller);

//! Staking.Nominators: Twox64Concat(stash) -> Nominations
Bytes nominators_key(const evmc::bytes32& stash);

//! Staking.SlashingSpans: Twox64Concat(AccountId) -> SlashingSpans
Bytes slashing_spans_key(const evmc::bytes32& account);

//! Session.Validators: plain Vec<AccountId> value
Bytes session_validators_key();

struct ActiveEraInfo {
    uint32_t index{0};
    std::optional<uint64_t> start;
};

struct StakingLedger {
    evmc::bytes32 stash;
    intx::uint128 total{0};
    intx::uint128 active{0};
    std::vector<UnlockingChunk> unlocking;
};

DecodingResult decode_active_era(ByteView data, ActiveEraInfo& out);

//! Decode the free balance out of AccountInfo { nonce, consumers, providers, sufficients, AccountData { free, ... } }
DecodingResult decode_free_balance(ByteView data, intx::uint128& out);

DecodingResult decode_account_id(ByteView data, evmc::bytes32& out);

//! Decode stash, total, active and unlocking chunks; trailing reward bookkeeping is ignored
DecodingResult decode_staking_ledger(ByteView data, StakingLedger& out);

//! Decode the number of prior slashing spans out of SlashingSpans { span_index, last_start, last_nonzero_slash, prior }
DecodingResult decode_slashing_spans_count(ByteView data, uint32_t& out);

DecodingResult decode_account_ids(ByteView data, std::vector<evmc::bytes32>& out);

}  // namespace stakeoracle::oracle::relay_storage
