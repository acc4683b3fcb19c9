// Copyright 2025 The Stakeoracle Authors
// SPDX-License-Identifier: Apache-2.0

#include "relay_chain_reader.hpp"

#include <algorithm>
#include <stdexcept>

#include <stakeoracle/core/common/util.hpp>
#include <stakeoracle/infra/common/log.hpp>
#include <stakeoracle/oracle/relay_storage.hpp>

namespace stakeoracle::oracle {

//! Convert a decoding failure of chain data into an exception carrying the storage item name
static void success_or_throw(const DecodingResult& result, std::string_view item) {
    if (!result) {
        throw std::runtime_error{"cannot decode " + std::string{item} + ": " + std::string{to_string(result.error())}};
    }
}

static evmc::bytes32 parse_hash(const nlohmann::json& value, std::string_view what) {
    if (!value.is_string()) {
        throw std::runtime_error{"missing " + std::string{what}};
    }
    const auto hash{bytes32_from_hex(value.get<std::string>())};
    if (!hash) {
        throw std::runtime_error{"invalid " + std::string{what} + ": " + value.get<std::string>()};
    }
    return *hash;
}

//! Storage value of a key that must be present
static const Bytes& required(const std::optional<Bytes>& value, std::string_view item) {
    if (!value) {
        throw std::runtime_error{std::string{item} + " is empty"};
    }
    return *value;
}

template <typename T>
Task<T> RelayChainReader::storage(const Bytes& key, const std::optional<evmc::bytes32>& block_hash,
                                  StorageDecoder<T> decode) {
    nlohmann::json params = nlohmann::json::array({to_hex(key, /*with_prefix=*/true)});
    if (block_hash) {
        params.push_back(to_hex(*block_hash));
    }
    co_return co_await client_.call<T>(
        Chain::kRelay, "state_getStorage", std::move(params),
        [decode = std::move(decode)](const nlohmann::json& reply) -> T {
            if (reply.is_null()) {
                return decode(std::nullopt);
            }
            if (!reply.is_string()) {
                throw std::runtime_error{"unexpected state_getStorage result: " + abridge(reply.dump(), 128)};
            }
            const auto bytes{from_hex(reply.get<std::string>())};
            if (!bytes) {
                throw std::runtime_error{"invalid hex in state_getStorage result"};
            }
            return decode(bytes);
        });
}

Task<Era> RelayChainReader::active_era(std::optional<evmc::bytes32> block_hash) {
    co_return co_await storage<Era>(relay_storage::active_era_key(), block_hash, [](const std::optional<Bytes>& value) {
        relay_storage::ActiveEraInfo info;
        success_or_throw(relay_storage::decode_active_era(required(value, "Staking.ActiveEra"), info), "Staking.ActiveEra");
        return Era{.index = info.index, .start = info.start};
    });
}

Task<StakingParameters> RelayChainReader::staking_parameters(const StashAccount& stash, const evmc::bytes32& block_hash) {
    StakingParameters params{.stash_account = stash, .controller_account = stash};

    params.stash_balance = co_await storage<intx::uint128>(
        relay_storage::system_account_key(stash), block_hash, [&stash](const std::optional<Bytes>& value) {
            intx::uint128 free_balance{0};
            const auto& account_info{required(value, "System.Account of stash " + to_hex(stash))};
            success_or_throw(relay_storage::decode_free_balance(account_info, free_balance), "System.Account");
            return free_balance;
        });

    const auto controller = co_await storage<std::optional<evmc::bytes32>>(
        relay_storage::bonded_key(stash), block_hash,
        [](const std::optional<Bytes>& value) -> std::optional<evmc::bytes32> {
            if (!value) {
                return std::nullopt;
            }
            evmc::bytes32 account;
            success_or_throw(relay_storage::decode_account_id(*value, account), "Staking.Bonded");
            return account;
        });
    if (!controller) {
        STAKE_DEBUG << "RelayChainReader::staking_parameters stash " << to_hex(stash) << " is not bonded";
        params.stake_status = StakeStatus::kNone;
        co_return params;
    }
    params.controller_account = *controller;

    auto ledger = co_await storage<relay_storage::StakingLedger>(
        relay_storage::ledger_key(*controller), block_hash, [&controller](const std::optional<Bytes>& value) {
            relay_storage::StakingLedger out;
            const auto& data{required(value, "Staking.Ledger of controller " + to_hex(*controller))};
            success_or_throw(relay_storage::decode_staking_ledger(data, out), "Staking.Ledger");
            return out;
        });
    params.active_balance = ledger.active;
    params.total_balance = ledger.total;
    params.unlocking = std::move(ledger.unlocking);

    params.slashing_spans = co_await storage<uint32_t>(
        relay_storage::slashing_spans_key(*controller), block_hash, [](const std::optional<Bytes>& value) {
            uint32_t count{0};
            if (value) {
                success_or_throw(relay_storage::decode_slashing_spans_count(*value, count), "Staking.SlashingSpans");
            }
            return count;
        });

    params.stake_status = co_await stake_status(stash, block_hash);
    co_return params;
}

Task<StakeStatus> RelayChainReader::stake_status(const StashAccount& stash, const evmc::bytes32& block_hash) {
    const bool nominator = co_await storage<bool>(relay_storage::nominators_key(stash), block_hash,
                                                  [](const std::optional<Bytes>& value) { return value.has_value(); });
    if (nominator) {
        co_return StakeStatus::kNominator;
    }

    const auto validators = co_await storage<std::vector<evmc::bytes32>>(
        relay_storage::session_validators_key(), block_hash, [](const std::optional<Bytes>& value) {
            std::vector<evmc::bytes32> accounts;
            success_or_throw(relay_storage::decode_account_ids(required(value, "Session.Validators"), accounts),
                             "Session.Validators");
            return accounts;
        });
    if (std::find(validators.cbegin(), validators.cend(), stash) != validators.cend()) {
        co_return StakeStatus::kValidator;
    }
    co_return StakeStatus::kIdle;
}

Task<BlockNum> RelayChainReader::finalized_head_number() {
    const auto head_hash = co_await client_.call<evmc::bytes32>(
        Chain::kRelay, "chain_getFinalizedHead", nlohmann::json::array(),
        [](const nlohmann::json& reply) { return parse_hash(reply, "finalized head hash"); });
    co_return co_await client_.call<BlockNum>(
        Chain::kRelay, "chain_getHeader", nlohmann::json::array({to_hex(head_hash)}), [](const nlohmann::json& header) {
            if (!header.is_object() || !header.contains("number") || !header["number"].is_string()) {
                throw std::runtime_error{"invalid finalized header: " + abridge(header.dump(), 128)};
            }
            const auto number{parse_quantity(header["number"].get<std::string>())};
            if (!number) {
                throw std::runtime_error{"invalid finalized header number: " + header["number"].get<std::string>()};
            }
            return *number;
        });
}

Task<evmc::bytes32> RelayChainReader::block_hash(BlockNum block_num) {
    co_return co_await client_.call<evmc::bytes32>(
        Chain::kRelay, "chain_getBlockHash", nlohmann::json::array({block_num}), [block_num](const nlohmann::json& reply) {
            if (reply.is_null()) {
                throw std::runtime_error{"block " + std::to_string(block_num) + " not found"};
            }
            return parse_hash(reply, "block hash");
        });
}

}  // namespace stakeoracle::oracle
