// Copyright 2025 The Stakeoracle Authors
// SPDX-License-Identifier: Apache-2.0

#include "oracle_master_reader.hpp"

#include <stdexcept>

#include <stakeoracle/core/abi/codec.hpp>
#include <stakeoracle/core/common/util.hpp>

namespace stakeoracle::oracle {

static void success_or_throw(const DecodingResult& result, std::string_view what) {
    if (!result) {
        throw std::runtime_error{"cannot decode " + std::string{what} + ": " + std::string{to_string(result.error())}};
    }
}

static std::string expect_string(const nlohmann::json& value, std::string_view what) {
    if (!value.is_string()) {
        throw std::runtime_error{"unexpected " + std::string{what} + ": " + abridge(value.dump(), 128)};
    }
    return value.get<std::string>();
}

static Bytes expect_data(const nlohmann::json& value, std::string_view what) {
    auto data{from_hex(expect_string(value, what))};
    if (!data) {
        throw std::runtime_error{"invalid hex data in " + std::string{what}};
    }
    return std::move(*data);
}

static intx::uint256 expect_quantity(const nlohmann::json& value, std::string_view what) {
    const auto quantity{parse_quantity256(expect_string(value, what))};
    if (!quantity) {
        throw std::runtime_error{"invalid quantity in " + std::string{what} + ": " + value.get<std::string>()};
    }
    return *quantity;
}

static uint64_t expect_quantity64(const nlohmann::json& value, std::string_view what) {
    const auto quantity{parse_quantity(expect_string(value, what))};
    if (!quantity) {
        throw std::runtime_error{"invalid quantity in " + std::string{what} + ": " + value.get<std::string>()};
    }
    return *quantity;
}

template <typename T>
Task<T> OracleMasterReader::call(const std::string& method, nlohmann::json params, ChainClient::ReplyDecoder<T> decode) {
    co_return co_await client_.call<T>(Chain::kPara, method, std::move(params), std::move(decode));
}

template <typename T>
Task<T> OracleMasterReader::call_contract(const Bytes& calldata, std::function<T(ByteView)> decode) {
    nlohmann::json message{{"to", to_hex(contract_)}, {"data", to_hex(calldata, /*with_prefix=*/true)}};
    co_return co_await call<T>("eth_call", nlohmann::json::array({std::move(message), "latest"}),
                               [decode = std::move(decode)](const nlohmann::json& output) {
                                   return decode(expect_data(output, "eth_call output"));
                               });
}

Task<EraId> OracleMasterReader::current_era_id() {
    co_return co_await call_contract<EraId>(abi::encode_call("getCurrentEraId()", {}), [](ByteView output) {
        uint64_t era{0};
        success_or_throw(abi::Decoder{output}.uint64_at(0, era), "getCurrentEraId output");
        return era;
    });
}

Task<ReportedState> OracleMasterReader::is_reported_last_era(const StashAccount& stash) {
    const auto calldata{abi::encode_call("isReportedLastEra(address,bytes32)",
                                         {abi::Value::address(oracle_), abi::Value::bytes32(stash)})};
    co_return co_await call_contract<ReportedState>(calldata, [](ByteView output) {
        const abi::Decoder decoder{output};
        ReportedState state;
        success_or_throw(decoder.uint64_at(0, state.era), "isReportedLastEra output");
        success_or_throw(decoder.boolean_at(1, state.reported), "isReportedLastEra output");
        return state;
    });
}

Task<std::vector<StashAccount>> OracleMasterReader::stash_accounts() {
    co_return co_await call_contract<std::vector<StashAccount>>(
        abi::encode_call("getStashAccounts()", {}), [](ByteView output) {
            std::vector<StashAccount> stashes;
            success_or_throw(abi::Decoder{output}.bytes32_array_at(0, stashes), "getStashAccounts output");
            return stashes;
        });
}

Task<intx::uint256> OracleMasterReader::balance(const evmc::address& account) {
    co_return co_await call<intx::uint256>(
        "eth_getBalance", nlohmann::json::array({to_hex(account), "latest"}),
        [](const nlohmann::json& result) { return expect_quantity(result, "eth_getBalance result"); });
}

Task<uint64_t> OracleMasterReader::transaction_count(const evmc::address& account) {
    co_return co_await call<uint64_t>(
        "eth_getTransactionCount", nlohmann::json::array({to_hex(account), "latest"}),
        [](const nlohmann::json& result) { return expect_quantity64(result, "eth_getTransactionCount result"); });
}

Task<uint64_t> OracleMasterReader::chain_id() {
    co_return co_await call<uint64_t>("eth_chainId", nlohmann::json::array(), [](const nlohmann::json& result) {
        return expect_quantity64(result, "eth_chainId result");
    });
}

Task<intx::uint256> OracleMasterReader::base_fee() {
    co_return co_await call<intx::uint256>(
        "eth_getBlockByNumber", nlohmann::json::array({"latest", false}), [](const nlohmann::json& block) {
            if (!block.is_object()) {
                throw std::runtime_error{"latest block not found"};
            }
            if (!block.contains("baseFeePerGas") || block["baseFeePerGas"].is_null()) {
                return intx::uint256{0};
            }
            return expect_quantity(block["baseFeePerGas"], "baseFeePerGas");
        });
}

Task<void> OracleMasterReader::dry_run(ByteView calldata, uint64_t gas_limit) {
    nlohmann::json message{
        {"from", to_hex(oracle_)},
        {"to", to_hex(contract_)},
        {"gas", to_quantity(gas_limit)},
        {"data", to_hex(calldata, /*with_prefix=*/true)},
    };
    co_await client_.call(Chain::kPara, "eth_call", nlohmann::json::array({std::move(message), "latest"}));
}

Task<evmc::bytes32> OracleMasterReader::send_raw_transaction(ByteView raw_transaction) {
    co_return co_await call<evmc::bytes32>(
        "eth_sendRawTransaction", nlohmann::json::array({to_hex(raw_transaction, /*with_prefix=*/true)}),
        [](const nlohmann::json& result) {
            const auto hash{bytes32_from_hex(expect_string(result, "eth_sendRawTransaction result"))};
            if (!hash) {
                throw std::runtime_error{"invalid transaction hash: " + result.get<std::string>()};
            }
            return *hash;
        });
}

Task<std::optional<TransactionReceipt>> OracleMasterReader::transaction_receipt(const evmc::bytes32& hash) {
    co_return co_await call<std::optional<TransactionReceipt>>(
        "eth_getTransactionReceipt", nlohmann::json::array({to_hex(hash)}),
        [&hash](const nlohmann::json& result) -> std::optional<TransactionReceipt> {
            if (result.is_null()) {
                return std::nullopt;
            }
            if (!result.is_object() || !result.contains("status")) {
                throw std::runtime_error{"invalid receipt: " + abridge(result.dump(), 128)};
            }
            TransactionReceipt receipt{.transaction_hash = hash};
            receipt.success = expect_quantity64(result["status"], "receipt status") == 1;
            if (result.contains("blockNumber")) {
                receipt.block_number = expect_quantity64(result["blockNumber"], "receipt blockNumber");
            }
            if (result.contains("gasUsed")) {
                receipt.gas_used = expect_quantity64(result["gasUsed"], "receipt gasUsed");
            }
            return receipt;
        });
}

Task<Bytes> OracleMasterReader::code() {
    co_return co_await call<Bytes>("eth_getCode", nlohmann::json::array({to_hex(contract_), "latest"}),
                                   [](const nlohmann::json& result) { return expect_data(result, "eth_getCode result"); });
}

}  // namespace stakeoracle::oracle
