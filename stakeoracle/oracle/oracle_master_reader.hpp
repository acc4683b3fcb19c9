// Copyright 2025 The Stakeoracle Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <functional>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include <stakeoracle/oracle/chain_client.hpp>
#include <stakeoracle/oracle/oracle_master.hpp>

namespace stakeoracle::oracle {

//! OracleMaster implementation over the parachain Ethereum JSON-RPC API
class OracleMasterReader : public OracleMaster {
  public:
    OracleMasterReader(ChainClient& client, const evmc::address& contract, const evmc::address& oracle)
        : client_{client}, contract_{contract}, oracle_{oracle} {}

    Task<EraId> current_era_id() override;
    Task<ReportedState> is_reported_last_era(const StashAccount& stash) override;
    Task<std::vector<StashAccount>> stash_accounts() override;

    Task<intx::uint256> balance(const evmc::address& account) override;
    Task<uint64_t> transaction_count(const evmc::address& account) override;
    Task<uint64_t> chain_id() override;
    Task<intx::uint256> base_fee() override;

    Task<void> dry_run(ByteView calldata, uint64_t gas_limit) override;
    Task<evmc::bytes32> send_raw_transaction(ByteView raw_transaction) override;
    Task<std::optional<TransactionReceipt>> transaction_receipt(const evmc::bytes32& hash) override;

    Task<Bytes> code() override;

  private:
    //! eth_call of the contract at the latest block, decoding the ABI output
    template <typename T>
    Task<T> call_contract(const Bytes& calldata, std::function<T(ByteView)> decode);

    template <typename T>
    Task<T> call(const std::string& method, nlohmann::json params, ChainClient::ReplyDecoder<T> decode);

    ChainClient& client_;
    evmc::address contract_;
    evmc::address oracle_;
};

}  // namespace stakeoracle::oracle
