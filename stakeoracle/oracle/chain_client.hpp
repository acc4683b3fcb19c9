// Copyright 2025 The Stakeoracle Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <exception>
#include <functional>
#include <string>
#include <utility>

#include <stakeoracle/infra/concurrency/task.hpp>

#include <nlohmann/json.hpp>

#include <stakeoracle/oracle/endpoint_pool.hpp>
#include <stakeoracle/oracle/oracle_metrics.hpp>

namespace stakeoracle::oracle {

//! Routes JSON-RPC calls to the current endpoint of a chain, failing over once on transport errors
class ChainClient {
  public:
    static constexpr int kMaxAttempts{2};

    //! Converts a reply into the expected result, throwing if the reply is unusable
    template <typename T>
    using ReplyDecoder = std::function<T(const nlohmann::json&)>;

    ChainClient(EndpointPool& pool, OracleMetrics& metrics) : pool_{pool}, metrics_{metrics} {}

    //! \throws rpc::RpcError as soon as a node answers with an error object
    //! \throws NoHealthyEndpointError when the chain runs out of endpoints
    //! \throws the last transport error when the retry fails as well
    Task<nlohmann::json> call(Chain chain, const std::string& method, nlohmann::json params);

    //! Call decoding the reply on the spot: an unusable reply counts as a fault of the endpoint, like a transport error
    //! \throws the decoding error when the reply of the retry is unusable as well
    template <typename T>
    Task<T> call(Chain chain, const std::string& method, nlohmann::json params, ReplyDecoder<T> decode);

  private:
    void on_rpc_error(Chain chain, const Endpoint& endpoint, const std::string& method, const std::exception& e);
    void on_endpoint_fault(Chain chain, Endpoint& endpoint, const std::string& method, int attempt, const std::exception& e);

    EndpointPool& pool_;
    OracleMetrics& metrics_;
};

template <typename T>
Task<T> ChainClient::call(Chain chain, const std::string& method, nlohmann::json params, ReplyDecoder<T> decode) {
    for (int attempt{1};; ++attempt) {
        Endpoint* endpoint = co_await pool_.current_endpoint(chain);
        try {
            const auto reply = co_await endpoint->transport().call(method, params);
            co_return decode(reply);
        } catch (const rpc::RpcError& e) {
            on_rpc_error(chain, *endpoint, method, e);
            throw;
        } catch (const std::exception& e) {
            on_endpoint_fault(chain, *endpoint, method, attempt, e);
            if (attempt >= kMaxAttempts) {
                throw;
            }
        }
    }
}

}  // namespace stakeoracle::oracle
