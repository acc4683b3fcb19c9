// Copyright 2025 The Stakeoracle Authors
// SPDX-License-Identifier: Apache-2.0

#include "chain_client.hpp"

#include <stakeoracle/infra/common/log.hpp>

namespace stakeoracle::oracle {

Task<nlohmann::json> ChainClient::call(Chain chain, const std::string& method, nlohmann::json params) {
    co_return co_await call<nlohmann::json>(chain, method, std::move(params),
                                            [](const nlohmann::json& reply) { return reply; });
}

void ChainClient::on_rpc_error(Chain chain, const Endpoint& endpoint, const std::string& method, const std::exception& e) {
    metrics_.count_exception(chain);
    STAKE_DEBUG << "ChainClient::call " << method << " on " << endpoint.url() << " rpc error: " << e.what();
}

void ChainClient::on_endpoint_fault(Chain chain, Endpoint& endpoint, const std::string& method, int attempt,
                                    const std::exception& e) {
    metrics_.count_exception(chain);
    log::Warning("Request failed", {"chain", std::string{to_string(chain)}, "url", endpoint.url(),
                                    "method", method, "attempt", std::to_string(attempt), "error", e.what()});
    pool_.mark_failed(chain, endpoint);
}

}  // namespace stakeoracle::oracle
