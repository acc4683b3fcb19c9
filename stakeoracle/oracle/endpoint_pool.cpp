// Copyright 2025 The Stakeoracle Authors
// SPDX-License-Identifier: Apache-2.0

#include "endpoint_pool.hpp"

#include <stakeoracle/infra/common/log.hpp>

namespace stakeoracle::oracle {

NoHealthyEndpointError::NoHealthyEndpointError(Chain chain)
    : std::runtime_error{"no healthy endpoint for " + std::string{to_string(chain)} + " chain"},
      chain_{chain} {}

rpc::Transport& Endpoint::transport() {
    if (!transport_) {
        throw rpc::TransportError{"endpoint " + url_ + " is not connected"};
    }
    return *transport_;
}

static std::vector<std::unique_ptr<Endpoint>> make_endpoints(Chain chain, const std::vector<std::string>& urls) {
    if (urls.empty()) {
        throw std::invalid_argument{"no endpoint configured for " + std::string{to_string(chain)} + " chain"};
    }
    std::vector<std::unique_ptr<Endpoint>> endpoints;
    endpoints.reserve(urls.size());
    for (const auto& url : urls) {
        endpoints.push_back(std::make_unique<Endpoint>(url));
    }
    return endpoints;
}

EndpointPool::EndpointPool(rpc::TransportFactory transport_factory,
                           const std::vector<std::string>& relay_urls,
                           const std::vector<std::string>& para_urls,
                           std::chrono::milliseconds connect_timeout)
    : transport_factory_{std::move(transport_factory)},
      connect_timeout_{connect_timeout},
      relay_{make_endpoints(Chain::kRelay, relay_urls)},
      para_{make_endpoints(Chain::kPara, para_urls)} {}

EndpointPool::ChainEndpoints& EndpointPool::chain_endpoints(Chain chain) {
    return chain == Chain::kRelay ? relay_ : para_;
}

const EndpointPool::ChainEndpoints& EndpointPool::chain_endpoints(Chain chain) const {
    return chain == Chain::kRelay ? relay_ : para_;
}

const std::vector<std::unique_ptr<Endpoint>>& EndpointPool::endpoints(Chain chain) const {
    return chain_endpoints(chain).endpoints;
}

Task<Endpoint*> EndpointPool::current_endpoint(Chain chain) {
    auto& chain_endpoints = this->chain_endpoints(chain);
    const size_t count = chain_endpoints.endpoints.size();
    for (size_t i{0}; i < count; ++i) {
        const size_t index = (chain_endpoints.current + i) % count;
        Endpoint& endpoint = *chain_endpoints.endpoints[index];
        if (endpoint.state_ == EndpointState::kFailed) {
            continue;
        }
        if (endpoint.state_ == EndpointState::kHealthy && endpoint.transport_) {
            chain_endpoints.current = index;
            co_return &endpoint;
        }
        if (co_await connect(chain, endpoint)) {
            chain_endpoints.current = index;
            co_return &endpoint;
        }
    }
    log::Error("All endpoints failed", {"chain", std::string{to_string(chain)}});
    throw NoHealthyEndpointError{chain};
}

Task<bool> EndpointPool::connect(Chain chain, Endpoint& endpoint) {
    const std::string chain_name{to_string(chain)};
    bool connected{false};
    try {
        endpoint.transport_ = transport_factory_(endpoint.url_);
        co_await endpoint.transport_->connect(connect_timeout_);
        connected = true;
    } catch (const std::invalid_argument&) {
        throw;
    } catch (const std::exception& e) {
        log::Warning("Endpoint connection failed", {"chain", chain_name, "url", endpoint.url_, "error", e.what()});
    }
    if (!connected) {
        endpoint.state_ = EndpointState::kFailed;
        if (endpoint.transport_) {
            endpoint.transport_->close();
            endpoint.transport_.reset();
        }
        co_return false;
    }
    endpoint.state_ = EndpointState::kHealthy;
    log::Info("Endpoint connected", {"chain", chain_name, "url", endpoint.url_});
    co_return true;
}

void EndpointPool::mark_failed(Chain chain, Endpoint& endpoint) {
    auto& chain_endpoints = this->chain_endpoints(chain);
    endpoint.state_ = EndpointState::kFailed;
    if (endpoint.transport_) {
        endpoint.transport_->close();
        endpoint.transport_.reset();
    }
    const auto& endpoints = chain_endpoints.endpoints;
    if (endpoints[chain_endpoints.current].get() == &endpoint) {
        chain_endpoints.current = (chain_endpoints.current + 1) % endpoints.size();
    }
    log::Warning("Endpoint marked failed", {"chain", std::string{to_string(chain)}, "url", endpoint.url_});
}

Task<void> EndpointPool::reconnect(Chain chain) {
    auto& chain_endpoints = this->chain_endpoints(chain);
    for (auto& endpoint : chain_endpoints.endpoints) {
        if (endpoint->transport_) {
            endpoint->transport_->close();
            endpoint->transport_.reset();
        }
        endpoint->state_ = EndpointState::kUntried;
    }
    chain_endpoints.current = 0;
    log::Info("Reconnecting endpoints", {"chain", std::string{to_string(chain)}});
    co_await current_endpoint(chain);
}

}  // namespace stakeoracle::oracle
