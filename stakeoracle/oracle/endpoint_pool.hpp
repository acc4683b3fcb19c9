// Copyright 2025 The Stakeoracle Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include <stakeoracle/infra/concurrency/task.hpp>

#include <stakeoracle/oracle/types.hpp>
#include <stakeoracle/rpc/transport.hpp>

namespace stakeoracle::oracle {

//! Every endpoint configured for a chain has failed
class NoHealthyEndpointError : public std::runtime_error {
  public:
    explicit NoHealthyEndpointError(Chain chain);

    Chain chain() const { return chain_; }

  private:
    Chain chain_;
};

enum class EndpointState {
    kUntried,
    kHealthy,
    kFailed,
};

class Endpoint {
  public:
    explicit Endpoint(std::string url) : url_{std::move(url)} {}

    const std::string& url() const { return url_; }
    EndpointState state() const { return state_; }

    //! \throws rpc::TransportError if the endpoint is not connected
    rpc::Transport& transport();

  private:
    friend class EndpointPool;

    std::string url_;
    EndpointState state_{EndpointState::kUntried};
    std::unique_ptr<rpc::Transport> transport_;
};

//! Ordered list of node endpoints per chain with health tracking and failover
class EndpointPool {
  public:
    EndpointPool(rpc::TransportFactory transport_factory,
                 const std::vector<std::string>& relay_urls,
                 const std::vector<std::string>& para_urls,
                 std::chrono::milliseconds connect_timeout);

    EndpointPool(const EndpointPool&) = delete;
    EndpointPool& operator=(const EndpointPool&) = delete;

    //! Return the current connected endpoint of the chain, connecting the next untried one if needed
    //! \return never null
    //! \throws NoHealthyEndpointError once every endpoint of the chain has failed
    Task<Endpoint*> current_endpoint(Chain chain);

    //! Mark the endpoint failed, close its connection and move on to the next one
    void mark_failed(Chain chain, Endpoint& endpoint);

    //! Reset every endpoint of the chain to untried and connect again
    Task<void> reconnect(Chain chain);

    const std::vector<std::unique_ptr<Endpoint>>& endpoints(Chain chain) const;

  private:
    struct ChainEndpoints {
        std::vector<std::unique_ptr<Endpoint>> endpoints;
        size_t current{0};
    };

    ChainEndpoints& chain_endpoints(Chain chain);
    const ChainEndpoints& chain_endpoints(Chain chain) const;

    Task<bool> connect(Chain chain, Endpoint& endpoint);

    rpc::TransportFactory transport_factory_;
    std::chrono::milliseconds connect_timeout_;
    ChainEndpoints relay_;
    ChainEndpoints para_;
};

}  // namespace stakeoracle::oracle
