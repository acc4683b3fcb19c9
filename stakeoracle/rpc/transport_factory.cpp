// Copyright 2025 The Stakeoracle Authors
// SPDX-License-Identifier: Apache-2.0

#include "transport_factory.hpp"

#include <stdexcept>

#include <stakeoracle/rpc/http_transport.hpp>
#include <stakeoracle/rpc/node_url.hpp>
#include <stakeoracle/rpc/ws_transport.hpp>

namespace stakeoracle::rpc {

TransportFactory make_transport_factory(const boost::asio::any_io_executor& executor, std::chrono::milliseconds request_timeout) {
    return [executor, request_timeout](const std::string& url) -> std::unique_ptr<Transport> {
        NodeUrl node_url{url};
        if (node_url.is_secure()) {
            throw std::invalid_argument{"TLS is not supported, use a plain ws:// or http:// endpoint: " + url};
        }
        if (node_url.is_websocket()) {
            return std::make_unique<WsTransport>(executor, std::move(node_url), request_timeout);
        }
        return std::make_unique<HttpTransport>(executor, std::move(node_url), request_timeout);
    };
}

}  // namespace stakeoracle::rpc
