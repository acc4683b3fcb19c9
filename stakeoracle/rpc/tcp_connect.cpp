// Copyright 2025 The Stakeoracle Authors
// SPDX-License-Identifier: Apache-2.0

#include "tcp_connect.hpp"

#include <string>

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/system/system_error.hpp>

#include <stakeoracle/infra/common/log.hpp>
#include <stakeoracle/rpc/transport.hpp>

namespace stakeoracle::rpc {

using boost::asio::use_awaitable;

Task<void> connect_tcp(boost::beast::tcp_stream& stream, const NodeUrl& url, std::chrono::milliseconds timeout) {
    auto executor = co_await boost::asio::this_coro::executor;

    boost::asio::ip::tcp::resolver resolver{executor};
    boost::asio::steady_timer resolve_timer{executor};
    resolve_timer.expires_after(timeout);
    resolve_timer.async_wait([&resolver](const boost::system::error_code& ec) {
        if (!ec) resolver.cancel();
    });

    try {
        const auto endpoints = co_await resolver.async_resolve(url.host(), std::to_string(url.port()), use_awaitable);
        resolve_timer.cancel();

        stream.expires_after(timeout);
        const auto endpoint = co_await stream.async_connect(endpoints, use_awaitable);
        stream.expires_never();
        STAKE_TRACE << "connect_tcp connected to " << url.to_string() << " at " << endpoint;
    } catch (const boost::system::system_error& se) {
        if (se.code() == boost::asio::error::operation_aborted) {
            throw TransportError{"timeout resolving " + url.host()};
        }
        throw TransportError{"cannot connect to " + url.to_string() + ": " + se.code().message()};
    }
}

}  // namespace stakeoracle::rpc
