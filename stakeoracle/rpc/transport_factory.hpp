// Copyright 2025 The Stakeoracle Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <chrono>

#include <boost/asio/any_io_executor.hpp>

#include <stakeoracle/rpc/transport.hpp>

namespace stakeoracle::rpc {

//! \brief Factory creating a websocket or HTTP transport according to the URL scheme
//! \note Secure schemes (wss, https) are rejected with std::invalid_argument
TransportFactory make_transport_factory(const boost::asio::any_io_executor& executor, std::chrono::milliseconds request_timeout);

}  // namespace stakeoracle::rpc
