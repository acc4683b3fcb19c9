// Copyright 2025 The Stakeoracle Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <chrono>

#include <stakeoracle/infra/concurrency/task.hpp>

#include <boost/beast/core/tcp_stream.hpp>

#include <stakeoracle/rpc/node_url.hpp>

namespace stakeoracle::rpc {

inline constexpr const char* kUserAgent{"stakeoracle"};

//! Resolve the node host and connect the stream, both bounded by the given timeout
//! \throws TransportError on failure or timeout
Task<void> connect_tcp(boost::beast::tcp_stream& stream, const NodeUrl& url, std::chrono::milliseconds timeout);

}  // namespace stakeoracle::rpc
