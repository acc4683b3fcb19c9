// Copyright 2025 The Stakeoracle Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <chrono>
#include <memory>
#include <string>

#include <stakeoracle/infra/concurrency/task.hpp>

#include <boost/asio/any_io_executor.hpp>
#include <boost/beast/core/tcp_stream.hpp>

#include <stakeoracle/rpc/node_url.hpp>
#include <stakeoracle/rpc/transport.hpp>

namespace stakeoracle::rpc {

//! JSON-RPC client over HTTP/1.1 POST requests on a keep-alive connection
class HttpTransport : public Transport {
  public:
    HttpTransport(const boost::asio::any_io_executor& executor, NodeUrl node_url, std::chrono::milliseconds request_timeout);
    ~HttpTransport() override;

    const std::string& url() const override { return url_; }

    Task<void> connect(std::chrono::milliseconds timeout) override;
    Task<nlohmann::json> call(const std::string& method, nlohmann::json params) override;
    void close() override;

  private:
    boost::asio::any_io_executor executor_;
    NodeUrl node_url_;
    std::string url_;
    std::chrono::milliseconds request_timeout_;
    std::unique_ptr<boost::beast::tcp_stream> stream_;
    uint64_t next_request_id_{1};
};

}  // namespace stakeoracle::rpc
