// Copyright 2025 The Stakeoracle Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <string>
#include <tuple>

#include <stakeoracle/infra/concurrency/task.hpp>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/ip/tcp.hpp>

#include <stakeoracle/infra/metrics/registry.hpp>

namespace stakeoracle::metrics {

//! HTTP endpoint exposing the registry to Prometheus scrapers at /metrics
class Server {
  public:
    static std::tuple<std::string, std::string> parse_endpoint(const std::string& tcp_end_point);

    Server(const Server&) = delete;
    Server& operator=(const Server&) = delete;

    //! \param end_point listening address in the <host>:<port> form
    Server(const std::string& end_point, const Registry& registry, const boost::asio::any_io_executor& executor);

    void start();
    void stop();

    uint16_t port() const { return acceptor_.local_endpoint().port(); }

  private:
    Task<void> run();
    Task<void> handle_connection(boost::asio::ip::tcp::socket socket);

    const Registry& registry_;
    boost::asio::ip::tcp::acceptor acceptor_;
};

}  // namespace stakeoracle::metrics
