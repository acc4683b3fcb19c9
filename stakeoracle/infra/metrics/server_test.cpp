// Copyright 2025 The Stakeoracle Authors
// SPDX-License-Identifier: Apache-2.0

#include "server.hpp"

#include <string>

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <catch2/catch_test_macros.hpp>

#include <stakeoracle/infra/test_util/log.hpp>
#include <stakeoracle/infra/test_util/task_runner.hpp>

namespace stakeoracle::metrics {

using boost::asio::use_awaitable;
namespace http = boost::beast::http;

static Task<http::response<http::string_body>> http_get(uint16_t port, std::string target) {
    auto executor = co_await boost::asio::this_coro::executor;
    boost::beast::tcp_stream stream{executor};
    co_await stream.async_connect(boost::asio::ip::tcp::endpoint{boost::asio::ip::make_address("127.0.0.1"), port}, use_awaitable);
    http::request<http::string_body> req{http::verb::get, target, 11};
    req.set(http::field::host, "localhost");
    req.keep_alive(false);
    co_await http::async_write(stream, req, use_awaitable);
    boost::beast::flat_buffer buffer;
    http::response<http::string_body> res;
    co_await http::async_read(stream, buffer, res, use_awaitable);
    co_return res;
}

TEST_CASE("Server", "[infra][metrics]") {
    test_util::SetLogVerbosityGuard log_guard{log::Level::kNone};
    test_util::TaskRunner runner;

    CHECK(Server::parse_endpoint("0.0.0.0:8000") == std::make_tuple(std::string{"0.0.0.0"}, std::string{"8000"}));

    Registry registry;
    registry.gauge("active_era_id", "Active era index").set(5);
    Server server{"127.0.0.1:0", registry, runner.executor()};
    server.start();

    SECTION("scrape") {
        const auto res = runner.run(http_get(server.port(), "/metrics"));
        CHECK(res.result() == http::status::ok);
        CHECK(res[http::field::content_type] == "text/plain; version=0.0.4; charset=utf-8");
        CHECK(res.body() == registry.serialize());
    }
    SECTION("unknown target") {
        const auto res = runner.run(http_get(server.port(), "/healthz"));
        CHECK(res.result() == http::status::not_found);
    }

    server.stop();
}

}  // namespace stakeoracle::metrics
