// Copyright 2025 The Stakeoracle Authors
// SPDX-License-Identifier: Apache-2.0

#include <string>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>
#include <catch2/catch_test_macros.hpp>
#include <nlohmann/json.hpp>

#include <stakeoracle/infra/test_util/log.hpp>
#include <stakeoracle/infra/test_util/task_runner.hpp>
#include <stakeoracle/rpc/http_transport.hpp>
#include <stakeoracle/rpc/ws_transport.hpp>

namespace stakeoracle::rpc {

using namespace std::chrono_literals;
using boost::asio::use_awaitable;
using boost::asio::ip::tcp;
namespace beast = boost::beast;
namespace http = beast::http;
namespace websocket = beast::websocket;

static nlohmann::json reply_to(const std::string& request_content) {
    const auto request = nlohmann::json::parse(request_content);
    if (request["method"] == "system_health") {
        return {{"jsonrpc", "2.0"}, {"id", request["id"]}, {"error", {{"code", -32601}, {"message", "Method not found"}}}};
    }
    return {{"jsonrpc", "2.0"}, {"id", request["id"]}, {"result", request["method"]}};
}

//! Serves JSON-RPC requests over websocket on a single connection, preceding each reply with a notification
static Task<void> serve_websocket(tcp::acceptor& acceptor, int requests) {
    auto socket = co_await acceptor.async_accept(use_awaitable);
    websocket::stream<beast::tcp_stream> ws{std::move(socket)};
    co_await ws.async_accept(use_awaitable);
    for (int i = 0; i < requests; ++i) {
        beast::flat_buffer buffer;
        co_await ws.async_read(buffer, use_awaitable);
        const std::string notification{R"({"jsonrpc":"2.0","method":"chain_newHead","params":{}})"};
        co_await ws.async_write(boost::asio::buffer(notification), use_awaitable);
        const auto reply = reply_to(beast::buffers_to_string(buffer.data())).dump();
        co_await ws.async_write(boost::asio::buffer(reply), use_awaitable);
    }
}

//! Serves JSON-RPC requests over HTTP on a single keep-alive connection
static Task<void> serve_http(tcp::acceptor& acceptor, int requests) {
    auto socket = co_await acceptor.async_accept(use_awaitable);
    beast::tcp_stream stream{std::move(socket)};
    beast::flat_buffer buffer;
    for (int i = 0; i < requests; ++i) {
        http::request<http::string_body> req;
        co_await http::async_read(stream, buffer, req, use_awaitable);
        http::response<http::string_body> res{http::status::ok, req.version()};
        res.set(http::field::content_type, "application/json");
        res.keep_alive(true);
        res.body() = reply_to(req.body()).dump();
        res.prepare_payload();
        co_await http::async_write(stream, res, use_awaitable);
    }
}

static tcp::acceptor make_acceptor(boost::asio::io_context& ioc) {
    return tcp::acceptor{ioc, tcp::endpoint{boost::asio::ip::make_address("127.0.0.1"), 0}};
}

static std::string local_url(const std::string& scheme, const tcp::acceptor& acceptor) {
    return scheme + "://127.0.0.1:" + std::to_string(acceptor.local_endpoint().port());
}

TEST_CASE("WsTransport", "[rpc][transport]") {
    test_util::SetLogVerbosityGuard log_guard{log::Level::kNone};
    test_util::TaskRunner runner;
    auto acceptor = make_acceptor(runner.ioc());
    boost::asio::co_spawn(runner.ioc(), serve_websocket(acceptor, 2), boost::asio::detached);

    WsTransport transport{runner.executor(), NodeUrl{local_url("ws", acceptor)}, 5s};
    runner.run(transport.connect(5s));

    SECTION("result is matched by id, notifications are skipped") {
        const auto result = runner.run(transport.call("chain_getFinalizedHead", nlohmann::json::array()));
        CHECK(result == "chain_getFinalizedHead");
        CHECK_THROWS_AS(runner.run(transport.call("system_health", nlohmann::json::array())), RpcError);
    }
    SECTION("call after close fails") {
        transport.close();
        CHECK_THROWS_AS(runner.run(transport.call("chain_getFinalizedHead", nlohmann::json::array())), TransportError);
    }
}

TEST_CASE("HttpTransport", "[rpc][transport]") {
    test_util::SetLogVerbosityGuard log_guard{log::Level::kNone};
    test_util::TaskRunner runner;
    auto acceptor = make_acceptor(runner.ioc());
    boost::asio::co_spawn(runner.ioc(), serve_http(acceptor, 2), boost::asio::detached);

    HttpTransport transport{runner.executor(), NodeUrl{local_url("http", acceptor)}, 5s};
    runner.run(transport.connect(5s));

    CHECK(runner.run(transport.call("eth_chainId", nlohmann::json::array())) == "eth_chainId");
    CHECK_THROWS_AS(runner.run(transport.call("system_health", nlohmann::json::array())), RpcError);
}

TEST_CASE("Transport connect failure", "[rpc][transport]") {
    test_util::SetLogVerbosityGuard log_guard{log::Level::kNone};
    test_util::TaskRunner runner;
    std::string url;
    {
        // Grab a free port and release it so that nothing listens there
        auto acceptor = make_acceptor(runner.ioc());
        url = local_url("ws", acceptor);
    }
    WsTransport transport{runner.executor(), NodeUrl{url}, 1s};
    CHECK_THROWS_AS(runner.run(transport.connect(1s)), TransportError);
}

}  // namespace stakeoracle::rpc
