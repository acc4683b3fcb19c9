// Copyright 2025 The Stakeoracle Authors
// SPDX-License-Identifier: Apache-2.0

#include "server.hpp"

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/http.hpp>
#include <boost/system/system_error.hpp>

#include <stakeoracle/infra/common/log.hpp>

namespace stakeoracle::metrics {

using namespace std::chrono_literals;
using boost::asio::use_awaitable;
namespace http = boost::beast::http;

inline constexpr const char* kContentType{"text/plain; version=0.0.4; charset=utf-8"};
inline constexpr char kAddressPortSeparator{':'};

std::tuple<std::string, std::string> Server::parse_endpoint(const std::string& tcp_end_point) {
    const auto separator = tcp_end_point.rfind(kAddressPortSeparator);
    if (separator == std::string::npos) {
        return {tcp_end_point, "0"};
    }
    return {tcp_end_point.substr(0, separator), tcp_end_point.substr(separator + 1)};
}

Server::Server(const std::string& end_point, const Registry& registry, const boost::asio::any_io_executor& executor)
    : registry_{registry}, acceptor_{executor} {
    const auto [host, port] = parse_endpoint(end_point);

    // Open the acceptor with the option to reuse the address (i.e. SO_REUSEADDR).
    boost::asio::ip::tcp::resolver resolver{executor};
    boost::asio::ip::tcp::endpoint endpoint = *resolver.resolve(host, port).begin();
    acceptor_.open(endpoint.protocol());
    acceptor_.set_option(boost::asio::ip::tcp::acceptor::reuse_address(true));
    acceptor_.bind(endpoint);
    acceptor_.listen();
}

void Server::start() {
    boost::asio::co_spawn(acceptor_.get_executor(), run(), [&](const std::exception_ptr& eptr) {
        if (eptr) std::rethrow_exception(eptr);
    });
}

void Server::stop() {
    boost::system::error_code ec;
    acceptor_.close(ec);
    if (ec) {
        STAKE_WARN << "metrics::Server::stop close error: " << ec.message();
    }
}

Task<void> Server::run() {
    auto this_executor = co_await boost::asio::this_coro::executor;
    try {
        while (acceptor_.is_open()) {
            boost::asio::ip::tcp::socket socket{this_executor};
            co_await acceptor_.async_accept(socket, use_awaitable);
            if (!acceptor_.is_open()) {
                co_return;
            }
            STAKE_TRACE << "metrics::Server::run accepted connection from " << socket.remote_endpoint();
            boost::asio::co_spawn(this_executor, handle_connection(std::move(socket)), boost::asio::detached);
        }
    } catch (const boost::system::system_error& se) {
        if (se.code() != boost::asio::error::operation_aborted) {
            STAKE_ERROR << "metrics::Server::run system_error: " << se.what();
            throw;
        }
        STAKE_DEBUG << "metrics::Server::run operation_aborted: " << se.what();
    }
    STAKE_DEBUG << "metrics::Server::run exiting...";
}

Task<void> Server::handle_connection(boost::asio::ip::tcp::socket socket) {
    boost::beast::tcp_stream stream{std::move(socket)};
    boost::beast::flat_buffer buffer;
    try {
        while (true) {
            http::request<http::string_body> req;
            stream.expires_after(30s);
            co_await http::async_read(stream, buffer, req, use_awaitable);

            http::response<http::string_body> res;
            res.version(req.version());
            res.keep_alive(req.keep_alive());
            if (req.method() != http::verb::get && req.method() != http::verb::head) {
                res.result(http::status::method_not_allowed);
            } else if (req.target() != "/metrics" && req.target() != "/") {
                res.result(http::status::not_found);
            } else {
                res.result(http::status::ok);
                res.set(http::field::content_type, kContentType);
                if (req.method() == http::verb::get) {
                    res.body() = registry_.serialize();
                }
            }
            res.prepare_payload();
            co_await http::async_write(stream, res, use_awaitable);
            if (!res.keep_alive()) {
                break;
            }
        }
    } catch (const boost::system::system_error& se) {
        if (se.code() != http::error::end_of_stream) {
            STAKE_TRACE << "metrics::Server::handle_connection system_error: " << se.what();
        }
    }
    boost::system::error_code ec;
    stream.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_send, ec);
}

}  // namespace stakeoracle::metrics
