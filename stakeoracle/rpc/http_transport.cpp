// Copyright 2025 The Stakeoracle Authors
// SPDX-License-Identifier: Apache-2.0

#include "http_transport.hpp"

#include <utility>

#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/http.hpp>
#include <boost/system/system_error.hpp>

#include <stakeoracle/core/common/util.hpp>
#include <stakeoracle/infra/common/log.hpp>
#include <stakeoracle/rpc/json_rpc.hpp>
#include <stakeoracle/rpc/tcp_connect.hpp>

namespace stakeoracle::rpc {

using boost::asio::use_awaitable;
namespace http = boost::beast::http;

HttpTransport::HttpTransport(const boost::asio::any_io_executor& executor, NodeUrl node_url, std::chrono::milliseconds request_timeout)
    : executor_{executor},
      node_url_{std::move(node_url)},
      url_{node_url_.to_string()},
      request_timeout_{request_timeout} {}

HttpTransport::~HttpTransport() {
    close();
}

Task<void> HttpTransport::connect(std::chrono::milliseconds timeout) {
    close();
    auto stream = std::make_unique<boost::beast::tcp_stream>(executor_);
    co_await connect_tcp(*stream, node_url_, timeout);
    stream_ = std::move(stream);
    STAKE_DEBUG << "HttpTransport::connect connected to " << url_;
}

Task<nlohmann::json> HttpTransport::call(const std::string& method, nlohmann::json params) {
    // The node may have closed an idle keep-alive connection
    if (!stream_) {
        co_await connect(request_timeout_);
    }

    const auto request_id = next_request_id_++;
    http::request<http::string_body> req{http::verb::post, node_url_.target(), 11};
    req.set(http::field::host, node_url_.host_header());
    req.set(http::field::user_agent, kUserAgent);
    req.set(http::field::content_type, "application/json");
    req.keep_alive(true);
    req.body() = make_json_request(request_id, method, std::move(params)).dump();
    req.prepare_payload();

    http::response<http::string_body> res;
    try {
        stream_->expires_after(request_timeout_);
        co_await http::async_write(*stream_, req, use_awaitable);
        boost::beast::flat_buffer buffer;
        co_await http::async_read(*stream_, buffer, res, use_awaitable);
        stream_->expires_never();
    } catch (const boost::system::system_error& se) {
        stream_.reset();
        throw TransportError{"HTTP request to " + url_ + " failed: " + se.code().message()};
    }
    STAKE_TRACE << "HttpTransport::call " << url_ << " status: " << res.result_int() << " [" << abridge(res.body(), 256) << "]";

    if (!res.keep_alive()) {
        close();
    }
    if (res.result() != http::status::ok) {
        throw TransportError{"HTTP status " + std::to_string(res.result_int()) + " from " + url_};
    }

    auto response = parse_json_response(res.body());
    if (response_id(response) != request_id) {
        throw TransportError{"JSON-RPC response id mismatch from " + url_};
    }
    co_return response_result(std::move(response));
}

void HttpTransport::close() {
    if (!stream_) return;
    boost::system::error_code ec;
    stream_->socket().shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
    stream_->socket().close(ec);
    stream_.reset();
}

}  // namespace stakeoracle::rpc
