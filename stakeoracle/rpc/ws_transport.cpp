// Copyright 2025 The Stakeoracle Authors
// SPDX-License-Identifier: Apache-2.0

#include "ws_transport.hpp"

#include <utility>

#include <boost/asio/buffer.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core/buffers_to_string.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/http/field.hpp>
#include <boost/beast/websocket/rfc6455.hpp>
#include <boost/system/system_error.hpp>

#include <stakeoracle/core/common/util.hpp>
#include <stakeoracle/infra/common/log.hpp>
#include <stakeoracle/rpc/json_rpc.hpp>
#include <stakeoracle/rpc/tcp_connect.hpp>

namespace stakeoracle::rpc {

using boost::asio::use_awaitable;
namespace websocket = boost::beast::websocket;

WsTransport::WsTransport(const boost::asio::any_io_executor& executor, NodeUrl node_url, std::chrono::milliseconds request_timeout)
    : executor_{executor},
      node_url_{std::move(node_url)},
      url_{node_url_.to_string()},
      request_timeout_{request_timeout} {}

WsTransport::~WsTransport() {
    close();
}

Task<void> WsTransport::connect(std::chrono::milliseconds timeout) {
    close();

    auto stream = std::make_unique<WebSocketStream>(executor_);
    auto& tcp_stream = boost::beast::get_lowest_layer(*stream);
    co_await connect_tcp(tcp_stream, node_url_, timeout);

    stream->set_option(websocket::stream_base::decorator([](websocket::request_type& req) {
        req.set(boost::beast::http::field::user_agent, kUserAgent);
    }));
    stream->auto_fragment(false);

    try {
        tcp_stream.expires_after(timeout);
        co_await stream->async_handshake(node_url_.host_header(), node_url_.target(), use_awaitable);
        tcp_stream.expires_never();
    } catch (const boost::system::system_error& se) {
        throw TransportError{"websocket handshake with " + url_ + " failed: " + se.code().message()};
    }

    stream_ = std::move(stream);
    STAKE_DEBUG << "WsTransport::connect connected to " << url_;
}

Task<nlohmann::json> WsTransport::call(const std::string& method, nlohmann::json params) {
    if (!stream_) {
        throw TransportError{"not connected to " + url_};
    }

    const auto request_id = next_request_id_++;
    const auto request = make_json_request(request_id, method, std::move(params)).dump();

    auto& tcp_stream = boost::beast::get_lowest_layer(*stream_);
    tcp_stream.expires_after(request_timeout_);
    co_await do_write(request);

    nlohmann::json response;
    while (true) {
        auto message = parse_json_response(co_await do_read());
        if (response_id(message) == request_id) {
            response = std::move(message);
            break;
        }
        STAKE_TRACE << "WsTransport::call skipping unrelated message from " << url_;
    }
    tcp_stream.expires_never();

    co_return response_result(std::move(response));
}

void WsTransport::close() {
    if (!stream_) return;
    boost::system::error_code ec;
    boost::beast::get_lowest_layer(*stream_).socket().close(ec);
    if (ec) {
        STAKE_TRACE << "WsTransport::close " << url_ << " error: " << ec.message();
    }
    stream_.reset();
}

Task<void> WsTransport::do_write(const std::string& content) {
    try {
        co_await stream_->async_write(boost::asio::buffer(content), use_awaitable);
        STAKE_TRACE << "WsTransport::do_write " << url_ << ": [" << abridge(content, 256) << "]";
    } catch (const boost::system::system_error& se) {
        stream_.reset();
        throw TransportError{"write to " + url_ + " failed: " + se.code().message()};
    }
}

Task<std::string> WsTransport::do_read() {
    boost::beast::flat_buffer buffer;
    try {
        co_await stream_->async_read(buffer, use_awaitable);
    } catch (const boost::system::system_error& se) {
        stream_.reset();
        throw TransportError{"read from " + url_ + " failed: " + se.code().message()};
    }
    auto content = boost::beast::buffers_to_string(buffer.data());
    STAKE_TRACE << "WsTransport::do_read " << url_ << ": [" << abridge(content, 256) << "]";
    co_return content;
}

}  // namespace stakeoracle::rpc
