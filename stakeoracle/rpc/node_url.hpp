// Copyright 2025 The Stakeoracle Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace stakeoracle::rpc {

//! Address of a JSON-RPC node: ws://host[:port][/target] or http://host[:port][/target]
class NodeUrl {
  public:
    enum class Scheme {
        kWs,
        kWss,
        kHttp,
        kHttps,
    };

    //! \throws std::invalid_argument if the URL is malformed
    explicit NodeUrl(std::string_view url);

    Scheme scheme() const { return scheme_; }
    const std::string& host() const { return host_; }
    uint16_t port() const { return port_; }
    const std::string& target() const { return target_; }

    bool is_websocket() const { return scheme_ == Scheme::kWs || scheme_ == Scheme::kWss; }
    bool is_secure() const { return scheme_ == Scheme::kWss || scheme_ == Scheme::kHttps; }

    //! Value of the Host header
    std::string host_header() const;

    std::string to_string() const;

  private:
    Scheme scheme_{Scheme::kWs};
    std::string host_;
    uint16_t port_{0};
    std::string target_;
};

}  // namespace stakeoracle::rpc
