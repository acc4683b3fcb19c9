// Copyright 2025 The Stakeoracle Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include <stakeoracle/rpc/transport.hpp>

namespace stakeoracle::oracle::test_util {

//! In-memory JSON-RPC node answering through per-method handlers
struct FakeNode {
    using Handler = std::function<nlohmann::json(const nlohmann::json& params)>;

    bool reachable{true};
    bool fail_calls{false};
    int connects{0};
    std::vector<std::string> calls;
    std::map<std::string, Handler> handlers;

    void on(const std::string& method, Handler handler) { handlers[method] = std::move(handler); }

    void reply(const std::string& method, nlohmann::json result) {
        handlers[method] = [result = std::move(result)](const nlohmann::json&) { return result; };
    }
};

class FakeTransport : public rpc::Transport {
  public:
    FakeTransport(std::string url, FakeNode& node) : url_{std::move(url)}, node_{node} {}

    const std::string& url() const override { return url_; }

    Task<void> connect(std::chrono::milliseconds /*timeout*/) override {
        ++node_.connects;
        if (!node_.reachable) {
            throw rpc::TransportError{"connection refused: " + url_};
        }
        connected_ = true;
        co_return;
    }

    Task<nlohmann::json> call(const std::string& method, nlohmann::json params) override {
        node_.calls.push_back(method);
        if (!connected_ || node_.fail_calls) {
            throw rpc::TransportError{"connection reset: " + url_};
        }
        const auto it = node_.handlers.find(method);
        if (it == node_.handlers.end()) {
            throw rpc::RpcError{-32601, "Method not found"};
        }
        co_return it->second(params);
    }

    void close() override { connected_ = false; }

  private:
    std::string url_;
    FakeNode& node_;
    bool connected_{false};
};

//! Set of fake nodes addressed by URL, usable as transport factory
class FakeNetwork {
  public:
    FakeNode& node(const std::string& url) { return nodes_[url]; }

    rpc::TransportFactory factory() {
        return [this](const std::string& url) -> std::unique_ptr<rpc::Transport> {
            return std::make_unique<FakeTransport>(url, nodes_[url]);
        };
    }

  private:
    std::map<std::string, FakeNode> nodes_;
};

}  // namespace stakeoracle::oracle::test_util
