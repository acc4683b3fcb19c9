// Copyright 2025 The Stakeoracle Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

#include <stakeoracle/infra/concurrency/task.hpp>

namespace stakeoracle::rpc {

//! Connection-level failure: connect, read, write, timeout or unparsable response
class TransportError : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
};

//! The node answered with a JSON-RPC error object
class RpcError : public std::runtime_error {
  public:
    RpcError(int code, const std::string& message)
        : std::runtime_error{"JSON-RPC error " + std::to_string(code) + ": " + message},
          code_{code},
          message_{message} {}

    int code() const noexcept { return code_; }
    const std::string& message() const noexcept { return message_; }

  private:
    int code_;
    std::string message_;
};

//! JSON-RPC client connection to a single node
//! \warning Calls must not overlap: a transport serves one request at a time
class Transport {
  public:
    virtual ~Transport() = default;

    virtual const std::string& url() const = 0;

    //! Open the connection within the given timeout, throw TransportError on failure
    virtual Task<void> connect(std::chrono::milliseconds timeout) = 0;

    //! Send a request and return its "result" member
    //! \throws RpcError if the node replies with an error object, TransportError on connection failure
    virtual Task<nlohmann::json> call(const std::string& method, nlohmann::json params) = 0;

    virtual void close() = 0;
};

using TransportFactory = std::function<std::unique_ptr<Transport>(const std::string& url)>;

}  // namespace stakeoracle::rpc
