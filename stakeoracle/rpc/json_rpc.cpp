// Copyright 2025 The Stakeoracle Authors
// SPDX-License-Identifier: Apache-2.0

#include "json_rpc.hpp"

#include <utility>

#include <stakeoracle/core/common/util.hpp>
#include <stakeoracle/rpc/transport.hpp>

namespace stakeoracle::rpc {

nlohmann::json make_json_request(uint64_t id, const std::string& method, nlohmann::json params) {
    return {{"jsonrpc", kJsonVersion}, {"id", id}, {"method", method}, {"params", std::move(params)}};
}

nlohmann::json parse_json_response(const std::string& content) {
    auto response = nlohmann::json::parse(content, /*cb=*/nullptr, /*allow_exceptions=*/false);
    if (response.is_discarded()) {
        throw TransportError{"invalid JSON response: " + abridge(content, 64)};
    }
    if (!response.is_object()) {
        throw TransportError{"JSON-RPC response is not an object: " + abridge(content, 64)};
    }
    return response;
}

std::optional<uint64_t> response_id(const nlohmann::json& response) {
    const auto it = response.find("id");
    if (it == response.end() || !it->is_number_unsigned()) {
        return std::nullopt;
    }
    return it->get<uint64_t>();
}

nlohmann::json response_result(nlohmann::json response) {
    if (const auto error = response.find("error"); error != response.end() && !error->is_null()) {
        const int code = error->value("code", 0);
        const std::string message = error->value("message", std::string{});
        throw RpcError{code, message};
    }
    const auto result = response.find("result");
    if (result == response.end()) {
        throw TransportError{"JSON-RPC response has neither result nor error"};
    }
    return std::move(*result);
}

}  // namespace stakeoracle::rpc
