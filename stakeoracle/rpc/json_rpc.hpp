// Copyright 2025 The Stakeoracle Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace stakeoracle::rpc {

inline constexpr const char* kJsonVersion{"2.0"};

nlohmann::json make_json_request(uint64_t id, const std::string& method, nlohmann::json params);

//! \brief Parse a response body, throw TransportError if it is not a JSON-RPC 2.0 response object
nlohmann::json parse_json_response(const std::string& content);

//! \brief Extract the numeric id of a response, if any
std::optional<uint64_t> response_id(const nlohmann::json& response);

//! \brief Extract the result of a response
//! \throws RpcError on error objects, TransportError when neither result nor error is present
nlohmann::json response_result(nlohmann::json response);

}  // namespace stakeoracle::rpc
