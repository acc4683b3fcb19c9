// Copyright 2025 The Stakeoracle Authors
// SPDX-License-Identifier: Apache-2.0

#include "json_rpc.hpp"

#include <catch2/catch_test_macros.hpp>

#include <stakeoracle/rpc/transport.hpp>

namespace stakeoracle::rpc {

TEST_CASE("make_json_request", "[rpc][json_rpc]") {
    const auto request = make_json_request(7, "eth_chainId", nlohmann::json::array());
    CHECK(request == R"({"jsonrpc":"2.0","id":7,"method":"eth_chainId","params":[]})"_json);
}

TEST_CASE("parse_json_response", "[rpc][json_rpc]") {
    SECTION("valid object") {
        const auto response = parse_json_response(R"({"jsonrpc":"2.0","id":3,"result":"0x1"})");
        CHECK(response_id(response) == 3);
        CHECK(response_result(response) == "0x1");
    }
    SECTION("not JSON") {
        CHECK_THROWS_AS(parse_json_response("<html>502 Bad Gateway</html>"), TransportError);
    }
    SECTION("not an object") {
        CHECK_THROWS_AS(parse_json_response("[1,2]"), TransportError);
    }
}

TEST_CASE("response_id", "[rpc][json_rpc]") {
    CHECK_FALSE(response_id(R"({"jsonrpc":"2.0","method":"chain_newHead","params":{}})"_json));
    CHECK_FALSE(response_id(R"({"jsonrpc":"2.0","id":"abc","result":null})"_json));
}

TEST_CASE("response_result", "[rpc][json_rpc]") {
    SECTION("null result is a valid result") {
        CHECK(response_result(R"({"jsonrpc":"2.0","id":1,"result":null})"_json).is_null());
    }
    SECTION("error object") {
        const auto response = R"({"jsonrpc":"2.0","id":1,"error":{"code":-32000,"message":"execution reverted"}})"_json;
        try {
            response_result(response);
            FAIL("RpcError expected");
        } catch (const RpcError& e) {
            CHECK(e.code() == -32000);
            CHECK(e.message() == "execution reverted");
        }
    }
    SECTION("neither result nor error") {
        CHECK_THROWS_AS(response_result(R"({"jsonrpc":"2.0","id":1})"_json), TransportError);
    }
}

}  // namespace stakeoracle::rpc
