// Copyright 2025 The Stakeoracle Authors
// SPDX-License-Identifier: Apache-2.0

#include "endpoint_pool.hpp"

#include <catch2/catch_test_macros.hpp>

#include <stakeoracle/infra/test_util/log.hpp>
#include <stakeoracle/infra/test_util/task_runner.hpp>
#include <stakeoracle/oracle/test_util/fake_node.hpp>

namespace stakeoracle::oracle {

using namespace std::chrono_literals;

TEST_CASE("EndpointPool", "[oracle][endpoint_pool]") {
    stakeoracle::test_util::SetLogVerbosityGuard log_guard{log::Level::kNone};
    stakeoracle::test_util::TaskRunner runner;
    test_util::FakeNetwork network;
    const std::vector<std::string> relay_urls{"ws://relay-1:9944", "ws://relay-2:9944", "ws://relay-3:9944"};
    const std::vector<std::string> para_urls{"ws://para-1:9944"};

    SECTION("first reachable endpoint in configured order") {
        network.node("ws://relay-1:9944").reachable = false;
        network.node("ws://relay-2:9944").reachable = false;
        EndpointPool pool{network.factory(), relay_urls, para_urls, 1s};

        Endpoint* endpoint = runner.run(pool.current_endpoint(Chain::kRelay));
        CHECK(endpoint->url() == "ws://relay-3:9944");
        CHECK(endpoint->state() == EndpointState::kHealthy);
        CHECK(pool.endpoints(Chain::kRelay)[0]->state() == EndpointState::kFailed);
        CHECK(pool.endpoints(Chain::kRelay)[1]->state() == EndpointState::kFailed);
        CHECK(network.node("ws://relay-1:9944").connects == 1);
        CHECK(network.node("ws://relay-2:9944").connects == 1);
        CHECK(network.node("ws://relay-3:9944").connects == 1);

        // Healthy current endpoint is reused without reconnecting
        CHECK(runner.run(pool.current_endpoint(Chain::kRelay)) == endpoint);
        CHECK(network.node("ws://relay-3:9944").connects == 1);
    }

    SECTION("failover after mark_failed") {
        EndpointPool pool{network.factory(), relay_urls, para_urls, 1s};
        Endpoint* first = runner.run(pool.current_endpoint(Chain::kRelay));
        CHECK(first->url() == "ws://relay-1:9944");
        pool.mark_failed(Chain::kRelay, *first);
        CHECK(first->state() == EndpointState::kFailed);
        CHECK_THROWS_AS(first->transport(), rpc::TransportError);
        Endpoint* second = runner.run(pool.current_endpoint(Chain::kRelay));
        CHECK(second->url() == "ws://relay-2:9944");
    }

    SECTION("all endpoints failing: each tried exactly once") {
        for (const auto& url : relay_urls) {
            network.node(url).reachable = false;
        }
        EndpointPool pool{network.factory(), relay_urls, para_urls, 1s};
        CHECK_THROWS_AS(runner.run(pool.current_endpoint(Chain::kRelay)), NoHealthyEndpointError);
        for (const auto& url : relay_urls) {
            CHECK(network.node(url).connects == 1);
        }
        // Failed endpoints are not retried until reconnect
        CHECK_THROWS_AS(runner.run(pool.current_endpoint(Chain::kRelay)), NoHealthyEndpointError);
        for (const auto& url : relay_urls) {
            CHECK(network.node(url).connects == 1);
        }
        // The other chain is unaffected
        CHECK(runner.run(pool.current_endpoint(Chain::kPara))->url() == "ws://para-1:9944");
    }

    SECTION("reconnect resets failed endpoints") {
        for (const auto& url : relay_urls) {
            network.node(url).reachable = false;
        }
        EndpointPool pool{network.factory(), relay_urls, para_urls, 1s};
        CHECK_THROWS_AS(runner.run(pool.current_endpoint(Chain::kRelay)), NoHealthyEndpointError);

        network.node("ws://relay-2:9944").reachable = true;
        runner.run(pool.reconnect(Chain::kRelay));
        CHECK(pool.endpoints(Chain::kRelay)[0]->state() == EndpointState::kFailed);
        CHECK(pool.endpoints(Chain::kRelay)[1]->state() == EndpointState::kHealthy);
        CHECK(pool.endpoints(Chain::kRelay)[2]->state() == EndpointState::kUntried);
        CHECK(runner.run(pool.current_endpoint(Chain::kRelay))->url() == "ws://relay-2:9944");
    }

    SECTION("empty configuration") {
        CHECK_THROWS_AS((EndpointPool{network.factory(), {}, para_urls, 1s}), std::invalid_argument);
    }
}

}  // namespace stakeoracle::oracle
