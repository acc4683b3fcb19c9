// Copyright 2025 The Stakeoracle Authors
// SPDX-License-Identifier: Apache-2.0

#include "oracle_options.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <string>

#include <intx/intx.hpp>

#include <stakeoracle/core/common/util.hpp>
#include <stakeoracle/infra/cli/common.hpp>
#include <stakeoracle/rpc/node_url.hpp>

namespace stakeoracle::cmd::common {

NodeUrlValidator::NodeUrlValidator() {
    name_ = "NODE_URL";
    func_ = [](const std::string& value) -> std::string {
        try {
            const rpc::NodeUrl url{value};
            if (url.is_secure()) {
                return "Value " + value + " uses a secure scheme but TLS is not supported, use ws:// or http://";
            }
        } catch (const std::invalid_argument& ex) {
            return "Value " + value + " is not a valid node URL: " + ex.what();
        }
        return {};
    };
}

//! CLI11 validator for decimal amounts of wei
struct WeiAmountValidator : public CLI::Validator {
    WeiAmountValidator() {
        name_ = "WEI";
        func_ = [](const std::string& value) -> std::string {
            if (value.empty() || value.size() > 78 || !std::all_of(value.cbegin(), value.cend(), [](unsigned char c) { return std::isdigit(c); })) {
                return "Value " + value + " is not a valid amount of wei";
            }
            return {};
        };
    }
};

static intx::uint256 parse_wei(const std::string& value) {
    try {
        return intx::from_string<intx::uint256>(value);
    } catch (const std::exception&) {
        throw CLI::ValidationError{"Value " + value + " overflows 256 bits"};
    }
}

void add_oracle_options(CLI::App& cli, oracle::Settings& settings) {
    auto& node_opts = *cli.add_option_group("Nodes", "Relay chain and parachain nodes");
    node_opts.add_option("--relay.urls", settings.relay_urls)
        ->description("Relay chain node URLs as comma-separated list, tried in order")
        ->envname("WS_URLS_RELAY")
        ->delimiter(',')
        ->required()
        ->check(NodeUrlValidator());
    node_opts.add_option("--para.urls", settings.para_urls)
        ->description("Parachain node URLs as comma-separated list, tried in order")
        ->envname("WS_URLS_PARA")
        ->delimiter(',')
        ->required()
        ->check(NodeUrlValidator());
    add_option_seconds(node_opts, "--timeout", settings.timeout,
                       "Connection timeout and pause before reconnecting in seconds", "TIMEOUT");
    add_option_seconds(node_opts, "--request.timeout", settings.request_timeout,
                       "Timeout of each JSON-RPC request in seconds", "REQUEST_TIMEOUT");

    auto& contract_opts = *cli.add_option_group("Contract", "OracleMaster contract");
    contract_opts
        .add_option_function<std::string>(
            "--contract.address",
            [&settings](const std::string& value) {
                const auto address{address_from_hex(value)};
                if (!address) {
                    throw CLI::ValidationError{"--contract.address", "Value " + value + " is not a 20-byte hex address"};
                }
                settings.contract_address = *address;
            },
            "OracleMaster contract address")
        ->envname("CONTRACT_ADDRESS")
        ->required();
    contract_opts.add_option("--contract.abi", settings.contract_abi_path)
        ->description("OracleMaster ABI file, checked at startup if present")
        ->envname("ORACLE_MASTER_CONTRACT_ABI_PATH")
        ->check(CLI::ExistingFile)
        ->capture_default_str();

    auto& key_opts = *cli.add_option_group("Key", "Oracle private key, either from a file or as hex");
    key_opts.add_option("--key.file", settings.private_key_file)
        ->description("File holding the hex private key of the oracle")
        ->envname("ORACLE_PRIVATE_KEY_PATH")
        ->check(CLI::ExistingFile);
    key_opts.add_option("--key.hex", settings.private_key_hex)
        ->description("Hex private key of the oracle")
        ->envname("ORACLE_PRIVATE_KEY");
    key_opts.require_option(1);

    auto& era_opts = *cli.add_option_group("Era", "Era timing");
    era_opts.add_option("--era.duration.blocks", settings.era_duration_in_blocks)
        ->description("Era duration in relay chain blocks")
        ->envname("ERA_DURATION_IN_BLOCKS")
        ->required()
        ->check(CLI::PositiveNumber);
    add_option_seconds(era_opts, "--era.duration.seconds", settings.era_duration, "Era duration in seconds",
                       "ERA_DURATION_IN_SECONDS")
        ->required()
        ->check(CLI::PositiveNumber);
    add_option_seconds(era_opts, "--era.update-delay", settings.era_update_delay,
                       "Tolerated delay of the era update after the era duration in seconds", "ERA_UPDATE_DELAY");
    add_option_seconds(era_opts, "--era.delay-time", settings.era_delay_time,
                       "Tolerated delay of the reports after the era duration in seconds", "ERA_DELAY_TIME");
    add_option_seconds(era_opts, "--requests.frequency", settings.frequency_of_requests,
                       "Interval between active era requests in seconds", "FREQUENCY_OF_REQUESTS");

    auto& gas_opts = *cli.add_option_group("Gas", "Report transactions");
    gas_opts.add_option("--gas.limit", settings.gas.gas_limit)
        ->description("Gas limit of the report transactions")
        ->envname("GAS_LIMIT")
        ->check(CLI::PositiveNumber)
        ->capture_default_str();
    gas_opts
        .add_option_function<std::string>(
            "--gas.max-priority-fee",
            [&settings](const std::string& value) { settings.gas.max_priority_fee = parse_wei(value); },
            "Max priority fee per gas in wei")
        ->envname("MAX_PRIORITY_FEE_PER_GAS")
        ->check(WeiAmountValidator())
        ->default_str("0");
    gas_opts
        .add_option_function<std::string>(
            "--gas.max-fee",
            [&settings](const std::string& value) { settings.gas.max_fee = parse_wei(value); },
            "Max fee per gas in wei, twice the base fee plus the priority fee if missing")
        ->envname("MAX_FEE_PER_GAS")
        ->check(WeiAmountValidator());
    gas_opts.add_option("--receipt.attempts", settings.receipt_polling.attempts)
        ->description("Receipt polls before a transaction is considered timed out")
        ->check(CLI::Range(1u, 100'000u))
        ->capture_default_str();
    gas_opts
        .add_option_function<int64_t>(
            "--receipt.interval",
            [&settings](const int64_t& seconds) { settings.receipt_polling.interval = std::chrono::seconds{seconds}; },
            "Interval between receipt polls in seconds")
        ->check(CLI::NonNegativeNumber)
        ->default_str("2");

    auto& service_opts = *cli.add_option_group("Service", "Service behaviour");
    add_option_seconds(service_opts, "--recovery.patience", settings.recovery_patience,
                       "Longest endpoint outage tolerated before exiting in seconds", "WAITING_TIME_BEFORE_SHUTDOWN");
    add_option_seconds(service_opts, "--shutdown.grace", settings.shutdown_grace,
                       "Time given to the in-flight report at shutdown in seconds", "SHUTDOWN_GRACE_PERIOD");
    service_opts.add_flag("--debug", settings.debug_mode)
        ->description("Build and sign the reports without sending them")
        ->envname("DEBUG_MODE");
    service_opts.add_option("--metrics.port", settings.metrics_port)
        ->description("Prometheus metrics listening port")
        ->envname("PROMETHEUS_METRICS_PORT")
        ->check(CLI::Range(1, 65535))
        ->capture_default_str();
    service_opts.add_option("--metrics.prefix", settings.metrics_prefix)
        ->description("Prefix of the Prometheus metric names")
        ->envname("PROMETHEUS_METRICS_PREFIX");
}

}  // namespace stakeoracle::cmd::common
