// Copyright 2025 The Stakeoracle Authors
// SPDX-License-Identifier: Apache-2.0

#include <exception>
#include <filesystem>
#include <string>
#include <vector>

#include <CLI/CLI.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <intx/intx.hpp>

#include <stakeoracle/core/common/util.hpp>
#include <stakeoracle/infra/cli/common.hpp>
#include <stakeoracle/infra/cli/graceful_shutdown.hpp>
#include <stakeoracle/infra/cli/shutdown_signal.hpp>
#include <stakeoracle/infra/common/log.hpp>
#include <stakeoracle/infra/metrics/registry.hpp>
#include <stakeoracle/infra/metrics/server.hpp>
#include <stakeoracle/oracle/abi_checker.hpp>
#include <stakeoracle/oracle/chain_client.hpp>
#include <stakeoracle/oracle/endpoint_pool.hpp>
#include <stakeoracle/oracle/era_cycle.hpp>
#include <stakeoracle/oracle/mode_state.hpp>
#include <stakeoracle/oracle/oracle_key.hpp>
#include <stakeoracle/oracle/oracle_master_reader.hpp>
#include <stakeoracle/oracle/oracle_metrics.hpp>
#include <stakeoracle/oracle/relay_chain_reader.hpp>
#include <stakeoracle/oracle/settings.hpp>
#include <stakeoracle/oracle/stall_detector.hpp>
#include <stakeoracle/oracle/transaction_builder.hpp>
#include <stakeoracle/oracle/transaction_submitter.hpp>
#include <stakeoracle/rpc/transport_factory.hpp>

#include "common/oracle_options.hpp"

using namespace stakeoracle;
using namespace stakeoracle::cmd::common;
using namespace stakeoracle::oracle;

// Contracts shorter than this are just a proxy stub or nothing at all
constexpr size_t kMinContractCodeSize{3};
constexpr std::chrono::seconds kStallCheckInterval{10};

static OracleKey load_oracle_key(const Settings& settings) {
    if (!settings.private_key_hex.empty()) {
        return OracleKey::from_hex(settings.private_key_hex);
    }
    return OracleKey::from_file(settings.private_key_file);
}

static std::string join(const std::vector<std::string>& items) {
    std::string out;
    for (const auto& item : items) {
        if (!out.empty()) out += ",";
        out += item;
    }
    return out;
}

// Never logs the private key
static void log_settings(const Settings& settings) {
    log::Info("Relay chain nodes", {"urls", join(settings.relay_urls)});
    log::Info("Parachain nodes", {"urls", join(settings.para_urls)});
    log::Info("Era", {"blocks", std::to_string(settings.era_duration_in_blocks),
                      "seconds", std::to_string(settings.era_duration.count()),
                      "update_delay", std::to_string(settings.era_update_delay.count()),
                      "delay_time", std::to_string(settings.era_delay_time.count()),
                      "frequency", std::to_string(settings.frequency_of_requests.count())});
    log::Info("Gas", {"limit", std::to_string(settings.gas.gas_limit),
                      "max_priority_fee", intx::to_string(settings.gas.max_priority_fee),
                      "max_fee", settings.gas.max_fee ? intx::to_string(*settings.gas.max_fee) : "derived"});
    log::Info("Timeouts", {"connect", std::to_string(settings.timeout.count()),
                           "request", std::to_string(settings.request_timeout.count()),
                           "recovery_patience", std::to_string(settings.recovery_patience.count()),
                           "shutdown_grace", std::to_string(settings.shutdown_grace.count())});
}

static Task<void> check_contract(OracleMaster& master, const Settings& settings) {
    const auto code{co_await master.code()};
    if (code.size() < kMinContractCodeSize) {
        throw FatalError{"no contract deployed at " + to_hex(settings.contract_address)};
    }

    if (std::filesystem::exists(settings.contract_abi_path)) {
        check_oracle_master_abi(load_abi(settings.contract_abi_path));
    } else {
        log::Warning("OracleMaster ABI not found, check skipped", {"path", settings.contract_abi_path.string()});
    }
}

static Task<void> run_oracle(OracleMaster& master, EraCycle& cycle, const Settings& settings) {
    co_await check_contract(master, settings);
    co_await cycle.run();
}

static int run(const Settings& settings) {
    const auto key{load_oracle_key(settings)};
    log::Info("Oracle starting", {"address", to_hex(key.address()),
                                  "contract", to_hex(settings.contract_address),
                                  "debug", settings.debug_mode ? "true" : "false"});
    log_settings(settings);

    boost::asio::io_context ioc;
    auto executor{ioc.get_executor()};

    metrics::Registry registry{settings.metrics_prefix};
    OracleMetrics metrics{registry};

    EndpointPool pool{rpc::make_transport_factory(executor, settings.request_timeout),
                      settings.relay_urls, settings.para_urls, settings.timeout};
    ChainClient client{pool, metrics};
    RelayChainReader relay{client};
    OracleMasterReader master{client, settings.contract_address, key.address()};

    TransactionBuilder builder{master, key, settings.contract_address, settings.gas};
    ContractSubmitter contract_submitter{master, builder, metrics, settings.receipt_polling};
    DryRunSubmitter dry_run_submitter{builder, metrics};
    TransactionSubmitter& submitter = settings.debug_mode ? static_cast<TransactionSubmitter&>(dry_run_submitter)
                                                          : static_cast<TransactionSubmitter&>(contract_submitter);

    ModeState mode_state{StallDetector::Clock::now()};
    StallDetector stall_detector{executor, mode_state, metrics, settings.stall_thresholds(), kStallCheckInterval};

    EraCycle::Reconnector reconnector = [&pool]() -> Task<void> {
        co_await pool.reconnect(Chain::kRelay);
        co_await pool.reconnect(Chain::kPara);
    };
    EraCycle cycle{executor, relay, master, submitter, stall_detector, metrics,
                   std::move(reconnector), settings.era_cycle_settings(key.address())};

    metrics::Server metrics_server{settings.metrics_end_point(), registry, executor};
    metrics_server.start();
    log::Info("Metrics server listening", {"port", std::to_string(metrics_server.port())});

    ShutdownSignal shutdown_signal{executor};
    GracefulShutdown shutdown{executor, settings.shutdown_grace, [&cycle]() { cycle.request_stop(); }};
    shutdown.on_resolved([&](ShutdownReason reason) {
        log::Info("Oracle stopping", {"reason", std::string{to_string(reason)}});
        shutdown_signal.cancel();
        stall_detector.stop();
        metrics_server.stop();
        ioc.stop();
    });
    shutdown_signal.on_signal([&shutdown](ShutdownSignal::SignalNumber signal_number) {
        shutdown.notify_signal(signal_number);
    });

    boost::asio::co_spawn(executor, stall_detector.run(), [](std::exception_ptr eptr) {
        if (eptr) std::rethrow_exception(eptr);
    });

    std::exception_ptr failure;
    boost::asio::co_spawn(executor, run_oracle(master, cycle, settings), [&](std::exception_ptr eptr) {
        failure = eptr;
        shutdown.notify_completed();
    });

    ioc.run();

    if (failure) {
        std::rethrow_exception(failure);
    }
    log::Info("Oracle stopped");
    return 0;
}

int main(int argc, char* argv[]) {
    CLI::App cli{"Stakeoracle - reports relay chain staking ledgers to the OracleMaster contract once per era"};

    log::Settings log_settings;
    Settings settings;

    try {
        add_logging_options(cli, log_settings);
        add_oracle_options(cli, settings);
        cli.parse(argc, argv);

        log::init(log_settings);
        log::set_thread_name("main");

        return run(settings);
    } catch (const CLI::ParseError& pe) {
        return cli.exit(pe);
    } catch (const FatalError& e) {
        log::Critical("Oracle terminated", {"error", e.what()});
        return -1;
    } catch (const std::exception& e) {
        log::Critical("Oracle exiting due to exception", {"error", e.what()});
        return -2;
    } catch (...) {
        log::Critical("Oracle exiting due to unexpected exception");
        return -3;
    }
}
