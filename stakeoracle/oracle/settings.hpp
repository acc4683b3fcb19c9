// Copyright 2025 The Stakeoracle Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include <evmc/evmc.hpp>

#include <stakeoracle/oracle/era_cycle.hpp>
#include <stakeoracle/oracle/stall_detector.hpp>
#include <stakeoracle/oracle/transaction_builder.hpp>
#include <stakeoracle/oracle/transaction_submitter.hpp>

namespace stakeoracle::oracle {

//! Configuration of the oracle daemon
struct Settings {
    std::vector<std::string> relay_urls;
    std::vector<std::string> para_urls;

    evmc::address contract_address;
    std::filesystem::path contract_abi_path{"./assets/OracleMaster.json"};

    std::filesystem::path private_key_file;
    std::string private_key_hex;

    uint64_t era_duration_in_blocks{0};
    std::chrono::seconds era_duration{0};
    std::chrono::seconds era_update_delay{360};
    std::chrono::seconds era_delay_time{600};
    std::chrono::seconds frequency_of_requests{180};

    GasSettings gas;

    std::chrono::seconds timeout{60};
    std::chrono::seconds request_timeout{30};
    ReceiptPolling receipt_polling;
    std::chrono::seconds recovery_patience{600};
    std::chrono::seconds shutdown_grace{30};

    bool debug_mode{false};

    uint16_t metrics_port{8000};
    std::string metrics_prefix;

    StallThresholds stall_thresholds() const {
        return StallThresholds{
            .era_update = era_duration + era_update_delay,
            .report_delay = era_duration + era_delay_time,
        };
    }

    EraCycleSettings era_cycle_settings(const evmc::address& oracle) const {
        return EraCycleSettings{
            .era_duration_in_blocks = era_duration_in_blocks,
            .era_duration = era_duration,
            .frequency_of_requests = frequency_of_requests,
            .timeout = timeout,
            .recovery_patience = recovery_patience,
            .oracle = oracle,
        };
    }

    std::string metrics_end_point() const { return "0.0.0.0:" + std::to_string(metrics_port); }
};

}  // namespace stakeoracle::oracle
