// Copyright 2025 The Stakeoracle Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <chrono>

#include <CLI/CLI.hpp>

#include <stakeoracle/infra/common/log.hpp>

namespace stakeoracle::cmd::common {

//! \brief Set up options to populate log settings after cli.parse()
void add_logging_options(CLI::App& cli, log::Settings& log_settings);

//! \brief Set up an option expressed in whole seconds, bound to the given environment variable
CLI::Option* add_option_seconds(CLI::App& cli, const std::string& name, std::chrono::seconds& value,
                                const std::string& description, const std::string& env_name);

}  // namespace stakeoracle::cmd::common
