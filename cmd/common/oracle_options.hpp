// Copyright 2025 The Stakeoracle Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <CLI/CLI.hpp>

#include <stakeoracle/oracle/settings.hpp>

namespace stakeoracle::cmd::common {

//! CLI11 validator for JSON-RPC node URLs supported by the transports
struct NodeUrlValidator : public CLI::Validator {
    NodeUrlValidator();
};

//! \brief Set up options to populate the oracle settings after cli.parse(), each one also bound to its environment variable
void add_oracle_options(CLI::App& cli, oracle::Settings& settings);

}  // namespace stakeoracle::cmd::common
