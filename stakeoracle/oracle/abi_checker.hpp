// Copyright 2025 The Stakeoracle Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace stakeoracle::oracle {

//! Canonical signatures of the OracleMaster functions called by the oracle
std::vector<std::string_view> oracle_master_signatures();

//! Load a contract ABI from either a bare JSON array or a build artifact holding it under "abi"
//! \throws std::invalid_argument if the file cannot be read or does not contain an ABI
nlohmann::json load_abi(const std::filesystem::path& path);

//! Canonical signature of an ABI function entry, e.g. transfer(address,uint256)
std::string canonical_signature(const nlohmann::json& function);

//! Check that the ABI declares every OracleMaster function called by the oracle
//! \throws std::invalid_argument naming the missing functions
void check_oracle_master_abi(const nlohmann::json& abi);

}  // namespace stakeoracle::oracle
