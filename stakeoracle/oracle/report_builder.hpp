// Copyright 2025 The Stakeoracle Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <string_view>

#include <stakeoracle/oracle/types.hpp>

namespace stakeoracle::oracle {

//! Canonical signature of the OracleMaster report function
inline constexpr std::string_view kReportRelaySignature{
    "reportRelay(uint64,(bytes32,bytes32,uint8,uint128,uint128,(uint128,uint64)[],uint32[],uint128,uint32))"};

//! \brief Build the reportRelay call of the stash for the era
//! \remarks Pure function: the same inputs always give byte-identical calldata
Report build_report(EraId era, const StashAccount& stash, const StakingParameters& params);

}  // namespace stakeoracle::oracle
