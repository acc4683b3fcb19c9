// Copyright 2025 The Stakeoracle Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <optional>
#include <ostream>
#include <string_view>
#include <vector>

#include <evmc/evmc.hpp>
#include <intx/intx.hpp>

#include <stakeoracle/core/common/base.hpp>
#include <stakeoracle/core/common/bytes.hpp>

namespace stakeoracle::oracle {

//! The two chains the oracle talks to
enum class Chain {
    kRelay,
    kPara,
};

std::string_view to_string(Chain chain);

//! 32-byte relay chain public key as stored in the OracleMaster contract
using StashAccount = evmc::bytes32;

//! Staking era of the relay chain
struct Era {
    EraId index{0};
    //! Start timestamp in milliseconds, missing until the era has actually started
    std::optional<uint64_t> start;

    friend bool operator==(const Era&, const Era&) = default;
};

//! Block of the relay chain identified by number and hash
struct BlockRef {
    BlockNum number{0};
    evmc::bytes32 hash;

    friend bool operator==(const BlockRef&, const BlockRef&) = default;
};

enum class StakeStatus : uint8_t {
    kIdle = 0,
    kNominator = 1,
    kValidator = 2,
    kNone = 3,  // no bond at all
};

std::string_view to_string(StakeStatus status);

struct UnlockingChunk {
    intx::uint128 balance{0};
    uint64_t era{0};

    friend bool operator==(const UnlockingChunk&, const UnlockingChunk&) = default;
};

//! Staking state of one stash at the last block of an era, field for field the OracleData contract tuple
struct StakingParameters {
    StashAccount stash_account;
    evmc::bytes32 controller_account;
    StakeStatus stake_status{StakeStatus::kNone};
    intx::uint128 active_balance{0};
    intx::uint128 total_balance{0};
    std::vector<UnlockingChunk> unlocking;
    std::vector<uint32_t> claimed_rewards;
    intx::uint128 stash_balance{0};
    uint32_t slashing_spans{0};

    friend bool operator==(const StakingParameters&, const StakingParameters&) = default;
};

std::ostream& operator<<(std::ostream& out, const StakingParameters& params);

//! Report of one stash for one era, ready to be sent as reportRelay call
struct Report {
    EraId era{0};
    StashAccount stash;
    Bytes calldata;
};

//! Result of a single submission of a report
enum class SubmissionOutcome {
    kConfirmed,
    kReverted,
    kTimeout,
    kNodeError,
    kDryRun,
};

std::string_view to_string(SubmissionOutcome outcome);

}  // namespace stakeoracle::oracle
