// Copyright 2025 The Stakeoracle Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <chrono>

#include <stakeoracle/infra/concurrency/task.hpp>

namespace stakeoracle {

//! Suspend the calling coroutine for the given duration on the current executor
Task<void> sleep(std::chrono::milliseconds duration);

}  // namespace stakeoracle
