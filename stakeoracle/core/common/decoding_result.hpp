// Copyright 2025 The Stakeoracle Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <string_view>

#include <tl/expected.hpp>

namespace stakeoracle {

// Error codes for SCALE and ABI decoding of chain data
enum class [[nodiscard]] DecodingError {
    kInputTooShort,
    kInputTooLong,
    kOverflow,
    kInvalidCompactPrefix,
    kInvalidOptionTag,
    kInvalidBool,
    kInvalidOffset,
    kUnexpectedLength,
};

std::string_view to_string(DecodingError error);

using DecodingResult = tl::expected<void, DecodingError>;

}  // namespace stakeoracle
