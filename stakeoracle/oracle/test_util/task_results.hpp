// Copyright 2025 The Stakeoracle Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <type_traits>

#include <stakeoracle/infra/concurrency/task.hpp>

namespace stakeoracle::oracle::test_util {

//! Task completing with the given value, for use in mock actions
template <typename T>
Task<T> ready(T value) {
    co_return value;
}

inline Task<void> ready() {
    co_return;
}

//! Task completing with the given exception, for use in mock actions
template <typename T, typename E>
Task<T> failed(E error) {
    throw error;
    if constexpr (std::is_void_v<T>) {
        co_return;
    } else {
        co_return T{};
    }
}

}  // namespace stakeoracle::oracle::test_util
