// Copyright 2025 The Stakeoracle Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <coroutine>
#include <utility>

#include <boost/asio/awaitable.hpp>

// Declared in the top-level namespace so that every component can write Task<void> foo();
namespace stakeoracle {

//! Asynchronous task returned by any coroutine, i.e. asynchronous operation
template <typename T>
using Task = boost::asio::awaitable<T>;

}  // namespace stakeoracle
