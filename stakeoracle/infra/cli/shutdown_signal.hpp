// Copyright 2025 The Stakeoracle Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <csignal>
#include <functional>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/signal_set.hpp>

namespace stakeoracle::cmd::common {

//! Delivers SIGINT/SIGTERM to a callback on the executor, for as long as the listener is not cancelled
class ShutdownSignal {
  public:
    using SignalNumber = int;

    explicit ShutdownSignal(const boost::asio::any_io_executor& executor)
        : signals_(executor, SIGINT, SIGTERM) {}

    //! Invoke callback for every signal received until cancel() is called
    void on_signal(std::function<void(SignalNumber)> callback);

    void cancel();

  private:
    void wait_next();

    boost::asio::signal_set signals_;
    std::function<void(SignalNumber)> callback_;
};

}  // namespace stakeoracle::cmd::common
