// Copyright 2025 The Stakeoracle Authors
// SPDX-License-Identifier: Apache-2.0

#include "shutdown_signal.hpp"

#include <iostream>
#include <utility>

#include <boost/system/system_error.hpp>

#include <stakeoracle/infra/common/log.hpp>

namespace stakeoracle::cmd::common {

void ShutdownSignal::on_signal(std::function<void(SignalNumber)> callback) {
    callback_ = std::move(callback);
    wait_next();
}

void ShutdownSignal::cancel() {
    signals_.cancel();
}

void ShutdownSignal::wait_next() {
    signals_.async_wait([this](const boost::system::error_code& error, int signal_number) {
        if (error) {
            if (error != boost::system::errc::operation_canceled) {
                STAKE_ERROR << "ShutdownSignal async_wait error: " << error;
                throw boost::system::system_error(error);
            }
            STAKE_DEBUG << "ShutdownSignal async_wait cancelled";
            return;
        }
        std::cout << "\n";
        STAKE_INFO << "Signal caught, number: " << signal_number;
        callback_(signal_number);
        wait_next();
    });
}

}  // namespace stakeoracle::cmd::common
