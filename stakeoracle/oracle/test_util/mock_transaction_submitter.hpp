// Copyright 2025 The Stakeoracle Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <gmock/gmock.h>

#include <stakeoracle/oracle/transaction_submitter.hpp>

namespace stakeoracle::oracle::test_util {

//! \brief gMock mock class for TransactionSubmitter
class MockTransactionSubmitter : public TransactionSubmitter {
  public:
    MOCK_METHOD((Task<SubmissionOutcome>), submit, (const Report&), (override));
};

}  // namespace stakeoracle::oracle::test_util
