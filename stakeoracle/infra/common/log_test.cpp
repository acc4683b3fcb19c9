// Copyright 2025 The Stakeoracle Authors
// SPDX-License-Identifier: Apache-2.0

#include "log.hpp"

#include <iostream>
#include <string>

#include <catch2/catch_test_macros.hpp>

#include <stakeoracle/infra/test_util/log.hpp>

namespace stakeoracle::log {

template <Level level>
class LogBufferForTest : public LogBuffer<level> {
  public:
    explicit LogBufferForTest() : LogBuffer<level>() {}
    explicit LogBufferForTest(std::string_view msg, const Args& args) : LogBuffer<level>(msg, args) {}

    std::string content() const { return LogBuffer<level>::ss_.str(); }
};

TEST_CASE("LogBuffer", "[infra][common][log]") {
    test_util::SetLogVerbosityGuard log_guard{get_verbosity()};

    std::stringstream string_cout, string_cerr;
    test_util::StreamSwap cout_swap{std::cout, string_cout};
    test_util::StreamSwap cerr_swap{std::cerr, string_cerr};
    init(Settings{.log_nocolor = true, .log_verbosity = Level::kInfo});

    SECTION("nothing is buffered above the configured verbosity") {
        LogBufferForTest<Level::kDebug> buffer;
        buffer << "hidden";
        CHECK(buffer.content().empty());
    }

    SECTION("buffered content is written on destruction") {
        { LogBuffer<Level::kWarning>{"EraCycle"} << "stash skipped"; }
        CHECK(string_cerr.str().find("stash skipped") != std::string::npos);
        CHECK(string_cerr.str().find("WARN") != std::string::npos);
        CHECK(string_cout.str().empty());
    }

    SECTION("key-value arguments are paired") {
        LogBufferForTest<Level::kInfo> buffer{"Report", {"era", "42", "stash", "0xabcd"}};
        const std::string content{buffer.content()};
        CHECK(content.find("era") != std::string::npos);
        CHECK(content.find("42") != std::string::npos);
        CHECK(content.find("0xabcd") != std::string::npos);
    }

    SECTION("values with blanks are quoted") {
        LogBufferForTest<Level::kInfo> buffer{"Submission failed", {"era", "42", "error", "connection refused", "hash", ""}};
        const std::string content{buffer.content()};
        CHECK(content.find("era=42 ") != std::string::npos);
        CHECK(content.find("error=\"connection refused\" ") != std::string::npos);
        CHECK(content.find("hash=\"\"") != std::string::npos);
        CHECK(content.find('\x1b') == std::string::npos);
    }

    SECTION("macros honour verbosity") {
        set_verbosity(Level::kError);
        STAKE_INFO << "not printed";
        STAKE_ERROR << "printed";
        CHECK(string_cerr.str().find("not printed") == std::string::npos);
        CHECK(string_cerr.str().find("printed") != std::string::npos);
    }
}

}  // namespace stakeoracle::log
