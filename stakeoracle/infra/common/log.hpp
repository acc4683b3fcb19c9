// Copyright 2025 The Stakeoracle Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <filesystem>
#include <iomanip>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

#include <stakeoracle/infra/common/terminal.hpp>

namespace stakeoracle::log {

//! \brief Available verbosity levels
enum class Level {
    kNone,      // Simple logging line with no severity (e.g. build info)
    kCritical,  // An error there's no way we can recover from
    kError,     // We encountered an error which we might be able to recover from
    kWarning,   // Something happened and user might have the possibility to amend the situation
    kInfo,      // Info messages on regular operations
    kDebug,     // Debug information
    kTrace      // Trace calls to functions
};

//! \brief Holds logging configuration
struct Settings {
    //! Whether console logging goes to std::cout or std::cerr (default)
    bool log_std_out{false};
    //! Whether timestamps should be in UTC or imbue local timezone
    bool log_utc{true};
    //! Whether to disable colorized output
    bool log_nocolor{false};
    //! Whether to print thread ids in log lines
    bool log_threads{false};
    //! Log verbosity level
    Level log_verbosity{Level::kInfo};
    //! Log to file
    std::string log_file;
};

//! \brief Initializes logging facilities
//! \note This function is not thread safe as it's meant to be used at start of process and never called again
void init(const Settings& settings = {});

//! \brief Get the current logging verbosity
Level get_verbosity();

//! \brief Sets logging verbosity
//! \note This function is not thread safe as it's meant to be used at start of process and never called again
void set_verbosity(Level level);

//! \brief Sets the name for this thread when logging traces also threads
void set_thread_name(const char* name);

//! \brief Returns the currently set name for the thread or the thread id
std::string get_thread_name();

//! \brief Checks if provided log level will be effectively printed on behalf of current settings
bool test_verbosity(Level level);

//! \brief Sets a file output for log teeing
void tee_file(const std::filesystem::path& path);

using Args = std::vector<std::string>;

class BufferBase {
  public:
    explicit BufferBase(Level level);
    explicit BufferBase(Level level, std::string_view msg, const Args& args);
    ~BufferBase() { flush(); }

    template <class T>
    void append(const T& t) {
        if (should_print_) ss_ << t;
    }
    template <class T>
    BufferBase& operator<<(const T& t) {
        append(t);
        return *this;
    }
    void append(const Args& args) {
        append("", args);
    }
    BufferBase& operator<<(const Args& args) {
        append(args);
        return *this;
    }

  protected:
    //! Append the message padded to a fixed width, then the arguments as key=value pairs
    void append(std::string_view msg, const Args& args);

    //! The escape sequence, or nothing when colors are disabled
    static std::string_view color(std::string_view code);

    void flush();
    const bool should_print_;
    std::stringstream ss_;
};

template <Level level>
class LogBuffer : public BufferBase {
  public:
    explicit LogBuffer() : BufferBase(level) {}
    explicit LogBuffer(std::string_view msg, const Args& args = {}) : BufferBase(level, msg, args) {}
};

using Trace = LogBuffer<Level::kTrace>;
using Debug = LogBuffer<Level::kDebug>;
using Info = LogBuffer<Level::kInfo>;
using Warning = LogBuffer<Level::kWarning>;
using Error = LogBuffer<Level::kError>;
using Critical = LogBuffer<Level::kCritical>;
using Message = LogBuffer<Level::kNone>;

}  // namespace stakeoracle::log

#define STAKE_LOGBUFFER(level_, ...)                 \
    if (!stakeoracle::log::test_verbosity(level_)) { \
    } else                                           \
        stakeoracle::log::LogBuffer<level_>(__VA_ARGS__)

#define STAKE_TRACE_M(...) STAKE_LOGBUFFER(stakeoracle::log::Level::kTrace, __VA_ARGS__)
#define STAKE_DEBUG_M(...) STAKE_LOGBUFFER(stakeoracle::log::Level::kDebug, __VA_ARGS__)
#define STAKE_INFO_M(...) STAKE_LOGBUFFER(stakeoracle::log::Level::kInfo, __VA_ARGS__)
#define STAKE_WARN_M(...) STAKE_LOGBUFFER(stakeoracle::log::Level::kWarning, __VA_ARGS__)
#define STAKE_ERROR_M(...) STAKE_LOGBUFFER(stakeoracle::log::Level::kError, __VA_ARGS__)
#define STAKE_CRIT_M(...) STAKE_LOGBUFFER(stakeoracle::log::Level::kCritical, __VA_ARGS__)
#define STAKE_LOG_M(...) STAKE_LOGBUFFER(stakeoracle::log::Level::kNone, __VA_ARGS__)

#define STAKE_TRACE STAKE_TRACE_M()
#define STAKE_DEBUG STAKE_DEBUG_M()
#define STAKE_INFO STAKE_INFO_M()
#define STAKE_WARN STAKE_WARN_M()
#define STAKE_ERROR STAKE_ERROR_M()
#define STAKE_CRIT STAKE_CRIT_M()
#define STAKE_LOG STAKE_LOG_M()
