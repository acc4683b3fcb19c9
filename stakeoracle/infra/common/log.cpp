// Copyright 2025 The Stakeoracle Authors
// SPDX-License-Identifier: Apache-2.0

#include "log.hpp"

#include <fstream>
#include <iostream>
#include <memory>
#include <mutex>
#include <iomanip>
#include <stdexcept>
#include <thread>
#include <utility>

#include <absl/time/clock.h>
#include <absl/time/time.h>

namespace stakeoracle::log {

//! The fixed size for thread name in log traces
static constexpr size_t kThreadNameFixedSize = 11;

static Settings settings_{};
static std::mutex out_mtx{};
static std::unique_ptr<std::fstream> file_{nullptr};
thread_local std::string thread_name_{};

void init(const Settings& settings) {
    settings_ = settings;
    if (!settings_.log_file.empty()) {
        tee_file(std::filesystem::path(settings.log_file));
        // Lines are shared between console and file, the latter must not get escape sequences
        settings_.log_nocolor = true;
    }
    init_terminal();
    const bool is_terminal = settings_.log_std_out ? is_terminal_stdout() : is_terminal_stderr();
    settings_.log_nocolor = settings_.log_nocolor || !is_terminal;
}

void tee_file(const std::filesystem::path& path) {
    file_ = std::make_unique<std::fstream>(path.string(), std::ios::out | std::ios::app);
    if (!file_->is_open()) {
        file_.reset();
        throw std::runtime_error("Could not open file " + path.string());
    }
}

Level get_verbosity() { return settings_.log_verbosity; }

void set_verbosity(Level level) { settings_.log_verbosity = level; }

bool test_verbosity(Level level) { return level <= settings_.log_verbosity; }

void set_thread_name(const char* name) {
    thread_name_ = std::string(name);
    thread_name_.resize(kThreadNameFixedSize, ' ');
}

std::string get_thread_name() {
    if (thread_name_.empty()) {
        std::stringstream ss;
        ss << std::this_thread::get_id();
        thread_name_ = ss.str();
    }
    return thread_name_;
}

static std::pair<std::string_view, std::string_view> get_level_settings(Level level) {
    switch (level) {
        case Level::kTrace:
            return {"TRACE", kColorCoal};
        case Level::kDebug:
            return {"DEBUG", kBackgroundPurple};
        case Level::kInfo:
            return {" INFO", kColorGreen};
        case Level::kWarning:
            return {" WARN", kColorOrangeHigh};
        case Level::kError:
            return {"ERROR", kColorRed};
        case Level::kCritical:
            return {" CRIT", kBackgroundRed};
        default:
            return {"     ", kColorReset};
    }
}

BufferBase::BufferBase(Level level) : should_print_(level <= settings_.log_verbosity) {
    if (!should_print_) return;

    auto [log_level, level_color] = get_level_settings(level);
    ss_ << color(kColorReset) << " " << color(level_color) << log_level << color(kColorReset) << " ";

    const absl::TimeZone tz{settings_.log_utc ? absl::UTCTimeZone() : absl::LocalTimeZone()};
    ss_ << color(kColorWhite) << "[" << absl::FormatTime("%m-%d|%H:%M:%E3S", absl::Now(), tz) << "] " << color(kColorReset);

    if (settings_.log_threads) {
        ss_ << "[" << get_thread_name() << "] ";
    }
}

BufferBase::BufferBase(Level level, std::string_view msg, const Args& args) : BufferBase(level) {
    append(msg, args);
}

std::string_view BufferBase::color(std::string_view code) {
    return settings_.log_nocolor ? std::string_view{} : code;
}

// Values holding blanks, quotes or separators are quoted to keep the line parseable
static void append_value(std::ostream& out, const std::string& value) {
    if (value.empty() || value.find_first_of(" \t\"=") != std::string::npos) {
        out << std::quoted(value);
    } else {
        out << value;
    }
}

void BufferBase::append(std::string_view msg, const Args& args) {
    if (!should_print_) return;
    ss_ << std::left << std::setw(36) << std::setfill(' ') << msg;
    for (size_t i{0}; i + 1 < args.size(); i += 2) {
        ss_ << color(kColorGreen) << args[i] << color(kColorReset) << "=" << color(kColorWhite);
        append_value(ss_, args[i + 1]);
        ss_ << color(kColorReset) << " ";
    }
    if (args.size() % 2 != 0) {
        ss_ << color(kColorWhite) << args.back() << color(kColorReset);
    }
}

void BufferBase::flush() {
    if (!should_print_) return;

    const std::string line{ss_.str()};
    std::scoped_lock out_lck{out_mtx};
    auto& out = settings_.log_std_out ? std::cout : std::cerr;
    out << line << '\n';
    if (file_ && file_->is_open()) {
        *file_ << line << std::endl;
    }
}

}  // namespace stakeoracle::log
