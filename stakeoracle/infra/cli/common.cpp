// Copyright 2025 The Stakeoracle Authors
// SPDX-License-Identifier: Apache-2.0

#include "common.hpp"

#include <map>
#include <string>

namespace stakeoracle::cmd::common {

void add_logging_options(CLI::App& cli, log::Settings& log_settings) {
    // Lower-case names for the command line, upper-case names as deployed through LOG_LEVEL
    std::map<std::string, log::Level> level_mapping{
        {"critical", log::Level::kCritical},
        {"error", log::Level::kError},
        {"warning", log::Level::kWarning},
        {"info", log::Level::kInfo},
        {"debug", log::Level::kDebug},
        {"trace", log::Level::kTrace},
    };
    auto& log_opts = *cli.add_option_group("Log", "Logging options");
    log_opts.add_option("--log.verbosity", log_settings.log_verbosity, "Sets log verbosity")
        ->envname("LOG_LEVEL")
        ->transform(CLI::Transformer(level_mapping, CLI::ignore_case))
        ->check(CLI::Range(log::Level::kCritical, log::Level::kTrace))
        ->default_val(log::Level::kInfo);
    log_opts.add_flag("--log.stdout", log_settings.log_std_out, "Outputs to std::out instead of std::err");
    log_opts.add_flag("--log.nocolor", log_settings.log_nocolor, "Disable colors on log lines");
    log_opts.add_flag("--log.utc", log_settings.log_utc, "Prints log timings in UTC");
    log_opts.add_flag("--log.threads", log_settings.log_threads, "Prints thread ids");
    log_opts.add_option("--log.file", log_settings.log_file, "Tee all log lines to given file name");
}

CLI::Option* add_option_seconds(CLI::App& cli, const std::string& name, std::chrono::seconds& value,
                                const std::string& description, const std::string& env_name) {
    auto* option = cli.add_option_function<int64_t>(
                          name,
                          [&value](const int64_t& seconds) { value = std::chrono::seconds{seconds}; },
                          description)
                       ->check(CLI::NonNegativeNumber)
                       ->default_str(std::to_string(value.count()));
    if (!env_name.empty()) {
        option->envname(env_name);
    }
    return option;
}

}  // namespace stakeoracle::cmd::common
