//! # Log Initialization from CLI
//!
//! Parses logging-related command-line arguments and the STRAND_LOG
//! environment variable to produce a LogConfig.

#include "strand/log/log.hpp"

#include <algorithm>
#include <cstdlib>
#include <iostream>

namespace strand::log {

namespace {

/// Counts the `v`s in `-v`, `-vv`, `-vvv`; 0 for anything else.
auto verbosity_count(std::string_view arg) -> int {
    if (arg.size() < 2 || arg[0] != '-' || arg[1] == '-') {
        return 0;
    }
    for (size_t j = 1; j < arg.size(); ++j) {
        if (arg[j] != 'v') {
            return 0;
        }
    }
    return static_cast<int>(arg.size() - 1);
}

} // anonymous namespace

auto is_log_option(std::string_view arg) -> bool {
    return arg.starts_with("--log-level=") || arg.starts_with("--log-filter=") ||
           arg.starts_with("--log-file=") || arg.starts_with("--log-format=") || arg == "-q" ||
           arg == "--quiet" || arg == "--verbose" || verbosity_count(arg) > 0;
}

auto parse_log_options(const std::vector<std::string>& args, const char* env_value)
    -> LogConfig {
    LogConfig config;

    bool has_cli_level = false;
    bool has_cli_filter = false;
    int v_count = 0;

    for (const auto& arg : args) {
        // Everything after "--" is positional input, as in parse_cli_options.
        if (arg == "--") {
            break;
        }
        if (arg.starts_with("--log-level=")) {
            if (auto lvl = parse_level(arg.substr(12))) {
                config.level = *lvl;
                has_cli_level = true;
            } else {
                std::cerr << "warning: unknown log level '" << arg.substr(12) << "' ignored\n";
            }
        } else if (arg.starts_with("--log-filter=")) {
            config.filter_spec = arg.substr(13);
            has_cli_filter = true;
        } else if (arg.starts_with("--log-file=")) {
            config.log_file = arg.substr(11);
        } else if (arg.starts_with("--log-format=")) {
            std::string fmt = arg.substr(13);
            if (fmt == "json" || fmt == "JSON") {
                config.format = LogFormat::Json;
            } else if (fmt == "text" || fmt == "TEXT") {
                config.format = LogFormat::Text;
            } else {
                std::cerr << "warning: unknown log format '" << fmt << "', using text\n";
                config.format = LogFormat::Text;
            }
        } else if (arg == "-q" || arg == "--quiet") {
            config.level = LogLevel::Error;
            has_cli_level = true;
        } else if (arg == "--verbose") {
            v_count = std::max(v_count, 1);
        } else {
            v_count = std::max(v_count, verbosity_count(arg));
        }
    }

    // -v = Info, -vv = Debug, -vvv = Trace, unless a level was given explicitly
    if (!has_cli_level && v_count > 0) {
        if (v_count >= 3) {
            config.level = LogLevel::Trace;
        } else if (v_count == 2) {
            config.level = LogLevel::Debug;
        } else {
            config.level = LogLevel::Info;
        }
        has_cli_level = true;
    }

    if (!has_cli_level && !has_cli_filter && env_value != nullptr && *env_value != '\0') {
        std::string_view env(env_value);
        if (env.find('=') != std::string_view::npos || env.find(',') != std::string_view::npos) {
            config.filter_spec = std::string(env);
        } else if (auto lvl = parse_level(env)) {
            config.level = *lvl;
        } else {
            // A single bare module name
            config.filter_spec = std::string(env);
        }
    }

    return config;
}

auto parse_log_options(int argc, char* argv[]) -> LogConfig {
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        args.emplace_back(argv[i]);
    }
    return parse_log_options(args, std::getenv("STRAND_LOG"));
}

} // namespace strand::log
