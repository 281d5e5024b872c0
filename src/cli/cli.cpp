//! # CLI Driver
//!
//! ## Input Selection
//!
//! ```text
//! no argument ─┬─ stdin is a terminal → usage on stderr, exit 1
//!              └─ otherwise           → parse all of stdin
//! argument ────┬─ ends in .json, missing → "Error: File not found: <path>"
//!              ├─ existing file           → parse_json_file()
//!              └─ anything else           → parse the argument as JSON text
//! ```

#include "strand/cli/cli.hpp"

#include "strand/json/json.hpp"
#include "strand/log/log.hpp"

#include <charconv>
#include <filesystem>
#include <iostream>
#include <sstream>
#include <string_view>

#ifdef _WIN32
#include <io.h>
#define STRAND_ISATTY(fd) _isatty(fd)
#define STRAND_STDIN_FD 0
#else
#include <unistd.h>
#define STRAND_ISATTY(fd) isatty(fd)
#define STRAND_STDIN_FD STDIN_FILENO
#endif

namespace fs = std::filesystem;

namespace strand::cli {

namespace {

/// Parses the `N` of `--name=N`.
auto parse_size_value(std::string_view option, std::string_view text)
    -> Result<size_t, std::string> {
    size_t value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (text.empty() || ec != std::errc{} || ptr != text.data() + text.size()) {
        return "invalid value for " + std::string(option) + ": '" + std::string(text) + "'";
    }
    return value;
}

auto is_existing_path(const std::string& arg) -> bool {
    std::error_code ec;
    return fs::exists(arg, ec);
}

auto load_input(const CliOptions& opts, CliStreams& io) -> Result<json::JsonValue, json::JsonError> {
    json::ParseOptions parse_opts{opts.max_depth};

    if (!opts.input) {
        STRAND_LOG_DEBUG("cli", "reading stdin");
        std::ostringstream ss;
        ss << io.in.rdbuf();
        std::string text = ss.str();
        if (auto bad = json::validate_utf8(text)) {
            return json::JsonError{json::IoError::make(
                json::IoErrorKind::InvalidEncoding, "<stdin>",
                "Invalid UTF-8 at byte " + std::to_string(*bad))};
        }
        auto parsed = json::parse_json(text, parse_opts);
        if (is_err(parsed)) {
            return json::JsonError{std::move(unwrap_err(parsed))};
        }
        return std::move(unwrap(parsed));
    }

    const std::string& arg = *opts.input;
    std::error_code ec;
    bool looks_like_file = arg.ends_with(".json");
    if (is_existing_path(arg) && (looks_like_file || fs::is_regular_file(arg, ec))) {
        STRAND_LOG_DEBUG("cli", "parsing file " << arg);
        return json::parse_json_file(arg, parse_opts);
    }
    if (looks_like_file) {
        return json::JsonError{
            json::IoError::make(json::IoErrorKind::NotFound, arg, "File not found")};
    }

    STRAND_LOG_DEBUG("cli", "parsing argument as JSON text (" << arg.size() << " bytes)");
    auto parsed = json::parse_json(arg, parse_opts);
    if (is_err(parsed)) {
        return json::JsonError{std::move(unwrap_err(parsed))};
    }
    return std::move(unwrap(parsed));
}

} // anonymous namespace

// ============================================================================
// Option Parsing
// ============================================================================

auto parse_cli_options(const std::vector<std::string>& args) -> Result<CliOptions, std::string> {
    CliOptions opts;
    bool options_done = false;

    for (const auto& arg : args) {
        if (!options_done) {
            if (arg == "--") {
                options_done = true;
                continue;
            }
            if (log::is_log_option(arg)) {
                continue;
            }
            if (arg == "-h" || arg == "--help") {
                opts.show_help = true;
                continue;
            }
            if (arg == "--version") {
                opts.show_version = true;
                continue;
            }
            if (arg == "--compact") {
                opts.indent = 0;
                continue;
            }
            if (arg == "--check") {
                opts.check_only = true;
                continue;
            }
            if (arg.starts_with("--indent=")) {
                auto value = parse_size_value("--indent", std::string_view(arg).substr(9));
                if (is_err(value)) {
                    return unwrap_err(value);
                }
                opts.indent = unwrap(value);
                continue;
            }
            if (arg.starts_with("--max-depth=")) {
                auto value = parse_size_value("--max-depth", std::string_view(arg).substr(12));
                if (is_err(value)) {
                    return unwrap_err(value);
                }
                opts.max_depth = unwrap(value);
                continue;
            }
            if (arg.starts_with("--")) {
                return "unknown option '" + arg + "'";
            }
        }

        if (opts.input) {
            return "unexpected extra argument '" + arg + "'";
        }
        opts.input = arg;
    }

    return opts;
}

void print_usage(std::ostream& out) {
    out << "strand " << VERSION << " - JSON parser and pretty-printer\n\n";
    out << "Usage: strand [options] [<json-text-or-file>]\n\n";
    out << "With no argument, reads JSON from stdin.\n";
    out << "\nOptions:\n";
    out << "  --indent=N           Spaces per nesting level (0 = compact, default 2)\n";
    out << "  --compact            Same as --indent=0\n";
    out << "  --max-depth=N        Maximum nesting depth (default 1000)\n";
    out << "  --check              Validate only, print nothing on success\n";
    out << "  --help, -h           Show this help\n";
    out << "  --version            Show version\n";
    out << "\nLogging:\n";
    out << "  --log-level=LEVEL    trace, debug, info, warn, error, fatal, off\n";
    out << "  --log-filter=SPEC    Per-module levels, e.g. cli=debug,*=warn\n";
    out << "  --log-file=PATH      Also append log lines to PATH\n";
    out << "  --log-format=FMT     text or json\n";
    out << "  -v, -vv, -vvv        Info, debug, trace\n";
    out << "  -q, --quiet          Errors only\n";
    out << "  STRAND_LOG=SPEC      Level or filter when no flag is given\n";
}

void print_version(std::ostream& out) {
    out << "strand " << VERSION << "\n";
}

// ============================================================================
// Driver
// ============================================================================

auto run_cli(const std::vector<std::string>& args, CliStreams io) -> int {
    auto parsed_opts = parse_cli_options(args);
    if (is_err(parsed_opts)) {
        io.err << "Error: " << unwrap_err(parsed_opts) << "\n";
        io.err << "Run 'strand --help' for usage.\n";
        return 1;
    }
    const CliOptions& opts = unwrap(parsed_opts);

    if (opts.show_help) {
        print_usage(io.out);
        return 0;
    }
    if (opts.show_version) {
        print_version(io.out);
        return 0;
    }

    if (!opts.input && io.in_is_terminal) {
        print_usage(io.err);
        return 1;
    }

    auto result = load_input(opts, io);
    if (is_err(result)) {
        const auto& error = unwrap_err(result);
        STRAND_LOG_DEBUG("cli", json::error_kind_name(error) << ": " << json::error_message(error));
        io.err << "Error: " << json::error_message(error) << "\n";
        return 1;
    }

    const auto& value = unwrap(result);
    STRAND_LOG_DEBUG("cli", "parsed " << json::kind_name(value.kind()) << " with " << value.size()
                                      << " top-level entries");

    if (opts.check_only) {
        return 0;
    }

    io.out << json::serialize(value, opts.indent) << "\n";
    return 0;
}

auto strand_main(int argc, char* argv[]) -> int {
    log::Logger::init(log::parse_log_options(argc, argv));

    std::vector<std::string> args;
    args.reserve(argc > 0 ? static_cast<size_t>(argc - 1) : 0);
    for (int i = 1; i < argc; ++i) {
        args.emplace_back(argv[i]);
    }

    CliStreams io{std::cin, std::cout, std::cerr, STRAND_ISATTY(STRAND_STDIN_FD) != 0};
    int code = run_cli(args, io);
    log::Logger::instance().flush();
    return code;
}

} // namespace strand::cli
