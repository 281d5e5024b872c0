//! # strand Command-Line Interface
//!
//! Thin adapter from argv to the JSON engine: picks the input (literal text,
//! a file, or stdin), parses it, and pretty-prints the result.
//!
//! ## Usage
//!
//! ```bash
//! strand '{"a": [1, 2]}'          # Parse a literal and pretty-print it
//! strand data.json                # Parse a file
//! cat data.json | strand          # Parse stdin
//! strand --compact data.json      # Compact output
//! strand --check data.json        # Validate only
//! ```
//!
//! ## Exit Codes
//!
//! | Code | Meaning |
//! |------|---------|
//! | 0 | Parsed (and printed) successfully, or help/version shown |
//! | 1 | Usage error, missing file, I/O error or syntax error |

#pragma once

#include "strand/common.hpp"

#include <cstddef>
#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

namespace strand::cli {

/// Options parsed from the command line. Logging flags are handled
/// separately by `log::parse_log_options` and skipped here.
struct CliOptions {
    /// JSON text or a path; absent means stdin.
    std::optional<std::string> input;

    /// Spaces per level in the output; 0 for compact.
    size_t indent = 2;

    size_t max_depth = 1000;

    /// Validate only, print nothing on success.
    bool check_only = false;

    bool show_help = false;
    bool show_version = false;
};

/// Parses arguments (program name excluded).
///
/// A lone argument starting with a single `-` that is not a known flag is
/// taken as input text, so negative numbers like `-5` can be passed
/// directly. `--` ends option parsing.
///
/// # Returns
///
/// The options, or a message describing the first bad argument.
[[nodiscard]] auto parse_cli_options(const std::vector<std::string>& args)
    -> Result<CliOptions, std::string>;

void print_usage(std::ostream& out);

void print_version(std::ostream& out);

/// Standard streams the CLI reads and writes.
struct CliStreams {
    std::istream& in;
    std::ostream& out;
    std::ostream& err;

    /// Whether `in` is an interactive terminal (then it is never read).
    bool in_is_terminal;
};

/// Runs the tool.
///
/// # Arguments
///
/// * `args` - Command-line arguments without the program name
/// * `io` - Where to read input and write output and errors
///
/// # Returns
///
/// The process exit code.
[[nodiscard]] auto run_cli(const std::vector<std::string>& args, CliStreams io) -> int;

/// Process entry point: initializes logging from argv and `STRAND_LOG`,
/// then calls `run_cli` on the standard streams.
[[nodiscard]] auto strand_main(int argc, char* argv[]) -> int;

} // namespace strand::cli
