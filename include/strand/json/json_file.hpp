//! # JSON File Loading
//!
//! Reads a file as UTF-8 text and parses it. I/O and encoding problems are
//! reported as `IoError` before the parser sees any input; problems with the
//! content itself are reported as `SyntaxError`.
//!
//! ## Example
//!
//! ```cpp
//! auto result = parse_json_file("config.json");
//! if (is_err(result)) {
//!     std::cerr << "Error: " << error_message(unwrap_err(result)) << "\n";
//! }
//! ```

#pragma once

#include "strand/common.hpp"
#include "strand/json/json_error.hpp"
#include "strand/json/json_parser.hpp"
#include "strand/json/json_value.hpp"

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace strand::json {

/// Checks that `bytes` is well-formed UTF-8.
///
/// Rejects overlong encodings, encoded surrogates (U+D800..U+DFFF), code
/// points above U+10FFFF and truncated sequences.
///
/// # Returns
///
/// `std::nullopt` if valid, otherwise the byte offset of the first invalid
/// sequence.
[[nodiscard]] auto validate_utf8(std::string_view bytes) -> std::optional<size_t>;

/// Reads a whole file as UTF-8 text. A leading byte order mark is removed.
///
/// # Errors
///
/// | Condition | Kind |
/// |-----------|------|
/// | Path does not exist | `NotFound` |
/// | Directory or special file | `NotAFile` |
/// | Open denied | `PermissionDenied` |
/// | Other open/read failure | `ReadFailed` |
/// | Not UTF-8 | `InvalidEncoding` |
[[nodiscard]] auto read_json_text(const std::filesystem::path& path)
    -> Result<std::string, IoError>;

/// Reads and parses a JSON file.
///
/// # Returns
///
/// `Ok(JsonValue)` on success, `Err(IoError)` if the file cannot be read,
/// `Err(SyntaxError)` if its content is not valid JSON.
[[nodiscard]] auto parse_json_file(const std::filesystem::path& path, ParseOptions options = {})
    -> Result<JsonValue, JsonError>;

} // namespace strand::json
