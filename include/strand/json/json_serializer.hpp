//! # JSON Serializer
//!
//! Converts a `JsonValue` tree to JSON text, compact or pretty-printed.
//! Serialization never fails: every tree the value model can hold has a
//! textual form.
//!
//! ## Layout
//!
//! | Indent | Output |
//! |--------|--------|
//! | absent / `0` | `{"a":[1,2]}` |
//! | `2` | newline after `{`, `[` and `,`; members indented two spaces per level |
//!
//! Empty containers are written as `[]` and `{}` under every indent.

#pragma once

#include "strand/json/json_value.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace strand::json {

/// Serializes a value.
///
/// # Arguments
///
/// * `value` - The tree to write
/// * `indent` - Spaces per nesting level; `std::nullopt` or `0` for compact output
///
/// # Example
///
/// ```cpp
/// auto v = unwrap(parse_json(R"({"a": [1, 2]})"));
/// serialize(v);    // {"a":[1,2]}
/// serialize(v, 2); // {\n  "a": [\n    1,\n    2\n  ]\n}
/// ```
[[nodiscard]] auto serialize(const JsonValue& value, std::optional<size_t> indent = std::nullopt)
    -> std::string;

/// Escapes `text` for use inside a JSON string literal (quotes not included).
///
/// `"` and `\` are backslash-escaped, `\b \f \n \r \t` use their short forms,
/// other bytes below 0x20 become `\u00XX`. Everything else, including
/// non-ASCII UTF-8, passes through unchanged.
[[nodiscard]] auto escape_json_string(std::string_view text) -> std::string;

/// Formats a number as the shortest decimal that reads back to the same
/// `double`. Non-finite values are written as `null`.
[[nodiscard]] auto format_json_number(double value) -> std::string;

} // namespace strand::json
