//! # JSON Parser
//!
//! Recursive descent parser that builds a `JsonValue` tree from the token
//! stream of a `JsonLexer`.
//!
//! ## Features
//!
//! - **Strict RFC 8259 grammar**: no comments, no trailing commas, no
//!   single quotes, exactly one root value
//! - **First error wins**: parsing stops at the first violation and no partial
//!   tree is returned
//! - **Depth limiting**: nesting deeper than `ParseOptions::max_depth` fails
//!   with `DepthExceeded` instead of exhausting the stack
//!
//! ## Example
//!
//! ```cpp
//! #include "strand/json/json_parser.hpp"
//! using namespace strand::json;
//!
//! auto result = parse_json(R"({"name": "Alice", "age": 30})");
//! if (is_ok(result)) {
//!     auto& json = unwrap(result);
//!     std::cout << json.get("name")->as_string() << std::endl;
//! } else {
//!     std::cerr << unwrap_err(result).to_string() << std::endl;
//! }
//! ```

#pragma once

#include "strand/common.hpp"
#include "strand/json/json_error.hpp"
#include "strand/json/json_lexer.hpp"
#include "strand/json/json_value.hpp"

#include <cstddef>
#include <optional>
#include <string_view>

namespace strand::json {

/// Per-call parser configuration.
struct ParseOptions {
    /// Maximum number of nested arrays/objects. A document nested exactly this
    /// deep is accepted; one level more fails with `DepthExceeded`.
    size_t max_depth = 1000;
};

/// Recursive descent JSON parser.
///
/// A parser is single-use: construct it over the text, call `parse()` once.
///
/// # Example
///
/// ```cpp
/// JsonParser parser(R"([1, 2, 3])", ParseOptions{.max_depth = 16});
/// auto result = parser.parse();
/// ```
class JsonParser {
public:
    /// Creates a parser for the given input.
    ///
    /// # Arguments
    ///
    /// * `input` - The JSON text; must outlive the parser
    /// * `options` - Nesting limit
    explicit JsonParser(std::string_view input, ParseOptions options = {});

    /// Parses the input as exactly one JSON value followed by end of input.
    ///
    /// # Returns
    ///
    /// `Ok(JsonValue)` on success, `Err(SyntaxError)` at the first violation.
    [[nodiscard]] auto parse() -> Result<JsonValue, SyntaxError>;

private:
    std::string_view input_;
    JsonLexer lexer_;
    JsonToken current_;
    ParseOptions options_;
    size_t depth_ = 0;

    /// Pulls the next token into `current_`. A lexical error in the text after
    /// the root value is reported as `TrailingData`.
    [[nodiscard]] auto advance() -> std::optional<SyntaxError>;

    /// Whether consuming `current_` finishes the root value.
    [[nodiscard]] auto completes_root() const -> bool;

    [[nodiscard]] auto check(JsonTokenKind kind) const -> bool {
        return current_.kind == kind;
    }

    /// Error for the current token when `expected` was wanted.
    [[nodiscard]] auto unexpected(const char* expected) const -> SyntaxError;

    auto parse_value(const char* expected) -> Result<JsonValue, SyntaxError>;
    auto parse_object() -> Result<JsonValue, SyntaxError>;
    auto parse_array() -> Result<JsonValue, SyntaxError>;
};

/// Parses JSON text into a value tree.
///
/// # Arguments
///
/// * `input` - The JSON text
/// * `options` - Nesting limit
///
/// # Returns
///
/// `Ok(JsonValue)` on success, `Err(SyntaxError)` on failure.
[[nodiscard]] auto parse_json(std::string_view input, ParseOptions options = {})
    -> Result<JsonValue, SyntaxError>;

} // namespace strand::json
