//! # JSON Lexer
//!
//! Converts a text buffer into JSON tokens, one token per `next_token()` call.
//!
//! ## Token Types
//!
//! | Token | Description | Example |
//! |-------|-------------|---------|
//! | `LBrace` | Left brace | `{` |
//! | `RBrace` | Right brace | `}` |
//! | `LBracket` | Left bracket | `[` |
//! | `RBracket` | Right bracket | `]` |
//! | `Colon` | Colon | `:` |
//! | `Comma` | Comma | `,` |
//! | `String` | Quoted string, escapes resolved | `"a\nb"` |
//! | `Number` | Numeric literal, converted to `double` | `-1.5e3` |
//! | `True` | Boolean true | `true` |
//! | `False` | Boolean false | `false` |
//! | `Null` | Null value | `null` |
//! | `Eof` | End of input | |
//!
//! ## Positions
//!
//! Every token records its byte offset and 1-based line/column. Columns count
//! characters, so multi-byte UTF-8 sequences advance the column by one.
//!
//! ## Example
//!
//! ```cpp
//! JsonLexer lexer(R"({"key": 42})");
//! while (true) {
//!     auto tok = lexer.next_token();
//!     if (is_err(tok)) {
//!         std::cerr << unwrap_err(tok).to_string() << std::endl;
//!         break;
//!     }
//!     if (unwrap(tok).kind == JsonTokenKind::Eof) {
//!         break;
//!     }
//! }
//! ```

#pragma once

#include "strand/common.hpp"
#include "strand/json/json_error.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace strand::json {

enum class JsonTokenKind : uint8_t {
    // Structural tokens
    LBrace,
    RBrace,
    LBracket,
    RBracket,
    Colon,
    Comma,

    // Value tokens
    String,
    Number,
    True,
    False,
    Null,

    Eof
};

/// Returns a short display form for a token kind (`"'{'"`, `"string"`, ...).
[[nodiscard]] auto token_kind_name(JsonTokenKind kind) -> const char*;

/// A token produced by the JSON lexer.
struct JsonToken {
    JsonTokenKind kind = JsonTokenKind::Eof;

    /// The original text of this token (view into the lexer's input).
    std::string_view lexeme;

    TextPos pos;

    /// For `String` tokens: the unescaped content (UTF-8).
    std::string string_value;

    /// For `Number` tokens: the converted value.
    double number_value = 0.0;
};

/// Pull-based JSON lexer over a borrowed buffer.
///
/// The input must outlive the lexer and every token it returns, since
/// `JsonToken::lexeme` points into it. The first lexical error ends the
/// stream; calling `next_token()` again after an error is not supported.
class JsonLexer {
public:
    explicit JsonLexer(std::string_view input);

    /// Returns the next token, or the error at the first invalid character.
    ///
    /// Returns an `Eof` token once the input is exhausted, and keeps
    /// returning it on further calls.
    [[nodiscard]] auto next_token() -> Result<JsonToken, SyntaxError>;

    /// Position of the next unread character.
    [[nodiscard]] auto position() const -> TextPos {
        return TextPos{pos_, line_, column_};
    }

private:
    std::string_view input_;
    size_t pos_ = 0;
    size_t line_ = 1;
    size_t column_ = 1;

    [[nodiscard]] auto peek() const -> char;
    [[nodiscard]] auto peek_at(size_t ahead) const -> char;
    [[nodiscard]] auto at_end() const -> bool {
        return pos_ >= input_.size();
    }
    auto advance() -> char;
    void skip_whitespace();

    auto make_token(JsonTokenKind kind, TextPos start) const -> JsonToken;

    auto scan_string() -> Result<JsonToken, SyntaxError>;
    auto scan_escape(std::string& out, TextPos string_start) -> std::optional<SyntaxError>;
    auto read_hex4(TextPos escape_start) -> Result<uint32_t, SyntaxError>;
    auto scan_number() -> Result<JsonToken, SyntaxError>;
    auto scan_keyword() -> Result<JsonToken, SyntaxError>;
};

/// Tokenizes the whole input.
///
/// # Returns
///
/// All tokens including the trailing `Eof`, or the first lexical error.
[[nodiscard]] auto tokenize(std::string_view input) -> Result<std::vector<JsonToken>, SyntaxError>;

} // namespace strand::json
