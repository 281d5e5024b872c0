//! # JSON Error Types
//!
//! The two disjoint error kinds reported by the JSON engine:
//!
//! | Type | Raised by | Meaning |
//! |------|-----------|---------|
//! | `SyntaxError` | lexer, parser | The text is not valid JSON |
//! | `IoError` | file loader | The text could not be obtained or decoded |
//!
//! Both are plain values returned through `Result<T, E>`; nothing here throws.
//!
//! ## Example
//!
//! ```cpp
//! auto result = parse_json(R"({"bad": })");
//! if (is_err(result)) {
//!     std::cerr << unwrap_err(result).to_string() << std::endl;
//!     // unexpected token: expected value, found '}' at position 8 (line 1, column 9)
//! }
//! ```

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <variant>

namespace strand::json {

/// A position in the input text.
///
/// `offset` is a 0-based byte offset. `line` and `column` are 1-based, with
/// columns counted in characters rather than bytes.
struct TextPos {
    size_t offset = 0;
    size_t line = 1;
    size_t column = 1;
};

// ============================================================================
// SyntaxError
// ============================================================================

/// Classification of a lexical or grammatical failure.
enum class SyntaxErrorKind : uint8_t {
    UnexpectedToken,      ///< A token (or character) that cannot appear here
    UnexpectedEndOfInput, ///< Input ended while something was still expected
    InvalidNumber,        ///< Numeric literal that does not match the JSON grammar
    InvalidEscape,        ///< Unknown `\x` escape inside a string
    InvalidUnicode,       ///< Malformed `\uXXXX` escape or unpaired surrogate
    UnterminatedString,   ///< No closing quote before end of input
    ControlCharacter,     ///< Raw control character (< 0x20) inside a string
    TrailingData,         ///< Tokens left over after the top-level value
    DepthExceeded         ///< Nesting deeper than the configured maximum
};

/// Returns a stable name for a syntax error kind (e.g. `"InvalidNumber"`).
[[nodiscard]] auto syntax_error_kind_name(SyntaxErrorKind kind) -> const char*;

/// A grammar or lexical violation in the input text.
///
/// Always carries the position of the first offending character or token.
/// For `UnexpectedToken` and `UnexpectedEndOfInput`, `expected` describes what
/// the parser wanted; `found` holds the offending text where there is one.
struct SyntaxError {
    SyntaxErrorKind kind = SyntaxErrorKind::UnexpectedToken;

    /// Human-readable description, without position.
    std::string message;

    std::string expected;
    std::string found;

    /// Byte offset of the failure (0-based).
    size_t offset = 0;

    /// Line of the failure (1-based).
    size_t line = 1;

    /// Column of the failure (1-based, in characters).
    size_t column = 1;

    [[nodiscard]] auto position() const -> TextPos {
        return TextPos{offset, line, column};
    }

    /// Formats the error as `"<message> at position N (line L, column C)"`.
    [[nodiscard]] auto to_string() const -> std::string;

    // ------------------------------------------------------------------------
    // Factories
    // ------------------------------------------------------------------------

    [[nodiscard]] static auto unexpected_token(std::string expected, std::string found,
                                               TextPos pos) -> SyntaxError;
    [[nodiscard]] static auto unexpected_end(std::string expected, TextPos pos) -> SyntaxError;
    [[nodiscard]] static auto invalid_number(std::string text, TextPos pos) -> SyntaxError;
    [[nodiscard]] static auto invalid_number(std::string text, std::string reason, TextPos pos)
        -> SyntaxError;
    [[nodiscard]] static auto invalid_escape(char escaped, TextPos pos) -> SyntaxError;
    [[nodiscard]] static auto invalid_unicode(std::string sequence, TextPos pos) -> SyntaxError;
    [[nodiscard]] static auto unterminated_string(TextPos pos) -> SyntaxError;
    [[nodiscard]] static auto control_character(unsigned char c, TextPos pos) -> SyntaxError;
    [[nodiscard]] static auto trailing_data(std::string found, TextPos pos) -> SyntaxError;
    [[nodiscard]] static auto depth_exceeded(size_t max_depth, TextPos pos) -> SyntaxError;
};

// ============================================================================
// IoError
// ============================================================================

/// Classification of a failure to obtain input text.
enum class IoErrorKind : uint8_t {
    NotFound,         ///< Path does not exist
    NotAFile,         ///< Path exists but is a directory or special file
    PermissionDenied, ///< The file could not be opened for reading
    ReadFailed,       ///< Any other open or read failure
    InvalidEncoding   ///< Contents are not valid UTF-8
};

/// Returns a stable name for an I/O error kind (e.g. `"NotFound"`).
[[nodiscard]] auto io_error_kind_name(IoErrorKind kind) -> const char*;

/// The input could not be read or decoded as text.
///
/// Detected only by the file loader, before any parsing begins.
struct IoError {
    IoErrorKind kind = IoErrorKind::ReadFailed;
    std::string path;
    std::string message;

    /// Formats the error as `"<message>: <path>"`.
    [[nodiscard]] auto to_string() const -> std::string {
        if (path.empty()) {
            return message;
        }
        return message + ": " + path;
    }

    [[nodiscard]] static auto make(IoErrorKind kind, std::string path, std::string message)
        -> IoError {
        return IoError{kind, std::move(path), std::move(message)};
    }
};

// ============================================================================
// JsonError
// ============================================================================

/// Either error kind, as returned by `parse_json_file`.
using JsonError = std::variant<SyntaxError, IoError>;

[[nodiscard]] inline auto is_syntax_error(const JsonError& error) -> bool {
    return std::holds_alternative<SyntaxError>(error);
}

[[nodiscard]] inline auto is_io_error(const JsonError& error) -> bool {
    return std::holds_alternative<IoError>(error);
}

/// Returns the kind name of whichever error is held (e.g. `"TrailingData"`,
/// `"NotFound"`).
[[nodiscard]] inline auto error_kind_name(const JsonError& error) -> const char* {
    if (const auto* syntax = std::get_if<SyntaxError>(&error)) {
        return syntax_error_kind_name(syntax->kind);
    }
    return io_error_kind_name(std::get<IoError>(error).kind);
}

/// Formats whichever error is held.
[[nodiscard]] inline auto error_message(const JsonError& error) -> std::string {
    return std::visit([](const auto& e) { return e.to_string(); }, error);
}

} // namespace strand::json
