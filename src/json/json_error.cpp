//! # JSON Error Implementation
//!
//! Message formatting and factory functions for `SyntaxError` and `IoError`.
//! Factories build the human-readable message once so that every caller
//! reports the same wording for the same failure.

#include "strand/json/json_error.hpp"

#include <cstdio>

namespace strand::json {

namespace {

auto make_syntax_error(SyntaxErrorKind kind, std::string message, TextPos pos) -> SyntaxError {
    SyntaxError err;
    err.kind = kind;
    err.message = std::move(message);
    err.offset = pos.offset;
    err.line = pos.line;
    err.column = pos.column;
    return err;
}

} // anonymous namespace

auto syntax_error_kind_name(SyntaxErrorKind kind) -> const char* {
    switch (kind) {
    case SyntaxErrorKind::UnexpectedToken:
        return "UnexpectedToken";
    case SyntaxErrorKind::UnexpectedEndOfInput:
        return "UnexpectedEndOfInput";
    case SyntaxErrorKind::InvalidNumber:
        return "InvalidNumber";
    case SyntaxErrorKind::InvalidEscape:
        return "InvalidEscape";
    case SyntaxErrorKind::InvalidUnicode:
        return "InvalidUnicode";
    case SyntaxErrorKind::UnterminatedString:
        return "UnterminatedString";
    case SyntaxErrorKind::ControlCharacter:
        return "ControlCharacter";
    case SyntaxErrorKind::TrailingData:
        return "TrailingData";
    case SyntaxErrorKind::DepthExceeded:
        return "DepthExceeded";
    }
    return "Unknown";
}

auto io_error_kind_name(IoErrorKind kind) -> const char* {
    switch (kind) {
    case IoErrorKind::NotFound:
        return "NotFound";
    case IoErrorKind::NotAFile:
        return "NotAFile";
    case IoErrorKind::PermissionDenied:
        return "PermissionDenied";
    case IoErrorKind::ReadFailed:
        return "ReadFailed";
    case IoErrorKind::InvalidEncoding:
        return "InvalidEncoding";
    }
    return "Unknown";
}

auto SyntaxError::to_string() const -> std::string {
    return message + " at position " + std::to_string(offset) + " (line " +
           std::to_string(line) + ", column " + std::to_string(column) + ")";
}

// ============================================================================
// Factories
// ============================================================================

auto SyntaxError::unexpected_token(std::string expected, std::string found, TextPos pos)
    -> SyntaxError {
    auto err = make_syntax_error(SyntaxErrorKind::UnexpectedToken,
                                 "unexpected token: expected " + expected + ", found '" + found +
                                     "'",
                                 pos);
    err.expected = std::move(expected);
    err.found = std::move(found);
    return err;
}

auto SyntaxError::unexpected_end(std::string expected, TextPos pos) -> SyntaxError {
    auto err = make_syntax_error(SyntaxErrorKind::UnexpectedEndOfInput,
                                 "unexpected end of input: expected " + expected, pos);
    err.expected = std::move(expected);
    return err;
}

auto SyntaxError::invalid_number(std::string text, TextPos pos) -> SyntaxError {
    auto err = make_syntax_error(SyntaxErrorKind::InvalidNumber, "invalid number '" + text + "'",
                                 pos);
    err.found = std::move(text);
    return err;
}

auto SyntaxError::invalid_number(std::string text, std::string reason, TextPos pos)
    -> SyntaxError {
    auto err = make_syntax_error(SyntaxErrorKind::InvalidNumber,
                                 "invalid number '" + text + "': " + reason, pos);
    err.found = std::move(text);
    return err;
}

auto SyntaxError::invalid_escape(char escaped, TextPos pos) -> SyntaxError {
    std::string seq = "\\";
    seq += escaped;
    auto err = make_syntax_error(SyntaxErrorKind::InvalidEscape,
                                 "invalid escape sequence '" + seq + "'", pos);
    err.found = std::move(seq);
    return err;
}

auto SyntaxError::invalid_unicode(std::string sequence, TextPos pos) -> SyntaxError {
    auto err = make_syntax_error(SyntaxErrorKind::InvalidUnicode,
                                 "invalid unicode escape '\\u" + sequence + "'", pos);
    err.found = std::move(sequence);
    return err;
}

auto SyntaxError::unterminated_string(TextPos pos) -> SyntaxError {
    auto err = make_syntax_error(SyntaxErrorKind::UnterminatedString, "unterminated string", pos);
    err.expected = "\"";
    return err;
}

auto SyntaxError::control_character(unsigned char c, TextPos pos) -> SyntaxError {
    char buf[8];
    std::snprintf(buf, sizeof(buf), "0x%02X", static_cast<unsigned int>(c));
    auto err = make_syntax_error(SyntaxErrorKind::ControlCharacter,
                                 std::string("unescaped control character ") + buf +
                                     " in string",
                                 pos);
    err.found = buf;
    return err;
}

auto SyntaxError::trailing_data(std::string found, TextPos pos) -> SyntaxError {
    auto err = make_syntax_error(SyntaxErrorKind::TrailingData,
                                 "trailing data after JSON value: found '" + found + "'", pos);
    err.expected = "end of input";
    err.found = std::move(found);
    return err;
}

auto SyntaxError::depth_exceeded(size_t max_depth, TextPos pos) -> SyntaxError {
    return make_syntax_error(SyntaxErrorKind::DepthExceeded,
                             "maximum nesting depth of " + std::to_string(max_depth) +
                                 " exceeded",
                             pos);
}

} // namespace strand::json
