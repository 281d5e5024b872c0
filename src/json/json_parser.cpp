//! # JSON Parser Implementation
//!
//! Recursive descent over the lexer's token stream. Each `parse_*` function
//! is entered with `current_` on its first token and returns with `current_`
//! on the first token after the construct.
//!
//! ## Grammar
//!
//! ```text
//! document := value EOF
//! value    := object | array | STRING | NUMBER | 'true' | 'false' | 'null'
//! object   := '{' ( STRING ':' value ( ',' STRING ':' value )* )? '}'
//! array    := '[' ( value ( ',' value )* )? ']'
//! ```

#include "strand/json/json_parser.hpp"

#include <string>

namespace strand::json {

JsonParser::JsonParser(std::string_view input, ParseOptions options)
    : input_(input), lexer_(input), options_(options) {}

auto JsonParser::completes_root() const -> bool {
    if (depth_ == 0) {
        switch (current_.kind) {
        case JsonTokenKind::Null:
        case JsonTokenKind::True:
        case JsonTokenKind::False:
        case JsonTokenKind::Number:
        case JsonTokenKind::String:
            return true;
        default:
            return false;
        }
    }
    return depth_ == 1 && (check(JsonTokenKind::RBrace) || check(JsonTokenKind::RBracket));
}

auto JsonParser::advance() -> std::optional<SyntaxError> {
    bool root_complete = completes_root();
    auto next = lexer_.next_token();
    if (is_err(next)) {
        auto& err = unwrap_err(next);
        if (root_complete) {
            // Whatever follows a finished document is trailing data, even when it
            // is not a valid token.
            std::string found =
                err.found.empty() ? std::string(input_.substr(err.offset, 1)) : err.found;
            return SyntaxError::trailing_data(std::move(found), err.position());
        }
        return std::move(err);
    }
    current_ = std::move(unwrap(next));
    return std::nullopt;
}

auto JsonParser::unexpected(const char* expected) const -> SyntaxError {
    if (check(JsonTokenKind::Eof)) {
        return SyntaxError::unexpected_end(expected, current_.pos);
    }
    return SyntaxError::unexpected_token(expected, std::string(current_.lexeme), current_.pos);
}

auto JsonParser::parse() -> Result<JsonValue, SyntaxError> {
    if (auto err = advance()) {
        return std::move(*err);
    }

    auto result = parse_value("JSON value");
    if (is_err(result)) {
        return result;
    }

    if (!check(JsonTokenKind::Eof)) {
        return SyntaxError::trailing_data(std::string(current_.lexeme), current_.pos);
    }

    return result;
}

/// Parses a single value of any kind.
///
/// # Arguments
///
/// * `expected` - What to report if the current token cannot start a value
auto JsonParser::parse_value(const char* expected) -> Result<JsonValue, SyntaxError> {
    switch (current_.kind) {
    case JsonTokenKind::Null:
        if (auto err = advance()) {
            return std::move(*err);
        }
        return JsonValue();

    case JsonTokenKind::True:
        if (auto err = advance()) {
            return std::move(*err);
        }
        return JsonValue(true);

    case JsonTokenKind::False:
        if (auto err = advance()) {
            return std::move(*err);
        }
        return JsonValue(false);

    case JsonTokenKind::Number: {
        double num = current_.number_value;
        if (auto err = advance()) {
            return std::move(*err);
        }
        return JsonValue(num);
    }

    case JsonTokenKind::String: {
        std::string str = std::move(current_.string_value);
        if (auto err = advance()) {
            return std::move(*err);
        }
        return JsonValue(std::move(str));
    }

    case JsonTokenKind::LBrace:
    case JsonTokenKind::LBracket: {
        if (depth_ >= options_.max_depth) {
            return SyntaxError::depth_exceeded(options_.max_depth, current_.pos);
        }
        ++depth_;
        auto result = check(JsonTokenKind::LBrace) ? parse_object() : parse_array();
        --depth_;
        return result;
    }

    default:
        return unexpected(expected);
    }
}

/// Parses `{ ... }`. Duplicate keys keep their first position and take the
/// last value.
auto JsonParser::parse_object() -> Result<JsonValue, SyntaxError> {
    if (auto err = advance()) { // '{'
        return std::move(*err);
    }

    JsonObject obj;

    if (check(JsonTokenKind::RBrace)) {
        if (auto err = advance()) {
            return std::move(*err);
        }
        return JsonValue(std::move(obj));
    }

    while (true) {
        if (!check(JsonTokenKind::String)) {
            return unexpected("string key");
        }
        std::string key = std::move(current_.string_value);
        if (auto err = advance()) {
            return std::move(*err);
        }

        if (!check(JsonTokenKind::Colon)) {
            return unexpected("':'");
        }
        if (auto err = advance()) {
            return std::move(*err);
        }

        auto value_result = parse_value("value");
        if (is_err(value_result)) {
            return value_result;
        }
        obj.insert_or_assign(std::move(key), std::move(unwrap(value_result)));

        if (check(JsonTokenKind::Comma)) {
            // A '}' right after the comma fails on the next key check.
            if (auto err = advance()) {
                return std::move(*err);
            }
        } else if (check(JsonTokenKind::RBrace)) {
            if (auto err = advance()) {
                return std::move(*err);
            }
            return JsonValue(std::move(obj));
        } else {
            return unexpected("',' or '}'");
        }
    }
}

auto JsonParser::parse_array() -> Result<JsonValue, SyntaxError> {
    if (auto err = advance()) { // '['
        return std::move(*err);
    }

    JsonArray arr;

    if (check(JsonTokenKind::RBracket)) {
        if (auto err = advance()) {
            return std::move(*err);
        }
        return JsonValue(std::move(arr));
    }

    while (true) {
        auto value_result = parse_value("value");
        if (is_err(value_result)) {
            return value_result;
        }
        arr.push_back(std::move(unwrap(value_result)));

        if (check(JsonTokenKind::Comma)) {
            if (auto err = advance()) {
                return std::move(*err);
            }
        } else if (check(JsonTokenKind::RBracket)) {
            if (auto err = advance()) {
                return std::move(*err);
            }
            return JsonValue(std::move(arr));
        } else {
            return unexpected("',' or ']'");
        }
    }
}

// ============================================================================
// Convenience Functions
// ============================================================================

auto parse_json(std::string_view input, ParseOptions options) -> Result<JsonValue, SyntaxError> {
    JsonParser parser(input, options);
    return parser.parse();
}

} // namespace strand::json
