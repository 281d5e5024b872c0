//! # JSON Lexer Implementation
//!
//! Single pass, no backtracking: every byte is examined a bounded number of
//! times, so tokenization is linear in the input size.
//!
//! ## Lexer Details
//!
//! - Structural tokens: `{`, `}`, `[`, `]`, `:`, `,`
//! - Strings with all RFC 8259 escapes, including `\uXXXX` surrogate pairs
//! - Numbers: the maximal run of number characters is read first and then
//!   checked against the strict grammar, so `1.2.3` is reported as one
//!   invalid number rather than as `1.2` followed by a stray `.`
//! - Keywords: the maximal alphabetic run must be `true`, `false` or `null`

#include "strand/json/json_lexer.hpp"

#include <charconv>
#include <cmath>
#include <cstdlib>

namespace strand::json {

namespace {

auto is_digit(char c) -> bool {
    return c >= '0' && c <= '9';
}

auto is_hex_digit(char c) -> bool {
    return is_digit(c) || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F');
}

auto is_ascii_alpha(char c) -> bool {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
}

auto is_number_char(char c) -> bool {
    return is_digit(c) || c == '-' || c == '+' || c == '.' || c == 'e' || c == 'E';
}

/// Checks `-?(0|[1-9]\d*)(\.\d+)?([eE][+-]?\d+)?` against the whole text.
auto matches_number_grammar(std::string_view s) -> bool {
    size_t i = 0;
    const size_t n = s.size();

    if (i < n && s[i] == '-') {
        ++i;
    }
    if (i >= n) {
        return false;
    }

    if (s[i] == '0') {
        ++i;
    } else if (s[i] >= '1' && s[i] <= '9') {
        while (i < n && is_digit(s[i])) {
            ++i;
        }
    } else {
        return false;
    }

    if (i < n && s[i] == '.') {
        ++i;
        if (i >= n || !is_digit(s[i])) {
            return false;
        }
        while (i < n && is_digit(s[i])) {
            ++i;
        }
    }

    if (i < n && (s[i] == 'e' || s[i] == 'E')) {
        ++i;
        if (i < n && (s[i] == '+' || s[i] == '-')) {
            ++i;
        }
        if (i >= n || !is_digit(s[i])) {
            return false;
        }
        while (i < n && is_digit(s[i])) {
            ++i;
        }
    }

    return i == n;
}

/// Byte length of the UTF-8 sequence introduced by `lead` (1 for ASCII or junk).
auto utf8_sequence_length(unsigned char lead) -> size_t {
    if (lead >= 0xF0 && lead <= 0xF7) {
        return 4;
    }
    if (lead >= 0xE0) {
        return lead <= 0xEF ? 3 : 1;
    }
    if (lead >= 0xC0) {
        return 2;
    }
    return 1;
}

void append_utf8(std::string& out, uint32_t cp) {
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
}

auto is_high_surrogate(uint32_t cp) -> bool {
    return cp >= 0xD800 && cp <= 0xDBFF;
}

auto is_low_surrogate(uint32_t cp) -> bool {
    return cp >= 0xDC00 && cp <= 0xDFFF;
}

} // anonymous namespace

auto token_kind_name(JsonTokenKind kind) -> const char* {
    switch (kind) {
    case JsonTokenKind::LBrace:
        return "'{'";
    case JsonTokenKind::RBrace:
        return "'}'";
    case JsonTokenKind::LBracket:
        return "'['";
    case JsonTokenKind::RBracket:
        return "']'";
    case JsonTokenKind::Colon:
        return "':'";
    case JsonTokenKind::Comma:
        return "','";
    case JsonTokenKind::String:
        return "string";
    case JsonTokenKind::Number:
        return "number";
    case JsonTokenKind::True:
        return "'true'";
    case JsonTokenKind::False:
        return "'false'";
    case JsonTokenKind::Null:
        return "'null'";
    case JsonTokenKind::Eof:
        return "end of input";
    }
    return "token";
}

// ============================================================================
// Cursor
// ============================================================================

JsonLexer::JsonLexer(std::string_view input) : input_(input) {}

auto JsonLexer::peek() const -> char {
    return at_end() ? '\0' : input_[pos_];
}

auto JsonLexer::peek_at(size_t ahead) const -> char {
    if (pos_ + ahead >= input_.size()) {
        return '\0';
    }
    return input_[pos_ + ahead];
}

/// Consumes one byte. Continuation bytes of a UTF-8 sequence do not advance
/// the column.
auto JsonLexer::advance() -> char {
    if (at_end()) {
        return '\0';
    }
    char c = input_[pos_++];
    if (c == '\n') {
        ++line_;
        column_ = 1;
    } else if ((static_cast<unsigned char>(c) & 0xC0) != 0x80) {
        ++column_;
    }
    return c;
}

void JsonLexer::skip_whitespace() {
    while (!at_end()) {
        char c = peek();
        if (c != ' ' && c != '\t' && c != '\n' && c != '\r') {
            break;
        }
        advance();
    }
}

auto JsonLexer::make_token(JsonTokenKind kind, TextPos start) const -> JsonToken {
    JsonToken tok;
    tok.kind = kind;
    tok.lexeme = input_.substr(start.offset, pos_ - start.offset);
    tok.pos = start;
    return tok;
}

// ============================================================================
// Dispatch
// ============================================================================

auto JsonLexer::next_token() -> Result<JsonToken, SyntaxError> {
    skip_whitespace();

    TextPos start = position();
    if (at_end()) {
        return make_token(JsonTokenKind::Eof, start);
    }

    char c = peek();
    switch (c) {
    case '{':
        advance();
        return make_token(JsonTokenKind::LBrace, start);
    case '}':
        advance();
        return make_token(JsonTokenKind::RBrace, start);
    case '[':
        advance();
        return make_token(JsonTokenKind::LBracket, start);
    case ']':
        advance();
        return make_token(JsonTokenKind::RBracket, start);
    case ':':
        advance();
        return make_token(JsonTokenKind::Colon, start);
    case ',':
        advance();
        return make_token(JsonTokenKind::Comma, start);
    case '"':
        return scan_string();
    default:
        break;
    }

    if (c == '-' || is_digit(c)) {
        return scan_number();
    }
    if (is_ascii_alpha(c)) {
        return scan_keyword();
    }

    size_t len = utf8_sequence_length(static_cast<unsigned char>(c));
    std::string found(input_.substr(pos_, len));
    return SyntaxError::unexpected_token("JSON value", std::move(found), start);
}

// ============================================================================
// Strings
// ============================================================================

auto JsonLexer::scan_string() -> Result<JsonToken, SyntaxError> {
    TextPos start = position();
    advance(); // opening quote

    std::string value;
    while (!at_end()) {
        char c = peek();

        if (c == '"') {
            advance();
            JsonToken tok = make_token(JsonTokenKind::String, start);
            tok.string_value = std::move(value);
            return tok;
        }

        if (c == '\\') {
            if (auto err = scan_escape(value, start)) {
                return std::move(*err);
            }
            continue;
        }

        if (static_cast<unsigned char>(c) < 0x20) {
            return SyntaxError::control_character(static_cast<unsigned char>(c), position());
        }

        value += c;
        advance();
    }

    return SyntaxError::unterminated_string(start);
}

auto JsonLexer::scan_escape(std::string& out, TextPos string_start) -> std::optional<SyntaxError> {
    TextPos escape_start = position();
    advance(); // backslash

    if (at_end()) {
        return SyntaxError::unterminated_string(string_start);
    }

    char escaped = advance();
    switch (escaped) {
    case '"':
    case '\\':
    case '/':
        out += escaped;
        return std::nullopt;
    case 'b':
        out += '\b';
        return std::nullopt;
    case 'f':
        out += '\f';
        return std::nullopt;
    case 'n':
        out += '\n';
        return std::nullopt;
    case 'r':
        out += '\r';
        return std::nullopt;
    case 't':
        out += '\t';
        return std::nullopt;
    case 'u':
        break;
    default:
        return SyntaxError::invalid_escape(escaped, escape_start);
    }

    auto first = read_hex4(escape_start);
    if (is_err(first)) {
        return std::move(unwrap_err(first));
    }
    uint32_t cp = unwrap(first);

    if (is_low_surrogate(cp)) {
        return SyntaxError::invalid_unicode(
            std::string(input_.substr(escape_start.offset + 2, 4)), escape_start);
    }

    if (is_high_surrogate(cp)) {
        // A high surrogate is only meaningful when a low one follows directly.
        if (peek() != '\\' || peek_at(1) != 'u') {
            return SyntaxError::invalid_unicode(
                std::string(input_.substr(escape_start.offset + 2, 4)), escape_start);
        }
        TextPos low_start = position();
        advance();
        advance();
        auto second = read_hex4(low_start);
        if (is_err(second)) {
            return std::move(unwrap_err(second));
        }
        uint32_t low = unwrap(second);
        if (!is_low_surrogate(low)) {
            return SyntaxError::invalid_unicode(
                std::string(input_.substr(low_start.offset + 2, 4)), low_start);
        }
        cp = 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
    }

    append_utf8(out, cp);
    return std::nullopt;
}

auto JsonLexer::read_hex4(TextPos escape_start) -> Result<uint32_t, SyntaxError> {
    // The reported sequence stops at the first non-hex character.
    size_t len = 0;
    while (len < 4 && pos_ + len < input_.size() && is_hex_digit(input_[pos_ + len])) {
        ++len;
    }
    std::string_view hex = input_.substr(pos_, len);
    if (len < 4) {
        return SyntaxError::invalid_unicode(std::string(hex), escape_start);
    }

    uint32_t cp = 0;
    auto [ptr, ec] = std::from_chars(hex.data(), hex.data() + hex.size(), cp, 16);
    if (ec != std::errc{} || ptr != hex.data() + hex.size()) {
        return SyntaxError::invalid_unicode(std::string(hex), escape_start);
    }
    for (int i = 0; i < 4; ++i) {
        advance();
    }
    return cp;
}

// ============================================================================
// Numbers
// ============================================================================

auto JsonLexer::scan_number() -> Result<JsonToken, SyntaxError> {
    TextPos start = position();
    while (!at_end() && is_number_char(peek())) {
        advance();
    }

    std::string_view text = input_.substr(start.offset, pos_ - start.offset);
    if (!matches_number_grammar(text)) {
        return SyntaxError::invalid_number(std::string(text), start);
    }

    double value = 0.0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec == std::errc::result_out_of_range) {
        // from_chars reports underflow and overflow alike; only overflow is fatal.
        value = std::strtod(std::string(text).c_str(), nullptr);
    } else if (ec != std::errc{} || ptr != text.data() + text.size()) {
        return SyntaxError::invalid_number(std::string(text), start);
    }
    if (!std::isfinite(value)) {
        return SyntaxError::invalid_number(std::string(text), "out of range", start);
    }

    JsonToken tok = make_token(JsonTokenKind::Number, start);
    tok.number_value = value;
    return tok;
}

// ============================================================================
// Keywords
// ============================================================================

auto JsonLexer::scan_keyword() -> Result<JsonToken, SyntaxError> {
    TextPos start = position();
    while (!at_end() && is_ascii_alpha(peek())) {
        advance();
    }

    std::string_view word = input_.substr(start.offset, pos_ - start.offset);
    if (word == "true") {
        return make_token(JsonTokenKind::True, start);
    }
    if (word == "false") {
        return make_token(JsonTokenKind::False, start);
    }
    if (word == "null") {
        return make_token(JsonTokenKind::Null, start);
    }
    return SyntaxError::unexpected_token("keyword", std::string(word), start);
}

// ============================================================================
// Convenience
// ============================================================================

auto tokenize(std::string_view input) -> Result<std::vector<JsonToken>, SyntaxError> {
    JsonLexer lexer(input);
    std::vector<JsonToken> tokens;
    while (true) {
        auto next = lexer.next_token();
        if (is_err(next)) {
            return std::move(unwrap_err(next));
        }
        bool done = unwrap(next).kind == JsonTokenKind::Eof;
        tokens.push_back(std::move(unwrap(next)));
        if (done) {
            return tokens;
        }
    }
}

} // namespace strand::json
