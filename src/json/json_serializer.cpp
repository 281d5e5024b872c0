//! # JSON Serializer Implementation
//!
//! ## String Escaping
//!
//! | Character | Escape Sequence |
//! |-----------|-----------------|
//! | `"` | `\"` |
//! | `\` | `\\` |
//! | Backspace | `\b` |
//! | Form feed | `\f` |
//! | Line feed | `\n` |
//! | Carriage return | `\r` |
//! | Tab | `\t` |
//! | Other control (0x00-0x1F) | `\u00XX` |
//!
//! ## Numbers
//!
//! Numbers go through `std::to_chars`, which yields the shortest text that
//! round-trips and is independent of the global locale: `42.0` prints as
//! `42`, `0.1` as `0.1`, `1e21` as `1e+21`.

#include "strand/json/json_serializer.hpp"

#include <array>
#include <charconv>
#include <cmath>
#include <ostream>

namespace strand::json {

namespace {

void append_escaped(std::string& out, std::string_view s) {
    static constexpr char HEX[] = "0123456789abcdef";

    for (char c : s) {
        switch (c) {
        case '"':
            out += "\\\"";
            break;
        case '\\':
            out += "\\\\";
            break;
        case '\b':
            out += "\\b";
            break;
        case '\f':
            out += "\\f";
            break;
        case '\n':
            out += "\\n";
            break;
        case '\r':
            out += "\\r";
            break;
        case '\t':
            out += "\\t";
            break;
        default: {
            auto uc = static_cast<unsigned char>(c);
            if (uc < 0x20) {
                out += "\\u00";
                out += HEX[uc >> 4];
                out += HEX[uc & 0x0F];
            } else {
                out += c;
            }
            break;
        }
        }
    }
}

void append_quoted(std::string& out, std::string_view s) {
    out += '"';
    append_escaped(out, s);
    out += '"';
}

void append_number(std::string& out, double value) {
    if (!std::isfinite(value)) {
        out += "null";
        return;
    }
    // 32 bytes hold any shortest-form double.
    std::array<char, 32> buf{};
    auto [ptr, ec] = std::to_chars(buf.data(), buf.data() + buf.size(), value);
    if (ec != std::errc{}) {
        out += "null";
        return;
    }
    out.append(buf.data(), ptr);
}

void append_newline_indent(std::string& out, size_t indent, size_t depth) {
    out += '\n';
    out.append(indent * depth, ' ');
}

/// Recursive writer. `indent == 0` selects compact output.
void write_value(const JsonValue& value, std::string& out, size_t indent, size_t depth) {
    switch (value.kind()) {
    case JsonKind::Null:
        out += "null";
        return;

    case JsonKind::Bool:
        out += value.as_bool() ? "true" : "false";
        return;

    case JsonKind::Number:
        append_number(out, value.as_number());
        return;

    case JsonKind::String:
        append_quoted(out, value.as_string());
        return;

    case JsonKind::Array: {
        const auto& arr = value.as_array();
        if (arr.empty()) {
            out += "[]";
            return;
        }
        out += '[';
        for (size_t i = 0; i < arr.size(); ++i) {
            if (i > 0) {
                out += ',';
            }
            if (indent > 0) {
                append_newline_indent(out, indent, depth + 1);
            }
            write_value(arr[i], out, indent, depth + 1);
        }
        if (indent > 0) {
            append_newline_indent(out, indent, depth);
        }
        out += ']';
        return;
    }

    case JsonKind::Object: {
        const auto& obj = value.as_object();
        if (obj.empty()) {
            out += "{}";
            return;
        }
        out += '{';
        bool first = true;
        for (const auto& member : obj) {
            if (!first) {
                out += ',';
            }
            first = false;
            if (indent > 0) {
                append_newline_indent(out, indent, depth + 1);
            }
            append_quoted(out, member.key);
            out += indent > 0 ? ": " : ":";
            write_value(member.value, out, indent, depth + 1);
        }
        if (indent > 0) {
            append_newline_indent(out, indent, depth);
        }
        out += '}';
        return;
    }
    }
}

} // anonymous namespace

// ============================================================================
// Free Functions
// ============================================================================

auto serialize(const JsonValue& value, std::optional<size_t> indent) -> std::string {
    std::string out;
    write_value(value, out, indent.value_or(0), 0);
    return out;
}

auto escape_json_string(std::string_view text) -> std::string {
    std::string out;
    out.reserve(text.size());
    append_escaped(out, text);
    return out;
}

auto format_json_number(double value) -> std::string {
    std::string out;
    append_number(out, value);
    return out;
}

// ============================================================================
// JsonValue Serialization Methods
// ============================================================================

auto JsonValue::to_string() const -> std::string {
    return serialize(*this);
}

auto JsonValue::to_string_pretty(size_t indent) const -> std::string {
    return serialize(*this, indent);
}

auto JsonValue::write_to(std::ostream& os) const -> std::ostream& {
    return os << serialize(*this);
}

auto JsonValue::write_to_pretty(std::ostream& os, size_t indent) const -> std::ostream& {
    return os << serialize(*this, indent);
}

} // namespace strand::json
