//! # JSON Parser Tests
//!
//! Primitives, containers, duplicate keys, nesting limits and the error
//! kind, expectation and position reported for each malformed document.

#include "strand/json/json_parser.hpp"

#include <gtest/gtest.h>
#include <string>

using namespace strand;
using namespace strand::json;

namespace {

auto parse_ok(std::string_view text, ParseOptions options = {}) -> JsonValue {
    auto result = parse_json(text, options);
    if (is_err(result)) {
        ADD_FAILURE() << "parse failed: " << unwrap_err(result).to_string();
        return JsonValue();
    }
    return std::move(unwrap(result));
}

auto parse_err(std::string_view text, ParseOptions options = {}) -> SyntaxError {
    auto result = parse_json(text, options);
    if (is_ok(result)) {
        ADD_FAILURE() << "expected a syntax error for: " << text;
        return SyntaxError{};
    }
    return unwrap_err(result);
}

auto nested_arrays(size_t depth) -> std::string {
    return std::string(depth, '[') + std::string(depth, ']');
}

} // namespace

// ============================================================================
// Primitives
// ============================================================================

TEST(JsonParserTest, ParseNull) {
    EXPECT_TRUE(parse_ok("null").is_null());
}

TEST(JsonParserTest, ParseBooleans) {
    EXPECT_TRUE(parse_ok("true").as_bool());
    EXPECT_FALSE(parse_ok("false").as_bool());
}

TEST(JsonParserTest, ParseNumbersAsDouble) {
    EXPECT_DOUBLE_EQ(parse_ok("42").as_number(), 42.0);
    EXPECT_DOUBLE_EQ(parse_ok("-3.5").as_number(), -3.5);
    EXPECT_DOUBLE_EQ(parse_ok("6.02e23").as_number(), 6.02e23);
    // Integral and fractional spellings of the same value are indistinguishable.
    EXPECT_TRUE(parse_ok("42") == parse_ok("42.0"));
    EXPECT_TRUE(parse_ok("42") == parse_ok("4.2e1"));
}

TEST(JsonParserTest, ParseString) {
    EXPECT_EQ(parse_ok(R"("hello world")").as_string(), "hello world");
    EXPECT_EQ(parse_ok(R"("")").as_string(), "");
    EXPECT_EQ(parse_ok(R"("tab\there")").as_string(), "tab\there");
}

TEST(JsonParserTest, SurroundingWhitespaceIgnored) {
    EXPECT_DOUBLE_EQ(parse_ok(" \t\r\n 7 \n").as_number(), 7.0);
}

// ============================================================================
// Containers
// ============================================================================

TEST(JsonParserTest, ParseEmptyContainers) {
    auto arr = parse_ok("[]");
    ASSERT_TRUE(arr.is_array());
    EXPECT_EQ(arr.size(), 0u);

    auto obj = parse_ok("{ }");
    ASSERT_TRUE(obj.is_object());
    EXPECT_EQ(obj.size(), 0u);
}

TEST(JsonParserTest, ParseMixedArray) {
    auto arr = parse_ok(R"([1, "two", true, null, [3], {"four": 4}])");
    ASSERT_TRUE(arr.is_array());
    ASSERT_EQ(arr.size(), 6u);
    EXPECT_EQ(arr[0].kind(), JsonKind::Number);
    EXPECT_EQ(arr[1].kind(), JsonKind::String);
    EXPECT_EQ(arr[2].kind(), JsonKind::Bool);
    EXPECT_EQ(arr[3].kind(), JsonKind::Null);
    EXPECT_EQ(arr[4].kind(), JsonKind::Array);
    EXPECT_EQ(arr[5].kind(), JsonKind::Object);
}

TEST(JsonParserTest, ParseNestedUsers) {
    auto doc = parse_ok(R"({"users": [{"id": 1}, {"id": 2}]})");
    const auto* users = doc.get("users");
    ASSERT_NE(users, nullptr);
    ASSERT_EQ(users->size(), 2u);
    EXPECT_DOUBLE_EQ((*users)[0].get("id")->as_number(), 1.0);
    EXPECT_DOUBLE_EQ((*users)[1].get("id")->as_number(), 2.0);
}

TEST(JsonParserTest, ObjectKeepsInsertionOrder) {
    auto doc = parse_ok(R"({"zeta": 1, "alpha": 2, "mid": 3})");
    std::vector<std::string> keys;
    for (const auto& member : doc.as_object()) {
        keys.push_back(member.key);
    }
    EXPECT_EQ(keys, (std::vector<std::string>{"zeta", "alpha", "mid"}));
}

TEST(JsonParserTest, DuplicateKeyLastValueWinsFirstPositionKept) {
    auto doc = parse_ok(R"({"a": 1, "b": 2, "a": 3})");
    ASSERT_EQ(doc.size(), 2u);
    EXPECT_DOUBLE_EQ(doc.get("a")->as_number(), 3.0);
    EXPECT_EQ(doc.as_object().begin()->key, "a");
}

TEST(JsonParserTest, EscapedKeys) {
    auto doc = parse_ok(R"({"a\"b": true})");
    EXPECT_TRUE(doc.contains("a\"b"));
}

TEST(JsonParserTest, ParserClassWithOptions) {
    JsonParser parser("[[1]]", ParseOptions{2});
    auto result = parser.parse();
    ASSERT_TRUE(is_ok(result));
    EXPECT_DOUBLE_EQ(unwrap(result)[0][0].as_number(), 1.0);
}

// ============================================================================
// Structural Errors
// ============================================================================

TEST(JsonParserTest, ErrorMissingValueReportsPosition) {
    auto err = parse_err(R"({"bad": })");
    EXPECT_EQ(err.kind, SyntaxErrorKind::UnexpectedToken);
    EXPECT_EQ(err.expected, "value");
    EXPECT_EQ(err.found, "}");
    EXPECT_EQ(err.offset, 8u);
    EXPECT_NE(err.to_string().find("position 8"), std::string::npos);
}

TEST(JsonParserTest, ErrorTrailingCommaInObject) {
    auto err = parse_err(R"({"a":1,})");
    EXPECT_EQ(err.kind, SyntaxErrorKind::UnexpectedToken);
    EXPECT_EQ(err.expected, "string key");
    EXPECT_EQ(err.found, "}");
    EXPECT_EQ(err.offset, 7u);
}

TEST(JsonParserTest, ErrorTrailingCommaInArray) {
    auto err = parse_err("[1,2,]");
    EXPECT_EQ(err.kind, SyntaxErrorKind::UnexpectedToken);
    EXPECT_EQ(err.expected, "value");
    EXPECT_EQ(err.found, "]");
    EXPECT_EQ(err.offset, 5u);
}

TEST(JsonParserTest, ErrorMissingColon) {
    auto err = parse_err(R"({"a" 1})");
    EXPECT_EQ(err.kind, SyntaxErrorKind::UnexpectedToken);
    EXPECT_EQ(err.expected, "':'");
    EXPECT_EQ(err.found, "1");
    EXPECT_EQ(err.offset, 5u);
}

TEST(JsonParserTest, ErrorNonStringKey) {
    auto err = parse_err("{1: 2}");
    EXPECT_EQ(err.kind, SyntaxErrorKind::UnexpectedToken);
    EXPECT_EQ(err.expected, "string key");
    EXPECT_EQ(err.found, "1");
}

TEST(JsonParserTest, ErrorMissingSeparator) {
    auto err = parse_err("[1 2]");
    EXPECT_EQ(err.kind, SyntaxErrorKind::UnexpectedToken);
    EXPECT_EQ(err.expected, "',' or ']'");
    EXPECT_EQ(err.found, "2");

    auto obj_err = parse_err(R"({"a": 1 "b": 2})");
    EXPECT_EQ(obj_err.expected, "',' or '}'");
}

TEST(JsonParserTest, ErrorMismatchedClose) {
    auto err = parse_err("[1}");
    EXPECT_EQ(err.kind, SyntaxErrorKind::UnexpectedToken);
    EXPECT_EQ(err.found, "}");
}

TEST(JsonParserTest, ErrorEmptyInput) {
    auto err = parse_err("");
    EXPECT_EQ(err.kind, SyntaxErrorKind::UnexpectedEndOfInput);
    EXPECT_EQ(err.expected, "JSON value");
    EXPECT_EQ(err.offset, 0u);
}

TEST(JsonParserTest, ErrorWhitespaceOnlyInput) {
    auto err = parse_err("   ");
    EXPECT_EQ(err.kind, SyntaxErrorKind::UnexpectedEndOfInput);
    EXPECT_EQ(err.offset, 3u);
}

TEST(JsonParserTest, ErrorUnexpectedEndInsideContainer) {
    EXPECT_EQ(parse_err("[1,").kind, SyntaxErrorKind::UnexpectedEndOfInput);
    EXPECT_EQ(parse_err("[1").kind, SyntaxErrorKind::UnexpectedEndOfInput);
    EXPECT_EQ(parse_err(R"({"a")").kind, SyntaxErrorKind::UnexpectedEndOfInput);
    EXPECT_EQ(parse_err("{").kind, SyntaxErrorKind::UnexpectedEndOfInput);
}

TEST(JsonParserTest, ErrorRootIsCloser) {
    auto err = parse_err("]");
    EXPECT_EQ(err.kind, SyntaxErrorKind::UnexpectedToken);
    EXPECT_EQ(err.expected, "JSON value");
}

TEST(JsonParserTest, ErrorTrailingData) {
    auto err = parse_err("1 2");
    EXPECT_EQ(err.kind, SyntaxErrorKind::TrailingData);
    EXPECT_EQ(err.found, "2");
    EXPECT_EQ(err.offset, 2u);

    auto containers = parse_err("[] []");
    EXPECT_EQ(containers.kind, SyntaxErrorKind::TrailingData);
    EXPECT_EQ(containers.offset, 3u);
}

TEST(JsonParserTest, ErrorInvalidTextAfterRootIsTrailingData) {
    auto word = parse_err("{} x");
    EXPECT_EQ(word.kind, SyntaxErrorKind::TrailingData);
    EXPECT_EQ(word.found, "x");
    EXPECT_EQ(word.offset, 3u);

    auto symbol = parse_err("1 @");
    EXPECT_EQ(symbol.kind, SyntaxErrorKind::TrailingData);
    EXPECT_EQ(symbol.found, "@");
    EXPECT_EQ(symbol.offset, 2u);
    EXPECT_EQ(symbol.to_string().find("expected JSON value"), std::string::npos);

    auto glued = parse_err("[1]]x");
    EXPECT_EQ(glued.kind, SyntaxErrorKind::TrailingData);
    EXPECT_EQ(glued.offset, 3u);

    auto string = parse_err(R"(true "abc)");
    EXPECT_EQ(string.kind, SyntaxErrorKind::TrailingData);
    EXPECT_EQ(string.found, "\"");
    EXPECT_EQ(string.offset, 5u);
}

TEST(JsonParserTest, InvalidTextInsideContainerIsNotTrailingData) {
    EXPECT_EQ(parse_err("[1, x]").kind, SyntaxErrorKind::UnexpectedToken);
    EXPECT_EQ(parse_err(R"({"a": [] @})").kind, SyntaxErrorKind::UnexpectedToken);
}

TEST(JsonParserTest, ErrorUnterminatedStringInObject) {
    auto err = parse_err(R"({"key": "abc)");
    EXPECT_EQ(err.kind, SyntaxErrorKind::UnterminatedString);
    EXPECT_EQ(err.offset, 8u);
}

TEST(JsonParserTest, LexerErrorsPropagate) {
    EXPECT_EQ(parse_err("[01]").kind, SyntaxErrorKind::InvalidNumber);
    EXPECT_EQ(parse_err(R"(["\x"])").kind, SyntaxErrorKind::InvalidEscape);
    EXPECT_EQ(parse_err("[nul]").kind, SyntaxErrorKind::UnexpectedToken);
}

TEST(JsonParserTest, ErrorLineAndColumn) {
    auto err = parse_err("{\n  \"a\": }");
    EXPECT_EQ(err.line, 2u);
    EXPECT_EQ(err.column, 8u);
    EXPECT_NE(err.to_string().find("(line 2, column 8)"), std::string::npos);
}

// ============================================================================
// Nesting Depth
// ============================================================================

TEST(JsonParserTest, DepthExactlyAtLimitSucceeds) {
    auto value = parse_ok("[[[1]]]", ParseOptions{3});
    EXPECT_TRUE(value.is_array());
}

TEST(JsonParserTest, DepthOverLimitFailsAtOpeningBracket) {
    auto err = parse_err("[[[[1]]]]", ParseOptions{3});
    EXPECT_EQ(err.kind, SyntaxErrorKind::DepthExceeded);
    EXPECT_EQ(err.offset, 3u);
}

TEST(JsonParserTest, DepthCountsObjectsToo) {
    auto err = parse_err(R"({"a": {"b": [1]}})", ParseOptions{2});
    EXPECT_EQ(err.kind, SyntaxErrorKind::DepthExceeded);
    EXPECT_EQ(err.offset, 12u);
}

TEST(JsonParserTest, DefaultDepthLimit) {
    EXPECT_TRUE(parse_ok(nested_arrays(1000)).is_array());

    auto err = parse_err(nested_arrays(1001));
    EXPECT_EQ(err.kind, SyntaxErrorKind::DepthExceeded);
    EXPECT_EQ(err.offset, 1000u);
}

TEST(JsonParserTest, HostileNestingDoesNotOverflowStack) {
    std::string hostile(200000, '[');
    auto err = parse_err(hostile);
    EXPECT_EQ(err.kind, SyntaxErrorKind::DepthExceeded);
}
