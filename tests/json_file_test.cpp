//! # JSON File Loading Tests
//!
//! Reading and parsing files from a scratch directory: success, each I/O
//! error kind, UTF-8 validation and byte order mark handling.

#include "strand/json/json_file.hpp"

#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <string>

using namespace strand;
using namespace strand::json;
namespace fs = std::filesystem;

class JsonFileTest : public ::testing::Test {
protected:
    fs::path dir;

    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        dir = fs::temp_directory_path() / (std::string("strand_json_file_test_") + info->name());
        fs::remove_all(dir);
        fs::create_directories(dir);
    }

    void TearDown() override {
        std::error_code ec;
        fs::permissions(dir / "locked.json", fs::perms::owner_all, ec);
        fs::remove_all(dir, ec);
    }

    auto write_file(const std::string& name, const std::string& bytes) -> fs::path {
        auto path = dir / name;
        std::ofstream out(path, std::ios::binary);
        out << bytes;
        return path;
    }
};

// ============================================================================
// Success Paths
// ============================================================================

TEST_F(JsonFileTest, ParsesFile) {
    auto path = write_file("users.json", R"({"users": [{"id": 1}, {"id": 2}]})");
    auto result = parse_json_file(path);
    ASSERT_TRUE(is_ok(result)) << error_message(unwrap_err(result));
    EXPECT_EQ(unwrap(result).get("users")->size(), 2u);
}

TEST_F(JsonFileTest, ReadsTextVerbatim) {
    auto path = write_file("raw.json", "[1,\n 2]\n");
    auto text = read_json_text(path);
    ASSERT_TRUE(is_ok(text));
    EXPECT_EQ(unwrap(text), "[1,\n 2]\n");
}

TEST_F(JsonFileTest, StripsByteOrderMark) {
    auto path = write_file("bom.json", "\xEF\xBB\xBF{\"a\": true}");
    auto text = read_json_text(path);
    ASSERT_TRUE(is_ok(text));
    EXPECT_EQ(unwrap(text), "{\"a\": true}");

    auto result = parse_json_file(path);
    ASSERT_TRUE(is_ok(result));
    EXPECT_TRUE(unwrap(result).get("a")->as_bool());
}

TEST_F(JsonFileTest, PassesParseOptions) {
    auto path = write_file("deep.json", "[[[1]]]");
    auto result = parse_json_file(path, ParseOptions{2});
    ASSERT_TRUE(is_err(result));
    ASSERT_TRUE(is_syntax_error(unwrap_err(result)));
    EXPECT_EQ(std::get<SyntaxError>(unwrap_err(result)).kind, SyntaxErrorKind::DepthExceeded);
}

// ============================================================================
// Error Paths
// ============================================================================

TEST_F(JsonFileTest, MissingFileIsIoError) {
    auto path = dir / "nope.json";
    auto result = parse_json_file(path);
    ASSERT_TRUE(is_err(result));
    const auto& error = unwrap_err(result);
    ASSERT_TRUE(is_io_error(error));

    const auto& io = std::get<IoError>(error);
    EXPECT_EQ(io.kind, IoErrorKind::NotFound);
    EXPECT_EQ(io.path, path.string());
    EXPECT_EQ(error_message(error), "File not found: " + path.string());
}

TEST_F(JsonFileTest, DirectoryIsNotAFile) {
    auto result = read_json_text(dir);
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).kind, IoErrorKind::NotAFile);
}

TEST_F(JsonFileTest, UnreadableFileIsPermissionDenied) {
    auto path = write_file("locked.json", "{}");
    fs::permissions(path, fs::perms::none);
    {
        std::ifstream probe(path);
        if (probe.is_open()) {
            GTEST_SKIP() << "permissions are not enforced for this user";
        }
    }
    auto result = read_json_text(path);
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).kind, IoErrorKind::PermissionDenied);
}

TEST_F(JsonFileTest, InvalidUtf8IsIoError) {
    auto path = write_file("latin1.json", "[\"caf\xE9\"]");
    auto result = parse_json_file(path);
    ASSERT_TRUE(is_err(result));
    ASSERT_TRUE(is_io_error(unwrap_err(result)));
    const auto& io = std::get<IoError>(unwrap_err(result));
    EXPECT_EQ(io.kind, IoErrorKind::InvalidEncoding);
    EXPECT_NE(io.message.find("byte 5"), std::string::npos);
}

TEST_F(JsonFileTest, SyntaxErrorInFileIsSyntaxError) {
    auto path = write_file("bad.json", R"({"bad": })");
    auto result = parse_json_file(path);
    ASSERT_TRUE(is_err(result));
    ASSERT_TRUE(is_syntax_error(unwrap_err(result)));
    EXPECT_NE(error_message(unwrap_err(result)).find("position 8"), std::string::npos);
}

TEST_F(JsonFileTest, EmptyFileIsSyntaxError) {
    auto path = write_file("empty.json", "");
    auto text = read_json_text(path);
    ASSERT_TRUE(is_ok(text));
    EXPECT_TRUE(unwrap(text).empty());

    auto result = parse_json_file(path);
    ASSERT_TRUE(is_err(result));
    ASSERT_TRUE(is_syntax_error(unwrap_err(result)));
    EXPECT_EQ(std::get<SyntaxError>(unwrap_err(result)).kind,
              SyntaxErrorKind::UnexpectedEndOfInput);
}

// ============================================================================
// UTF-8 Validation
// ============================================================================

TEST(Utf8ValidationTest, AcceptsWellFormedText) {
    EXPECT_FALSE(validate_utf8("").has_value());
    EXPECT_FALSE(validate_utf8("plain ascii").has_value());
    EXPECT_FALSE(validate_utf8("\xC3\xA9\xE2\x82\xAC\xF0\x9F\x98\x80").has_value());
    EXPECT_FALSE(validate_utf8("\xF4\x8F\xBF\xBF").has_value()); // U+10FFFF
}

TEST(Utf8ValidationTest, RejectsMalformedSequences) {
    EXPECT_EQ(validate_utf8("ab\x80"), 2u);                // stray continuation
    EXPECT_EQ(validate_utf8("\xC0\xAF"), 0u);              // overlong '/'
    EXPECT_EQ(validate_utf8("\xE0\x80\xAF"), 0u);          // overlong 3-byte
    EXPECT_EQ(validate_utf8("\xED\xA0\x80"), 0u);          // encoded surrogate
    EXPECT_EQ(validate_utf8("\xF4\x90\x80\x80"), 0u);      // above U+10FFFF
    EXPECT_EQ(validate_utf8("x\xE2\x82"), 1u);             // truncated
    EXPECT_EQ(validate_utf8("\xC3("), 0u);                 // bad continuation
    EXPECT_EQ(validate_utf8("ok\xFF"), 2u);                // never valid
}

// ============================================================================
// Error Kind Names
// ============================================================================

TEST(JsonErrorTest, SyntaxErrorKindNames) {
    EXPECT_STREQ(syntax_error_kind_name(SyntaxErrorKind::UnexpectedToken), "UnexpectedToken");
    EXPECT_STREQ(syntax_error_kind_name(SyntaxErrorKind::UnexpectedEndOfInput),
                 "UnexpectedEndOfInput");
    EXPECT_STREQ(syntax_error_kind_name(SyntaxErrorKind::InvalidNumber), "InvalidNumber");
    EXPECT_STREQ(syntax_error_kind_name(SyntaxErrorKind::InvalidEscape), "InvalidEscape");
    EXPECT_STREQ(syntax_error_kind_name(SyntaxErrorKind::InvalidUnicode), "InvalidUnicode");
    EXPECT_STREQ(syntax_error_kind_name(SyntaxErrorKind::UnterminatedString),
                 "UnterminatedString");
    EXPECT_STREQ(syntax_error_kind_name(SyntaxErrorKind::ControlCharacter), "ControlCharacter");
    EXPECT_STREQ(syntax_error_kind_name(SyntaxErrorKind::TrailingData), "TrailingData");
    EXPECT_STREQ(syntax_error_kind_name(SyntaxErrorKind::DepthExceeded), "DepthExceeded");
}

TEST(JsonErrorTest, IoErrorKindNames) {
    EXPECT_STREQ(io_error_kind_name(IoErrorKind::NotFound), "NotFound");
    EXPECT_STREQ(io_error_kind_name(IoErrorKind::NotAFile), "NotAFile");
    EXPECT_STREQ(io_error_kind_name(IoErrorKind::PermissionDenied), "PermissionDenied");
    EXPECT_STREQ(io_error_kind_name(IoErrorKind::ReadFailed), "ReadFailed");
    EXPECT_STREQ(io_error_kind_name(IoErrorKind::InvalidEncoding), "InvalidEncoding");
}

TEST_F(JsonFileTest, ErrorKindNameOfEitherError) {
    auto missing = parse_json_file(dir / "nope.json");
    ASSERT_TRUE(is_err(missing));
    EXPECT_STREQ(error_kind_name(unwrap_err(missing)), "NotFound");

    auto path = write_file("trailing.json", "{} x");
    auto trailing = parse_json_file(path);
    ASSERT_TRUE(is_err(trailing));
    EXPECT_STREQ(error_kind_name(unwrap_err(trailing)), "TrailingData");
}
