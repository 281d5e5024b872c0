//! # JSON File Loading Implementation
//!
//! One blocking read per call, no retries and no caching.

#include "strand/json/json_file.hpp"

#include <cerrno>
#include <cstdint>
#include <fstream>
#include <sstream>
#include <system_error>

namespace strand::json {

namespace {

constexpr std::string_view UTF8_BOM = "\xEF\xBB\xBF";

auto is_continuation(unsigned char c) -> bool {
    return (c & 0xC0) == 0x80;
}

} // anonymous namespace

auto validate_utf8(std::string_view bytes) -> std::optional<size_t> {
    size_t i = 0;
    const size_t n = bytes.size();

    while (i < n) {
        auto lead = static_cast<unsigned char>(bytes[i]);

        if (lead < 0x80) {
            ++i;
            continue;
        }

        size_t len = 0;
        uint32_t cp = 0;
        uint32_t min_cp = 0;
        if (lead >= 0xC2 && lead <= 0xDF) {
            len = 2;
            cp = lead & 0x1F;
            min_cp = 0x80;
        } else if (lead >= 0xE0 && lead <= 0xEF) {
            len = 3;
            cp = lead & 0x0F;
            min_cp = 0x800;
        } else if (lead >= 0xF0 && lead <= 0xF4) {
            len = 4;
            cp = lead & 0x07;
            min_cp = 0x10000;
        } else {
            // Stray continuation byte, overlong 2-byte lead (C0/C1) or F5..FF.
            return i;
        }

        if (i + len > n) {
            return i;
        }
        for (size_t k = 1; k < len; ++k) {
            auto c = static_cast<unsigned char>(bytes[i + k]);
            if (!is_continuation(c)) {
                return i;
            }
            cp = (cp << 6) | (c & 0x3F);
        }

        if (cp < min_cp || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
            return i;
        }
        i += len;
    }

    return std::nullopt;
}

auto read_json_text(const std::filesystem::path& path) -> Result<std::string, IoError> {
    namespace fs = std::filesystem;

    std::error_code ec;
    auto status = fs::status(path, ec);
    if (!fs::exists(status)) {
        if (ec && ec != std::errc::no_such_file_or_directory) {
            return IoError::make(IoErrorKind::ReadFailed, path.string(),
                                 "Cannot access file (" + ec.message() + ")");
        }
        return IoError::make(IoErrorKind::NotFound, path.string(), "File not found");
    }
    if (!fs::is_regular_file(status)) {
        return IoError::make(IoErrorKind::NotAFile, path.string(), "Not a regular file");
    }

    errno = 0;
    std::ifstream file(path, std::ios::in | std::ios::binary);
    if (!file) {
        if (errno == EACCES || errno == EPERM) {
            return IoError::make(IoErrorKind::PermissionDenied, path.string(),
                                 "Permission denied");
        }
        return IoError::make(IoErrorKind::ReadFailed, path.string(), "Cannot open file");
    }

    std::ostringstream ss;
    ss << file.rdbuf();
    // An empty file leaves failbit set on `ss`, so only the file's badbit counts.
    if (file.bad()) {
        return IoError::make(IoErrorKind::ReadFailed, path.string(), "Cannot read file");
    }
    std::string text = ss.str();

    if (auto bad = validate_utf8(text)) {
        return IoError::make(IoErrorKind::InvalidEncoding, path.string(),
                             "Invalid UTF-8 at byte " + std::to_string(*bad));
    }

    if (std::string_view(text).substr(0, UTF8_BOM.size()) == UTF8_BOM) {
        text.erase(0, UTF8_BOM.size());
    }

    return text;
}

auto parse_json_file(const std::filesystem::path& path, ParseOptions options)
    -> Result<JsonValue, JsonError> {
    auto text = read_json_text(path);
    if (is_err(text)) {
        return JsonError{std::move(unwrap_err(text))};
    }

    auto parsed = parse_json(unwrap(text), options);
    if (is_err(parsed)) {
        return JsonError{std::move(unwrap_err(parsed))};
    }
    return std::move(unwrap(parsed));
}

} // namespace strand::json
