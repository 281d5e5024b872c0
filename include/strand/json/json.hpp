//! # strand JSON Library
//!
//! Main public header: parsing from text or file, the value model, and
//! serialization back to text.
//!
//! ## Quick Start
//!
//! ```cpp
//! #include "strand/json/json.hpp"
//! using namespace strand::json;
//!
//! auto result = parse_json(R"({"name": "Alice", "age": 30})");
//! if (is_ok(result)) {
//!     auto& json = unwrap(result);
//!     std::cout << serialize(json, 2) << std::endl;
//! }
//! ```
//!
//! ## Modules
//!
//! | Header | Description |
//! |--------|-------------|
//! | `json_error.hpp` | `SyntaxError`, `IoError`, `JsonError` |
//! | `json_value.hpp` | `JsonValue`, `JsonArray`, `JsonObject` |
//! | `json_lexer.hpp` | Tokenizer and `tokenize()` |
//! | `json_parser.hpp` | `JsonParser`, `parse_json()`, `ParseOptions` |
//! | `json_serializer.hpp` | `serialize()`, `escape_json_string()` |
//! | `json_file.hpp` | `read_json_text()`, `parse_json_file()` |
//!
//! ## Error Handling
//!
//! Nothing here throws on malformed input. Parsing returns
//! `Result<JsonValue, SyntaxError>`; file parsing returns
//! `Result<JsonValue, JsonError>` where `JsonError` holds either kind.

#pragma once

#include "strand/json/json_error.hpp"
#include "strand/json/json_file.hpp"
#include "strand/json/json_lexer.hpp"
#include "strand/json/json_parser.hpp"
#include "strand/json/json_serializer.hpp"
#include "strand/json/json_value.hpp"
