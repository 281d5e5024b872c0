//! # JSON Value Types
//!
//! The in-memory representation of a JSON document shared by the parser
//! (output) and the serializer (input).
//!
//! ## Types
//!
//! | Type | Purpose |
//! |------|---------|
//! | `JsonValue` | Tagged union over the six JSON kinds |
//! | `JsonArray` | Ordered vector of `JsonValue` |
//! | `JsonObject` | Insertion-ordered map from string key to `JsonValue` |
//! | `JsonKind` | Discriminator returned by `JsonValue::kind()` |
//!
//! ## Number Handling
//!
//! Every JSON number is stored as a `double`. `42`, `42.0` and `4.2e1` all
//! produce the same value; there is no separate integer representation.
//!
//! ## Ownership
//!
//! Arrays and objects are boxed and exclusively owned by their parent, so a
//! tree cannot contain cycles. Copying is disabled; use `clone()` for a deep
//! copy.
//!
//! ## Example
//!
//! ```cpp
//! JsonValue user = json_object();
//! user.set("name", JsonValue("Alice"));
//! user.set("tags", json_array());
//!
//! if (const auto* name = user.get("name")) {
//!     std::cout << name->as_string() << std::endl;
//! }
//! ```

#pragma once

#include "strand/common.hpp"

#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <variant>
#include <vector>

namespace strand::json {

// ============================================================================
// Forward Declarations and Type Aliases
// ============================================================================

struct JsonValue;
class JsonObject;

/// A JSON array containing ordered values.
using JsonArray = std::vector<JsonValue>;

/// The six JSON kinds, in the order of `JsonValue::ValueVariant`.
enum class JsonKind : uint8_t { Null, Bool, Number, String, Array, Object };

/// Returns the lowercase name of a kind (`"null"`, `"bool"`, `"number"`, ...).
[[nodiscard]] auto kind_name(JsonKind kind) -> const char*;

// ============================================================================
// JsonValue
// ============================================================================

/// A JSON value: exactly one of null, boolean, number, string, array, object.
///
/// | JSON Type | C++ Storage | Query | Accessor |
/// |-----------|-------------|-------|----------|
/// | `null` | `std::monostate` | `is_null()` | - |
/// | `true/false` | `bool` | `is_bool()` | `as_bool()` |
/// | number | `double` | `is_number()` | `as_number()` |
/// | string | `std::string` (UTF-8) | `is_string()` | `as_string()` |
/// | array | `Box<JsonArray>` | `is_array()` | `as_array()`, `operator[]` |
/// | object | `Box<JsonObject>` | `is_object()` | `as_object()`, `get()` |
struct JsonValue {
    using Null = std::monostate;

    using ValueVariant = std::variant<Null,             // null
                                      bool,             // boolean
                                      double,           // number
                                      std::string,      // string
                                      Box<JsonArray>,   // array (boxed)
                                      Box<JsonObject>>; // object (boxed)

    ValueVariant data;

    // ========================================================================
    // Constructors
    // ========================================================================

    /// Creates `null`.
    JsonValue() : data(Null{}) {}

    explicit JsonValue(std::nullptr_t) : data(Null{}) {}

    explicit JsonValue(bool value) : data(value) {}

    explicit JsonValue(double value) : data(value) {}

    /// Integer literals are stored as `double` like every other number.
    explicit JsonValue(int value) : data(static_cast<double>(value)) {}

    explicit JsonValue(const char* value) : data(std::string(value)) {}

    explicit JsonValue(std::string value) : data(std::move(value)) {}

    explicit JsonValue(std::string_view value) : data(std::string(value)) {}

    explicit JsonValue(JsonArray value);

    explicit JsonValue(JsonObject value);

    JsonValue(const JsonValue&) = delete;
    auto operator=(const JsonValue&) -> JsonValue& = delete;
    JsonValue(JsonValue&&) noexcept;
    auto operator=(JsonValue&&) noexcept -> JsonValue&;
    ~JsonValue();

    // ========================================================================
    // Type Queries
    // ========================================================================

    [[nodiscard]] auto kind() const -> JsonKind {
        return static_cast<JsonKind>(data.index());
    }

    [[nodiscard]] auto is_null() const -> bool {
        return std::holds_alternative<Null>(data);
    }

    [[nodiscard]] auto is_bool() const -> bool {
        return std::holds_alternative<bool>(data);
    }

    [[nodiscard]] auto is_number() const -> bool {
        return std::holds_alternative<double>(data);
    }

    [[nodiscard]] auto is_string() const -> bool {
        return std::holds_alternative<std::string>(data);
    }

    [[nodiscard]] auto is_array() const -> bool {
        return std::holds_alternative<Box<JsonArray>>(data);
    }

    [[nodiscard]] auto is_object() const -> bool {
        return std::holds_alternative<Box<JsonObject>>(data);
    }

    // ========================================================================
    // Checked Accessors
    // ========================================================================

    /// Gets the boolean value.
    ///
    /// # Panics
    ///
    /// Throws `std::bad_variant_access` if this is not a boolean.
    [[nodiscard]] auto as_bool() const -> bool {
        return std::get<bool>(data);
    }

    /// Gets the number value.
    ///
    /// # Panics
    ///
    /// Throws `std::bad_variant_access` if this is not a number.
    [[nodiscard]] auto as_number() const -> double {
        return std::get<double>(data);
    }

    /// Gets the string value.
    ///
    /// # Panics
    ///
    /// Throws `std::bad_variant_access` if this is not a string.
    [[nodiscard]] auto as_string() const -> const std::string& {
        return std::get<std::string>(data);
    }

    /// Gets the array value.
    ///
    /// # Panics
    ///
    /// Throws `std::bad_variant_access` if this is not an array.
    [[nodiscard]] auto as_array() const -> const JsonArray& {
        return *std::get<Box<JsonArray>>(data);
    }

    /// Gets the object value.
    ///
    /// # Panics
    ///
    /// Throws `std::bad_variant_access` if this is not an object.
    [[nodiscard]] auto as_object() const -> const JsonObject& {
        return *std::get<Box<JsonObject>>(data);
    }

    [[nodiscard]] auto as_array_mut() -> JsonArray& {
        return *std::get<Box<JsonArray>>(data);
    }

    [[nodiscard]] auto as_object_mut() -> JsonObject& {
        return *std::get<Box<JsonObject>>(data);
    }

    // ========================================================================
    // Optional Accessors
    // ========================================================================

    /// Returns the boolean, or `std::nullopt` for any other kind.
    [[nodiscard]] auto try_as_bool() const -> std::optional<bool> {
        if (const auto* b = std::get_if<bool>(&data)) {
            return *b;
        }
        return std::nullopt;
    }

    /// Returns the number, or `std::nullopt` for any other kind.
    [[nodiscard]] auto try_as_number() const -> std::optional<double> {
        if (const auto* n = std::get_if<double>(&data)) {
            return *n;
        }
        return std::nullopt;
    }

    /// Returns a pointer to the string, or `nullptr` for any other kind.
    [[nodiscard]] auto try_as_string() const -> const std::string* {
        return std::get_if<std::string>(&data);
    }

    // ========================================================================
    // Container Access
    // ========================================================================

    /// Looks up an object member.
    ///
    /// Returns `nullptr` if this is not an object or the key is absent.
    [[nodiscard]] auto get(const std::string& key) const -> const JsonValue*;

    [[nodiscard]] auto get_mut(const std::string& key) -> JsonValue*;

    /// Returns `false` if this is not an object.
    [[nodiscard]] auto contains(const std::string& key) const -> bool;

    /// Gets an array element.
    ///
    /// # Panics
    ///
    /// Throws if this is not an array or `index` is out of bounds.
    [[nodiscard]] auto operator[](size_t index) const -> const JsonValue& {
        return as_array().at(index);
    }

    /// Number of elements or members; `0` for scalars.
    [[nodiscard]] auto size() const -> size_t;

    // ========================================================================
    // Building
    // ========================================================================

    /// Appends to an array.
    ///
    /// # Panics
    ///
    /// Throws `std::bad_variant_access` if this is not an array.
    void push(JsonValue value);

    /// Inserts or replaces an object member. A replaced member keeps its position.
    ///
    /// # Panics
    ///
    /// Throws `std::bad_variant_access` if this is not an object.
    void set(std::string key, JsonValue value);

    /// Creates a deep copy.
    [[nodiscard]] auto clone() const -> JsonValue;

    // ========================================================================
    // Serialization (json_serializer.cpp)
    // ========================================================================

    /// Compact text with no insignificant whitespace.
    [[nodiscard]] auto to_string() const -> std::string;

    /// Pretty-printed text with `indent` spaces per level. `0` yields compact text.
    [[nodiscard]] auto to_string_pretty(size_t indent = 2) const -> std::string;

    auto write_to(std::ostream& os) const -> std::ostream&;

    auto write_to_pretty(std::ostream& os, size_t indent = 2) const -> std::ostream&;

    // ========================================================================
    // Comparison
    // ========================================================================

    /// Deep equality. Values of different kinds are never equal; object
    /// members are compared by key regardless of order.
    [[nodiscard]] auto operator==(const JsonValue& other) const -> bool;

    [[nodiscard]] auto operator!=(const JsonValue& other) const -> bool {
        return !(*this == other);
    }
};

// ============================================================================
// JsonObject
// ============================================================================

/// One `key: value` pair of an object.
struct JsonMember {
    std::string key;
    JsonValue value;
};

/// An object that remembers the order its keys were first inserted.
///
/// Iteration yields `JsonMember`s in insertion order, which is also the order
/// the serializer writes them. Inserting an existing key replaces the value
/// in place, so with duplicate keys in a document the last value wins and the
/// key keeps its first position.
class JsonObject {
public:
    using iterator = std::vector<JsonMember>::iterator;
    using const_iterator = std::vector<JsonMember>::const_iterator;

    JsonObject() = default;

    /// Inserts `key` or replaces its value.
    ///
    /// # Returns
    ///
    /// `true` if the key was new, `false` if an existing value was replaced.
    auto insert_or_assign(std::string key, JsonValue value) -> bool;

    /// Returns the member value, or `nullptr` if the key is absent.
    [[nodiscard]] auto find(const std::string& key) const -> const JsonValue*;

    [[nodiscard]] auto find_mut(const std::string& key) -> JsonValue*;

    [[nodiscard]] auto contains(const std::string& key) const -> bool {
        return index_.find(key) != index_.end();
    }

    /// Removes a member, preserving the order of the rest.
    auto erase(const std::string& key) -> bool;

    [[nodiscard]] auto size() const -> size_t {
        return members_.size();
    }

    [[nodiscard]] auto empty() const -> bool {
        return members_.empty();
    }

    [[nodiscard]] auto begin() -> iterator {
        return members_.begin();
    }
    [[nodiscard]] auto end() -> iterator {
        return members_.end();
    }
    [[nodiscard]] auto begin() const -> const_iterator {
        return members_.begin();
    }
    [[nodiscard]] auto end() const -> const_iterator {
        return members_.end();
    }

    /// Order-independent member comparison.
    [[nodiscard]] auto operator==(const JsonObject& other) const -> bool;

private:
    std::vector<JsonMember> members_;
    std::unordered_map<std::string, size_t> index_;
};

// ============================================================================
// Out-of-line special members (need a complete JsonObject)
// ============================================================================

inline JsonValue::JsonValue(JsonArray value) : data(make_box<JsonArray>(std::move(value))) {}

inline JsonValue::JsonValue(JsonObject value) : data(make_box<JsonObject>(std::move(value))) {}

inline JsonValue::JsonValue(JsonValue&&) noexcept = default;

inline auto JsonValue::operator=(JsonValue&&) noexcept -> JsonValue& = default;

inline JsonValue::~JsonValue() = default;

// ============================================================================
// Factory Functions
// ============================================================================

inline auto json_null() -> JsonValue {
    return JsonValue();
}

inline auto json_bool(bool value) -> JsonValue {
    return JsonValue(value);
}

inline auto json_number(double value) -> JsonValue {
    return JsonValue(value);
}

inline auto json_string(std::string value) -> JsonValue {
    return JsonValue(std::move(value));
}

/// Creates an empty array.
inline auto json_array() -> JsonValue {
    return JsonValue(JsonArray{});
}

/// Creates an empty object.
inline auto json_object() -> JsonValue {
    return JsonValue(JsonObject{});
}

} // namespace strand::json
