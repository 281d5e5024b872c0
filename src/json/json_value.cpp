//! # JSON Value Implementation
//!
//! Container access, deep copy and deep equality for `JsonValue`, plus the
//! insertion-ordered `JsonObject`. Serialization lives in `json_serializer.cpp`.
//!
//! ## Equality Semantics
//!
//! | Type | Comparison Rule |
//! |------|-----------------|
//! | `null` | All nulls are equal |
//! | `bool` | Standard boolean comparison |
//! | `number` | `double` comparison |
//! | `string` | Byte-by-byte comparison |
//! | `array` | Element-by-element in order |
//! | `object` | Same key set, equal values per key (order independent) |

#include "strand/json/json_value.hpp"

namespace strand::json {

auto kind_name(JsonKind kind) -> const char* {
    switch (kind) {
    case JsonKind::Null:
        return "null";
    case JsonKind::Bool:
        return "bool";
    case JsonKind::Number:
        return "number";
    case JsonKind::String:
        return "string";
    case JsonKind::Array:
        return "array";
    case JsonKind::Object:
        return "object";
    }
    return "unknown";
}

// ============================================================================
// JsonObject
// ============================================================================

auto JsonObject::insert_or_assign(std::string key, JsonValue value) -> bool {
    auto it = index_.find(key);
    if (it != index_.end()) {
        members_[it->second].value = std::move(value);
        return false;
    }
    index_.emplace(key, members_.size());
    members_.push_back(JsonMember{std::move(key), std::move(value)});
    return true;
}

auto JsonObject::find(const std::string& key) const -> const JsonValue* {
    auto it = index_.find(key);
    if (it == index_.end()) {
        return nullptr;
    }
    return &members_[it->second].value;
}

auto JsonObject::find_mut(const std::string& key) -> JsonValue* {
    auto it = index_.find(key);
    if (it == index_.end()) {
        return nullptr;
    }
    return &members_[it->second].value;
}

auto JsonObject::erase(const std::string& key) -> bool {
    auto it = index_.find(key);
    if (it == index_.end()) {
        return false;
    }
    size_t pos = it->second;
    index_.erase(it);
    members_.erase(members_.begin() + static_cast<std::ptrdiff_t>(pos));
    // Every member after the removed one moved down by one slot.
    for (size_t i = pos; i < members_.size(); ++i) {
        index_[members_[i].key] = i;
    }
    return true;
}

auto JsonObject::operator==(const JsonObject& other) const -> bool {
    if (members_.size() != other.members_.size()) {
        return false;
    }
    for (const auto& member : members_) {
        const JsonValue* theirs = other.find(member.key);
        if (theirs == nullptr || *theirs != member.value) {
            return false;
        }
    }
    return true;
}

// ============================================================================
// JsonValue container access
// ============================================================================

auto JsonValue::get(const std::string& key) const -> const JsonValue* {
    if (const auto* obj = std::get_if<Box<JsonObject>>(&data)) {
        return (*obj)->find(key);
    }
    return nullptr;
}

auto JsonValue::get_mut(const std::string& key) -> JsonValue* {
    if (auto* obj = std::get_if<Box<JsonObject>>(&data)) {
        return (*obj)->find_mut(key);
    }
    return nullptr;
}

auto JsonValue::contains(const std::string& key) const -> bool {
    if (const auto* obj = std::get_if<Box<JsonObject>>(&data)) {
        return (*obj)->contains(key);
    }
    return false;
}

auto JsonValue::size() const -> size_t {
    if (const auto* arr = std::get_if<Box<JsonArray>>(&data)) {
        return (*arr)->size();
    }
    if (const auto* obj = std::get_if<Box<JsonObject>>(&data)) {
        return (*obj)->size();
    }
    return 0;
}

void JsonValue::push(JsonValue value) {
    as_array_mut().push_back(std::move(value));
}

void JsonValue::set(std::string key, JsonValue value) {
    as_object_mut().insert_or_assign(std::move(key), std::move(value));
}

auto JsonValue::clone() const -> JsonValue {
    switch (kind()) {
    case JsonKind::Null:
        return JsonValue();
    case JsonKind::Bool:
        return JsonValue(as_bool());
    case JsonKind::Number:
        return JsonValue(as_number());
    case JsonKind::String:
        return JsonValue(as_string());
    case JsonKind::Array: {
        JsonArray arr;
        arr.reserve(as_array().size());
        for (const auto& elem : as_array()) {
            arr.push_back(elem.clone());
        }
        return JsonValue(std::move(arr));
    }
    case JsonKind::Object: {
        JsonObject obj;
        for (const auto& member : as_object()) {
            obj.insert_or_assign(member.key, member.value.clone());
        }
        return JsonValue(std::move(obj));
    }
    }
    return JsonValue();
}

auto JsonValue::operator==(const JsonValue& other) const -> bool {
    if (data.index() != other.data.index()) {
        return false;
    }

    switch (kind()) {
    case JsonKind::Null:
        return true;
    case JsonKind::Bool:
        return as_bool() == other.as_bool();
    case JsonKind::Number:
        return as_number() == other.as_number();
    case JsonKind::String:
        return as_string() == other.as_string();
    case JsonKind::Array: {
        const auto& lhs = as_array();
        const auto& rhs = other.as_array();
        if (lhs.size() != rhs.size()) {
            return false;
        }
        for (size_t i = 0; i < lhs.size(); ++i) {
            if (lhs[i] != rhs[i]) {
                return false;
            }
        }
        return true;
    }
    case JsonKind::Object:
        return as_object() == other.as_object();
    }
    return false;
}

} // namespace strand::json
