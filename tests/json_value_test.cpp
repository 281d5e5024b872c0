//! # JSON Value Tests
//!
//! Construction, kind queries, accessors, container building, deep copy and
//! deep equality.

#include "strand/json/json_value.hpp"

#include <gtest/gtest.h>
#include <variant>

using namespace strand;
using namespace strand::json;

// ============================================================================
// Construction and Kind Queries
// ============================================================================

TEST(JsonValueTest, DefaultIsNull) {
    JsonValue v;
    EXPECT_TRUE(v.is_null());
    EXPECT_FALSE(v.is_bool());
    EXPECT_FALSE(v.is_number());
    EXPECT_FALSE(v.is_string());
    EXPECT_FALSE(v.is_array());
    EXPECT_FALSE(v.is_object());
    EXPECT_EQ(v.kind(), JsonKind::Null);
}

TEST(JsonValueTest, ScalarConstruction) {
    EXPECT_TRUE(JsonValue(nullptr).is_null());
    EXPECT_TRUE(JsonValue(true).as_bool());
    EXPECT_DOUBLE_EQ(JsonValue(2.5).as_number(), 2.5);
    EXPECT_EQ(JsonValue("text").as_string(), "text");
    EXPECT_EQ(JsonValue(std::string("owned")).as_string(), "owned");
    EXPECT_EQ(JsonValue(std::string_view("view")).as_string(), "view");
}

TEST(JsonValueTest, IntegersAreStoredAsNumbers) {
    JsonValue v(42);
    EXPECT_EQ(v.kind(), JsonKind::Number);
    EXPECT_DOUBLE_EQ(v.as_number(), 42.0);
    EXPECT_TRUE(v == JsonValue(42.0));
}

TEST(JsonValueTest, FactoryFunctions) {
    EXPECT_TRUE(json_null().is_null());
    EXPECT_FALSE(json_bool(false).as_bool());
    EXPECT_DOUBLE_EQ(json_number(-1.0).as_number(), -1.0);
    EXPECT_EQ(json_string("s").as_string(), "s");
    EXPECT_TRUE(json_array().is_array());
    EXPECT_TRUE(json_object().is_object());
    EXPECT_EQ(json_array().size(), 0u);
    EXPECT_EQ(json_object().size(), 0u);
}

TEST(JsonValueTest, KindNames) {
    EXPECT_STREQ(kind_name(JsonKind::Null), "null");
    EXPECT_STREQ(kind_name(JsonKind::Bool), "bool");
    EXPECT_STREQ(kind_name(JsonKind::Number), "number");
    EXPECT_STREQ(kind_name(JsonKind::String), "string");
    EXPECT_STREQ(kind_name(JsonKind::Array), "array");
    EXPECT_STREQ(kind_name(JsonKind::Object), "object");
}

// ============================================================================
// Accessors
// ============================================================================

TEST(JsonValueTest, WrongKindAccessThrows) {
    JsonValue v(1.0);
    EXPECT_THROW((void)v.as_bool(), std::bad_variant_access);
    EXPECT_THROW((void)v.as_string(), std::bad_variant_access);
    EXPECT_THROW((void)v.as_array(), std::bad_variant_access);
}

TEST(JsonValueTest, OptionalAccessors) {
    JsonValue num(3.0);
    JsonValue str("x");

    EXPECT_EQ(num.try_as_number(), 3.0);
    EXPECT_FALSE(num.try_as_bool().has_value());
    EXPECT_EQ(num.try_as_string(), nullptr);

    ASSERT_NE(str.try_as_string(), nullptr);
    EXPECT_EQ(*str.try_as_string(), "x");
    EXPECT_FALSE(str.try_as_number().has_value());
}

TEST(JsonValueTest, ObjectLookupOnNonObject) {
    JsonValue arr = json_array();
    EXPECT_EQ(arr.get("a"), nullptr);
    EXPECT_FALSE(arr.contains("a"));
    EXPECT_EQ(JsonValue(1).size(), 0u);
}

TEST(JsonValueTest, ArrayIndexOutOfRangeThrows) {
    JsonValue arr = json_array();
    arr.push(JsonValue(1));
    EXPECT_DOUBLE_EQ(arr[0].as_number(), 1.0);
    EXPECT_THROW((void)arr[1], std::out_of_range);
}

// ============================================================================
// Building
// ============================================================================

TEST(JsonValueTest, BuildNestedTree) {
    JsonValue user = json_object();
    user.set("name", JsonValue("Alice"));
    user.set("tags", json_array());
    user.get_mut("tags")->push(JsonValue("admin"));

    EXPECT_EQ(user.size(), 2u);
    EXPECT_EQ(user.get("name")->as_string(), "Alice");
    EXPECT_EQ((*user.get("tags"))[0].as_string(), "admin");
}

TEST(JsonValueTest, SetReplacesInPlace) {
    JsonValue obj = json_object();
    obj.set("a", JsonValue(1));
    obj.set("b", JsonValue(2));
    obj.set("a", JsonValue(3));

    ASSERT_EQ(obj.size(), 2u);
    auto it = obj.as_object().begin();
    EXPECT_EQ(it->key, "a");
    EXPECT_DOUBLE_EQ(it->value.as_number(), 3.0);
}

TEST(JsonValueTest, PushOnNonArrayThrows) {
    JsonValue obj = json_object();
    EXPECT_THROW(obj.push(JsonValue(1)), std::bad_variant_access);
    JsonValue arr = json_array();
    EXPECT_THROW(arr.set("k", JsonValue(1)), std::bad_variant_access);
}

TEST(JsonObjectTest, InsertFindErase) {
    JsonObject obj;
    EXPECT_TRUE(obj.empty());
    EXPECT_TRUE(obj.insert_or_assign("x", JsonValue(1)));
    EXPECT_TRUE(obj.insert_or_assign("y", JsonValue(2)));
    EXPECT_TRUE(obj.insert_or_assign("z", JsonValue(3)));
    EXPECT_FALSE(obj.insert_or_assign("y", JsonValue(20)));

    EXPECT_TRUE(obj.erase("x"));
    EXPECT_FALSE(obj.erase("missing"));
    ASSERT_EQ(obj.size(), 2u);

    // Index stays consistent after the shift.
    ASSERT_NE(obj.find("y"), nullptr);
    EXPECT_DOUBLE_EQ(obj.find("y")->as_number(), 20.0);
    ASSERT_NE(obj.find("z"), nullptr);
    EXPECT_DOUBLE_EQ(obj.find("z")->as_number(), 3.0);
    EXPECT_EQ(obj.begin()->key, "y");
}

// ============================================================================
// Copy, Move and Equality
// ============================================================================

TEST(JsonValueTest, CloneIsDeepAndIndependent) {
    JsonValue original = json_object();
    original.set("list", json_array());
    original.get_mut("list")->push(JsonValue(1));

    JsonValue copy = original.clone();
    EXPECT_TRUE(copy == original);

    copy.get_mut("list")->push(JsonValue(2));
    EXPECT_EQ(original.get("list")->size(), 1u);
    EXPECT_EQ(copy.get("list")->size(), 2u);
    EXPECT_TRUE(copy != original);
}

TEST(JsonValueTest, MoveLeavesSourceUsable) {
    JsonValue a("payload");
    JsonValue b(std::move(a));
    EXPECT_EQ(b.as_string(), "payload");

    a = JsonValue(5);
    EXPECT_DOUBLE_EQ(a.as_number(), 5.0);
}

TEST(JsonValueTest, EqualityAcrossKinds) {
    EXPECT_TRUE(JsonValue() == JsonValue(nullptr));
    EXPECT_FALSE(JsonValue(0) == JsonValue(false));
    EXPECT_FALSE(JsonValue("1") == JsonValue(1));
    EXPECT_FALSE(json_array() == json_object());
}

TEST(JsonValueTest, ArrayEqualityIsOrdered) {
    JsonValue a = json_array();
    a.push(JsonValue(1));
    a.push(JsonValue(2));
    JsonValue b = json_array();
    b.push(JsonValue(2));
    b.push(JsonValue(1));
    EXPECT_FALSE(a == b);
}

TEST(JsonValueTest, ObjectEqualityIgnoresOrder) {
    JsonValue a = json_object();
    a.set("x", JsonValue(1));
    a.set("y", JsonValue(2));
    JsonValue b = json_object();
    b.set("y", JsonValue(2));
    b.set("x", JsonValue(1));
    EXPECT_TRUE(a == b);

    b.set("x", JsonValue(9));
    EXPECT_FALSE(a == b);
}
