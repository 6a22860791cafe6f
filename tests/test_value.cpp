/// @file test_value.cpp
/// @brief Unit tests for ordmap::Value: constructors, types, access, mutation.

#include <ordmap/ordmap.hpp>

#include <gtest/gtest.h>

#include <cstdint>
#include <limits>
#include <string>
#include <utility>

using namespace ordmap;

// ═══════════════════════════════════════════════════════════════════════════════
// Constructors and type checking
// ═══════════════════════════════════════════════════════════════════════════════

TEST(Value, DefaultConstructorIsNull) {
    Value v;
    EXPECT_TRUE(v.is_null());
    EXPECT_EQ(v.type(), Type::Null);
    EXPECT_TRUE(Value(nullptr).is_null());
}

TEST(Value, BoolConstructor) {
    Value t(true);
    EXPECT_TRUE(t.is_bool());
    EXPECT_TRUE(t.as_bool());
    EXPECT_EQ(t.type(), Type::Bool);
}

TEST(Value, IntegerConstructors) {
    EXPECT_EQ(Value(42).type(), Type::Integer);
    EXPECT_EQ(Value(42L).type(), Type::Integer);
    EXPECT_EQ(Value(42LL).type(), Type::Integer);
    EXPECT_EQ(Value(42u).type(), Type::Integer);
    EXPECT_EQ(Value(42UL).type(), Type::UInteger);
    EXPECT_EQ(Value(42ULL).type(), Type::UInteger);
    EXPECT_EQ(Value(-7).as_integer(), -7);
}

TEST(Value, FloatConstructor) {
    Value v(3.14);
    EXPECT_TRUE(v.is_float());
    EXPECT_TRUE(v.is_number());
    EXPECT_DOUBLE_EQ(v.as_float(), 3.14);
}

TEST(Value, StringConstructors) {
    std::string s = "owned";
    EXPECT_EQ(Value("literal").as_string(), "literal");
    EXPECT_EQ(Value(std::string_view("view")).as_string(), "view");
    EXPECT_EQ(Value(s).as_string(), "owned");
    EXPECT_EQ(Value(std::move(s)).as_string_view(), "owned");
}

TEST(Value, NullCharPointerIsNull) {
    const char* p = nullptr;
    EXPECT_TRUE(Value(p).is_null());
}

TEST(Value, StaticFactories) {
    EXPECT_TRUE(Value::array().is_array());
    EXPECT_TRUE(Value::array().empty());
    EXPECT_TRUE(Value::object().is_object());
    EXPECT_TRUE(Value::object().empty());
}

TEST(Value, TypeNames) {
    EXPECT_STREQ(type_name(Type::Null), "null");
    EXPECT_STREQ(type_name(Type::UInteger), "uinteger");
    EXPECT_STREQ(type_name(Type::Object), "object");
}

// ═══════════════════════════════════════════════════════════════════════════════
// Value access: type checking and exceptions
// ═══════════════════════════════════════════════════════════════════════════════

TEST(Value, TypeErrorOnWrongAccess) {
    Value v(42);
    EXPECT_THROW((void)v.as_string(), TypeError);
    EXPECT_THROW((void)v.as_bool(), TypeError);
    EXPECT_THROW((void)v.as_array(), TypeError);
    EXPECT_THROW((void)v.as_object(), TypeError);
    EXPECT_THROW((void)Value("x").as_integer(), TypeError);
}

TEST(Value, TypeErrorCarriesCodeAndMessage) {
    try {
        (void)Value("x").as_integer();
        FAIL() << "expected TypeError";
    } catch (const TypeError& e) {
        EXPECT_EQ(e.code(), errc::type_mismatch);
        EXPECT_NE(std::string(e.what()).find("expected integer, got string"), std::string::npos);
    }
}

TEST(Value, AsFloatConvertsIntegers) {
    EXPECT_DOUBLE_EQ(Value(10).as_float(), 10.0);
    EXPECT_DOUBLE_EQ(Value(10UL).as_float(), 10.0);
}

TEST(Value, SignedUnsignedCrossAccess) {
    EXPECT_EQ(Value(5UL).as_integer(), 5);
    EXPECT_EQ(Value(5).as_uinteger(), 5u);

    try {
        (void)Value(std::numeric_limits<uint64_t>::max()).as_integer();
        FAIL() << "expected TypeError";
    } catch (const TypeError& e) {
        EXPECT_EQ(e.code(), errc::integer_overflow);
    }
    try {
        (void)Value(-1).as_uinteger();
        FAIL() << "expected TypeError";
    } catch (const TypeError& e) {
        EXPECT_EQ(e.code(), errc::integer_overflow);
    }
}

// ═══════════════════════════════════════════════════════════════════════════════
// Access by index and key
// ═══════════════════════════════════════════════════════════════════════════════

TEST(Value, ArrayIndexAccess) {
    Value v(Array{Value(1), Value(2), Value(3)});
    EXPECT_EQ(v[0].as_integer(), 1);
    EXPECT_EQ(v[size_t{2}].as_integer(), 3);
    EXPECT_THROW((void)v[3], OutOfRangeError);
}

TEST(Value, ObjectInsertAppendsThenReplaces) {
    Value v = Value::object();
    v.as_object().insert("Key", Value("b"));
    v.as_object().insert("Value", Value(1));
    v.as_object().insert("Key", Value("a"));
    EXPECT_EQ(v.size(), 2u);
    EXPECT_EQ(v.as_object().begin()->first, "Key");
    EXPECT_TRUE(v.contains("Key"));
    EXPECT_EQ(v["Key"].as_string(), "a");
}

TEST(Value, ConstObjectThrowsOnMissingKey) {
    const Value v(Object{{"Key", Value(1)}});
    EXPECT_EQ(v["Key"].as_integer(), 1);
    try {
        (void)v["Value"];
        FAIL() << "expected OutOfRangeError";
    } catch (const OutOfRangeError& e) {
        EXPECT_EQ(e.code(), errc::key_not_found);
    }
}

TEST(Value, FindReturnsNullForMissingOrNonObject) {
    Value v(Object{{"Key", Value("k")}});
    ASSERT_NE(v.find("Key"), nullptr);
    EXPECT_EQ(v.find("Key")->as_string(), "k");
    EXPECT_EQ(v.find("Value"), nullptr);
    EXPECT_EQ(Value(1).find("Key"), nullptr);
    EXPECT_FALSE(Value(1).contains("Key"));
}

// ═══════════════════════════════════════════════════════════════════════════════
// Object
// ═══════════════════════════════════════════════════════════════════════════════

TEST(Object, InsertReplacesInPlace) {
    Object obj;
    obj.insert("Key", Value(1));
    obj.insert("Value", Value(2));
    obj.insert("Key", Value(3));
    ASSERT_EQ(obj.size(), 2u);
    EXPECT_EQ(obj.begin()->first, "Key");
    EXPECT_EQ(obj.at("Key").as_integer(), 3);
}

TEST(Object, Erase) {
    Object obj{{"a", Value(1)}, {"b", Value(2)}};
    EXPECT_TRUE(obj.erase("a"));
    EXPECT_FALSE(obj.erase("a"));
    EXPECT_EQ(obj.size(), 1u);
    obj.clear();
    EXPECT_TRUE(obj.empty());
}

TEST(Object, EqualityIgnoresFieldOrder) {
    Object a{{"Key", Value("k")}, {"Value", Value(1)}};
    Object b{{"Value", Value(1)}, {"Key", Value("k")}};
    EXPECT_EQ(a, b);
    b.insert("Value", Value(2));
    EXPECT_NE(a, b);
}

// ═══════════════════════════════════════════════════════════════════════════════
// Mutation
// ═══════════════════════════════════════════════════════════════════════════════

TEST(Value, ArrayPushBack) {
    Value v = Value::array();
    v.push_back(Value(1));
    Value s("two");
    v.push_back(s);
    EXPECT_EQ(v.size(), 2u);
    EXPECT_EQ(v[1].as_string(), "two");
    EXPECT_THROW(Value(1).push_back(Value(2)), TypeError);
}

// ═══════════════════════════════════════════════════════════════════════════════
// Copy and move semantics
// ═══════════════════════════════════════════════════════════════════════════════

TEST(Value, CopyIsDeep) {
    Value a(Object{{"list", Value(Array{Value(1)})}});
    Value b = a;
    b.as_object().find("list")->push_back(Value(2));
    EXPECT_EQ(a["list"].size(), 1u);
    EXPECT_EQ(b["list"].size(), 2u);
}

TEST(Value, MoveLeavesNull) {
    Value a("text");
    Value b = std::move(a);
    EXPECT_TRUE(a.is_null());  // NOLINT(bugprone-use-after-move)
    EXPECT_EQ(b.as_string(), "text");

    Value c(Array{Value(1)});
    c = std::move(b);
    EXPECT_EQ(c.as_string(), "text");
}

TEST(Value, SelfAssignment) {
    Value a(Array{Value(1), Value(2)});
    Value& ref = a;
    a = ref;
    EXPECT_EQ(a.size(), 2u);
}

TEST(Value, Swap) {
    Value a(1);
    Value b("s");
    a.swap(b);
    EXPECT_TRUE(a.is_string());
    EXPECT_TRUE(b.is_integer());
}

// ═══════════════════════════════════════════════════════════════════════════════
// Comparison
// ═══════════════════════════════════════════════════════════════════════════════

TEST(Value, EqualityScalars) {
    EXPECT_EQ(Value(), Value(nullptr));
    EXPECT_EQ(Value(true), Value(true));
    EXPECT_NE(Value(true), Value(false));
    EXPECT_EQ(Value("a"), Value(std::string("a")));
    EXPECT_NE(Value(1), Value("1"));
}

TEST(Value, EqualityNumbersAcrossKinds) {
    EXPECT_EQ(Value(1), Value(1UL));
    EXPECT_EQ(Value(1), Value(1.0));
    EXPECT_NE(Value(-1), Value(std::numeric_limits<uint64_t>::max()));
}

TEST(Value, EqualityContainers) {
    EXPECT_EQ(Value(Array{Value(1), Value(2)}), Value(Array{Value(1), Value(2)}));
    EXPECT_NE(Value(Array{Value(1), Value(2)}), Value(Array{Value(2), Value(1)}));
    EXPECT_EQ(Value(Object{{"a", Value(1)}}), Value(Object{{"a", Value(1)}}));
}

// ═══════════════════════════════════════════════════════════════════════════════
// Size and emptiness
// ═══════════════════════════════════════════════════════════════════════════════

TEST(Value, SizeAndEmpty) {
    EXPECT_TRUE(Value().empty());
    EXPECT_EQ(Value().size(), 0u);
    EXPECT_FALSE(Value(0).empty());
    EXPECT_EQ(Value(Array{Value(1)}).size(), 1u);
    EXPECT_EQ(Value(Object{{"a", Value(1)}, {"b", Value(2)}}).size(), 2u);
}
