#include <limits>

#include <gtest/gtest.h>

#include <wamp/value.hpp>

using namespace wamp;

TEST(value_t, DefaultIsNull) {
    value_t value;
    EXPECT_TRUE(value.is_null());
    EXPECT_EQ("null", repr(value));
}

TEST(value_t, IntegralSignedness) {
    EXPECT_TRUE(value_t(-1).is_int());
    EXPECT_TRUE(value_t(42u).is_uint());
    EXPECT_TRUE(value_t(std::uint64_t(42)).is_uint());
    EXPECT_TRUE(value_t(true).is_bool());
    EXPECT_TRUE(value_t(1.5).is_double());
}

TEST(value_t, IntegersCompareByValue) {
    EXPECT_EQ(value_t(42), value_t(42u));
    EXPECT_EQ(value_t(42u), value_t(42));
    EXPECT_NE(value_t(-1), value_t(std::numeric_limits<std::uint64_t>::max()));
    EXPECT_EQ(value_t(array_t { 1, 2 }), value_t(array_t { 1u, 2u }));
}

TEST(value_t, DifferentAlternativesAreNotEqual) {
    EXPECT_NE(value_t("1"), value_t(1));
    EXPECT_NE(value_t(), value_t(false));
}

TEST(value_t, AccessorThrowsOnMismatch) {
    EXPECT_THROW(value_t(1).as_string(), boost::bad_get);
}

TEST(value_t, Repr) {
    EXPECT_EQ("\"a\\\"b\"", repr("a\"b"));
    EXPECT_EQ("[1, \"x\", null]", repr(array_t { 1, "x", value_t() }));
    EXPECT_EQ("{\"a\": true, \"b\": [2]}", repr(object_t { { "a", true }, { "b", array_t { 2 } } }));
}

TEST(value_t, ToStringKeepsTopLevelStringRaw) {
    EXPECT_EQ("message", to_string("message"));
    EXPECT_EQ("[\"message\"]", to_string(array_t { "message" }));
    EXPECT_EQ("42", to_string(42));
}

TEST(value_t, Join) {
    EXPECT_EQ("", join(array_t(), &repr));
    EXPECT_EQ("1, \"a\"", join(array_t { 1, "a" }, &repr));
    EXPECT_EQ("1, a", join(array_t { 1, "a" }, &to_string));
}
