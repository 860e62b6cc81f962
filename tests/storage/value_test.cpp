/**
 * @file value_test.cpp
 * @brief Unit tests for TupleValue
 */

#include <gtest/gtest.h>

#include <cmath>
#include <limits>
#include <string>
#include <variant>

#include "storage/value.hpp"

namespace prism {
namespace {

std::string key_of(const TupleValue& val) {
    std::string key;
    val.append_key(&key);
    return key;
}

// ─────────────────────────────────────────────────────────────────────────────
// Construction and Access
// ─────────────────────────────────────────────────────────────────────────────

TEST(TupleValueTest, NullValue) {
    TupleValue val;
    EXPECT_TRUE(val.is_null());
    EXPECT_FALSE(val.is_bool());
    EXPECT_FALSE(val.is_integer());
    EXPECT_FALSE(val.is_string());
    EXPECT_TRUE(TupleValue::null().is_null());
}

TEST(TupleValueTest, IntegerEdgeCases) {
    TupleValue max_val(std::numeric_limits<int32_t>::max());
    TupleValue min_val(std::numeric_limits<int32_t>::min());

    EXPECT_TRUE(max_val.is_integer());
    EXPECT_EQ(max_val.as_integer(), std::numeric_limits<int32_t>::max());
    EXPECT_EQ(min_val.as_integer(), std::numeric_limits<int32_t>::min());
}

TEST(TupleValueTest, StringFromCharPtr) {
    TupleValue val("Hello");
    EXPECT_TRUE(val.is_string());
    EXPECT_EQ(val.as_string(), "Hello");
}

TEST(TupleValueTest, WrongAccessorThrows) {
    TupleValue val(int32_t(3));
    EXPECT_THROW((void)val.as_string(), std::bad_variant_access);
}

TEST(TupleValueTest, MatchesType) {
    EXPECT_TRUE(TupleValue(int32_t(1)).matches_type(TypeId::INTEGER));
    EXPECT_FALSE(TupleValue(int64_t(1)).matches_type(TypeId::INTEGER));
    EXPECT_TRUE(TupleValue("x").matches_type(TypeId::VARCHAR));
    EXPECT_TRUE(TupleValue(2.5).matches_type(TypeId::DOUBLE));
    EXPECT_FALSE(TupleValue(2.5f).matches_type(TypeId::DOUBLE));
}

// ─────────────────────────────────────────────────────────────────────────────
// Formatting
// ─────────────────────────────────────────────────────────────────────────────

TEST(TupleValueTest, ToString) {
    EXPECT_EQ(TupleValue().to_string(), "NULL");
    EXPECT_EQ(TupleValue(true).to_string(), "true");
    EXPECT_EQ(TupleValue(static_cast<int8_t>(-5)).to_string(), "-5");
    EXPECT_EQ(TupleValue(static_cast<int64_t>(9000000000LL)).to_string(), "9000000000");
    EXPECT_EQ(TupleValue(0.1).to_string(), "0.1");
    EXPECT_EQ(TupleValue(0.1f).to_string(), "0.1");
    EXPECT_EQ(TupleValue("abc").to_string(), "abc");
}

TEST(TupleValueTest, DoubleTextRoundTrips) {
    const double values[] = {1.0 / 3.0, 1e300, -2.5e-308, 123456789.123456789};
    for (double v : values) {
        EXPECT_EQ(std::stod(TupleValue(v).to_string()), v);
    }
}

// ─────────────────────────────────────────────────────────────────────────────
// Key Encoding
// ─────────────────────────────────────────────────────────────────────────────

TEST(TupleValueTest, KeyEncodingLayout) {
    EXPECT_EQ(key_of(TupleValue()), "N|");
    EXPECT_EQ(key_of(TupleValue(int32_t(42))), "i2:42|");
    EXPECT_EQ(key_of(TupleValue("x")), "s1:x|");
    EXPECT_EQ(key_of(TupleValue("")), "s0:|");
    EXPECT_EQ(key_of(TupleValue("a|b")), "s3:a|b|");
}

TEST(TupleValueTest, KeyDistinguishesTypesAndNull) {
    EXPECT_NE(key_of(TupleValue(int32_t(1))), key_of(TupleValue(int64_t(1))));
    EXPECT_NE(key_of(TupleValue(int32_t(1))), key_of(TupleValue("1")));
    EXPECT_NE(key_of(TupleValue()), key_of(TupleValue("NULL")));
    EXPECT_NE(key_of(TupleValue(true)), key_of(TupleValue("true")));
}

TEST(TupleValueTest, KeyForFloatingPoint) {
    EXPECT_EQ(key_of(TupleValue(0.1 + 0.2)), key_of(TupleValue(0.1 + 0.2)));
    EXPECT_NE(key_of(TupleValue(0.1 + 0.2)), key_of(TupleValue(0.3)));
    EXPECT_NE(key_of(TupleValue(0.0)), key_of(TupleValue(-0.0)));

    const double nan = std::numeric_limits<double>::quiet_NaN();
    EXPECT_EQ(key_of(TupleValue(nan)), key_of(TupleValue(-nan)));
}

TEST(TupleValueTest, KeyAppends) {
    std::string key = "prefix";
    TupleValue(int16_t(7)).append_key(&key);
    EXPECT_EQ(key, "prefixh1:7|");
}

}  // namespace
}  // namespace prism
