// =============================================================================
// Scalar Coercion Tests
// =============================================================================

#include <gtest/gtest.h>
#include "statcube/scalar.hpp"

#include <boost/json.hpp>

using namespace statcube;

TEST(ScalarTest, ParseIntegerAcceptsSignsAndWhitespace) {
    EXPECT_EQ(parse_integer("42"), 42);
    EXPECT_EQ(parse_integer(" -7 "), -7);
    EXPECT_EQ(parse_integer("+3"), 3);
    EXPECT_EQ(parse_integer("007"), 7);
}

TEST(ScalarTest, ParseIntegerRejectsNonIntegers) {
    EXPECT_FALSE(parse_integer("").has_value());
    EXPECT_FALSE(parse_integer("   ").has_value());
    EXPECT_FALSE(parse_integer("4.5").has_value());
    EXPECT_FALSE(parse_integer("CA").has_value());
    EXPECT_FALSE(parse_integer("12abc").has_value());
    EXPECT_FALSE(parse_integer("+-1").has_value());
    EXPECT_FALSE(parse_integer("99999999999999999999").has_value());
}

TEST(ScalarTest, CoerceToIntParsesIntegers) {
    boost::json::value v = coerce_to_int("2019");
    ASSERT_TRUE(v.is_int64());
    EXPECT_EQ(v.get_int64(), 2019);
}

TEST(ScalarTest, CoerceToIntLeavesIdentifiers) {
    boost::json::value v = coerce_to_int("Y15-24");
    ASSERT_TRUE(v.is_string());
    EXPECT_EQ(v.get_string(), "Y15-24");
}

TEST(ScalarTest, CoerceToIntNormalizesJsonValues) {
    EXPECT_EQ(coerce_to_int(boost::json::value(3.0)), boost::json::value(3));
    EXPECT_EQ(coerce_to_int(boost::json::value("8")), boost::json::value(8));
    EXPECT_TRUE(coerce_to_int(boost::json::value(2.5)).is_double());
    EXPECT_TRUE(coerce_to_int(boost::json::value(nullptr)).is_null());
}

TEST(ScalarTest, CoerceToStrCanonicalForms) {
    EXPECT_EQ(coerce_to_str(boost::json::value(7)), "7");
    EXPECT_EQ(coerce_to_str(boost::json::value(-12)), "-12");
    EXPECT_EQ(coerce_to_str(boost::json::value(2.0)), "2");
    EXPECT_EQ(coerce_to_str(boost::json::value(2.5)), "2.5");
    EXPECT_EQ(coerce_to_str(boost::json::value(0.1)), "0.1");
    EXPECT_EQ(coerce_to_str(boost::json::value(std::uint64_t{18446744073709551615ULL})),
              "18446744073709551615");
    EXPECT_EQ(coerce_to_str(boost::json::value(true)), "true");
    EXPECT_EQ(coerce_to_str(boost::json::value(nullptr)), "null");
}

TEST(ScalarTest, CoerceToStrKeepsStringsVerbatim) {
    EXPECT_EQ(coerce_to_str(boost::json::value("2019")), "2019");
    EXPECT_EQ(coerce_to_str(boost::json::value("007")), "007");
    EXPECT_EQ(coerce_to_str(boost::json::value("United States")), "United States");
}

// Numbers and numeric strings for the same category must agree
TEST(ScalarTest, NumericIdsAgreeAcrossRepresentations) {
    EXPECT_EQ(coerce_to_str(boost::json::value(2020)), coerce_to_str(boost::json::value("2020")));
    EXPECT_EQ(coerce_to_str(boost::json::value(2020.0)), coerce_to_str(boost::json::value(2020)));
}
