/**
 * @file test_date.cpp
 * @brief Tests for ISO date parsing
 */

#include <gtest/gtest.h>
#include "patcher/Date.hpp"

using namespace patcher;

TEST(ParseDate, CalendarDate) {
    auto d = parse_date("1980-01-01");
    ASSERT_TRUE(d.has_value());
    EXPECT_EQ(d->year, 1980);
    EXPECT_EQ(d->month, 1);
    EXPECT_EQ(d->day, 1);
}

TEST(ParseDate, TimePartIgnored) {
    EXPECT_EQ(parse_date("2024-02-29T10:00:00Z"), (Date{2024, 2, 29}));
    EXPECT_EQ(parse_date("1999-12-31 23:59:59"), (Date{1999, 12, 31}));
}

TEST(ParseDate, TimeForms) {
    EXPECT_TRUE(parse_date("1979-05-27T07:32").has_value());
    EXPECT_TRUE(parse_date("1979-05-27t07:32:00.999999").has_value());
    EXPECT_TRUE(parse_date("1979-05-27T00:32:00-07:00").has_value());
    EXPECT_TRUE(parse_date("2016-12-31T23:59:60Z").has_value());
}

TEST(ParseDate, MalformedTimeRejected) {
    EXPECT_FALSE(parse_date("2020-01-01Tgarbage").has_value());
    EXPECT_FALSE(parse_date("2020-01-01T").has_value());
    EXPECT_FALSE(parse_date("2020-01-01 ").has_value());
    EXPECT_FALSE(parse_date("2020-01-01T25:00:00").has_value());
    EXPECT_FALSE(parse_date("2020-01-01T10:61").has_value());
    EXPECT_FALSE(parse_date("2020-01-01T10:00:00+24:00").has_value());
    EXPECT_FALSE(parse_date("2020-01-01T10:00:00Zjunk").has_value());
}

TEST(ParseDate, LeapYears) {
    EXPECT_TRUE(parse_date("2000-02-29").has_value());
    EXPECT_FALSE(parse_date("1900-02-29").has_value());
    EXPECT_FALSE(parse_date("2023-02-29").has_value());
}

TEST(ParseDate, Malformed) {
    EXPECT_FALSE(parse_date("").has_value());
    EXPECT_FALSE(parse_date("1980-1-1").has_value());
    EXPECT_FALSE(parse_date("01/01/1980").has_value());
    EXPECT_FALSE(parse_date("1980-13-01").has_value());
    EXPECT_FALSE(parse_date("1980-04-31").has_value());
    EXPECT_FALSE(parse_date("1980-01-00").has_value());
    EXPECT_FALSE(parse_date("1980-01-01x").has_value());
}

TEST(DateToString, ZeroPadded) {
    EXPECT_EQ(to_string(Date{987, 3, 4}), "0987-03-04");
    EXPECT_EQ(to_string(Date{2024, 12, 25}), "2024-12-25");
}
