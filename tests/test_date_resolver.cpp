#include <gtest/gtest.h>
#include "aamva/date_resolver.h"

using namespace aamva::normalize;

// =============================================================================
// Layout resolution
// =============================================================================

TEST(DateResolverTest, MonthFirst) {
    EXPECT_EQ(DateResolver::resolve("12251995").value_or(""), "1995-12-25");
    EXPECT_EQ(DateResolver::resolve("01151990").value_or(""), "1990-01-15");
}

TEST(DateResolverTest, FallsBackToCalendarOrder) {
    // 19 is not a month, so MMDDCCYY is rejected
    EXPECT_EQ(DateResolver::resolve("19950101").value_or(""), "1995-01-01");
    EXPECT_EQ(DateResolver::resolve("20301231").value_or(""), "2030-12-31");
}

TEST(DateResolverTest, MonthFirstWinsWhenBothValid) {
    DateLayout layout = DateLayout::CCYYMMDD;
    CalendarDate date;

    ASSERT_TRUE(DateResolver::resolveDate("11111111", date, &layout));
    EXPECT_EQ(layout, DateLayout::MMDDCCYY);
    EXPECT_EQ(date.year, 1111);
    EXPECT_EQ(date.month, 11);
    EXPECT_EQ(date.day, 11);
}

TEST(DateResolverTest, ReportsLayout) {
    DateLayout layout = DateLayout::MMDDCCYY;
    CalendarDate date;

    ASSERT_TRUE(DateResolver::resolveDate("19950101", date, &layout));
    EXPECT_EQ(layout, DateLayout::CCYYMMDD);
}

TEST(DateResolverTest, LeapDays) {
    EXPECT_EQ(DateResolver::resolve("02291992").value_or(""), "1992-02-29");
    EXPECT_EQ(DateResolver::resolve("20000229").value_or(""), "2000-02-29");

    // 1990 and 1900 are not leap years; neither layout fits
    EXPECT_FALSE(DateResolver::resolve("02291990").has_value());
    EXPECT_FALSE(DateResolver::resolve("19000229").has_value());
}

TEST(DateResolverTest, DayOutOfRangeForMonth) {
    EXPECT_FALSE(DateResolver::resolve("02302000").has_value());
    EXPECT_FALSE(DateResolver::resolve("04311990").has_value());
}

TEST(DateResolverTest, NeitherLayoutValid) {
    EXPECT_FALSE(DateResolver::resolve("13011990").has_value());
    EXPECT_FALSE(DateResolver::resolve("00001990").has_value());
    EXPECT_FALSE(DateResolver::resolve("99999999").has_value());
}

TEST(DateResolverTest, IgnoresNonDigits) {
    EXPECT_EQ(DateResolver::resolve("01/15/1990").value_or(""), "1990-01-15");
    EXPECT_EQ(DateResolver::resolve(" 01151990 ").value_or(""), "1990-01-15");
    EXPECT_EQ(DateResolver::resolve("1995-01-01").value_or(""), "1995-01-01");
}

TEST(DateResolverTest, WrongDigitCount) {
    EXPECT_FALSE(DateResolver::resolve("").has_value());
    EXPECT_FALSE(DateResolver::resolve("0115199").has_value());
    EXPECT_FALSE(DateResolver::resolve("011519900").has_value());
    EXPECT_FALSE(DateResolver::resolve("ABCDEFGH").has_value());
}

// =============================================================================
// Calendar helpers
// =============================================================================

TEST(CalendarTest, LeapYears) {
    EXPECT_TRUE(isLeapYear(2000));
    EXPECT_TRUE(isLeapYear(2024));
    EXPECT_FALSE(isLeapYear(1900));
    EXPECT_FALSE(isLeapYear(2023));
}

TEST(CalendarTest, DaysInMonth) {
    EXPECT_EQ(daysInMonth(2023, 2), 28);
    EXPECT_EQ(daysInMonth(2024, 2), 29);
    EXPECT_EQ(daysInMonth(2024, 4), 30);
    EXPECT_EQ(daysInMonth(2024, 12), 31);
    EXPECT_EQ(daysInMonth(2024, 13), 0);
    EXPECT_EQ(daysInMonth(2024, 0), 0);
}

TEST(CalendarTest, DaysFromCivil) {
    EXPECT_EQ(daysFromCivil({1970, 1, 1}), 0);
    EXPECT_EQ(daysFromCivil({1970, 1, 2}), 1);
    EXPECT_EQ(daysFromCivil({1969, 12, 31}), -1);
    EXPECT_EQ(daysFromCivil({2000, 3, 1}) - daysFromCivil({2000, 2, 28}), 2);
    EXPECT_EQ(daysFromCivil({2001, 1, 1}) - daysFromCivil({2000, 1, 1}), 366);
}

TEST(CalendarTest, IsoRoundTrip) {
    CalendarDate date;

    ASSERT_TRUE(parseIsoDate("1990-01-15", date));
    EXPECT_EQ(date.year, 1990);
    EXPECT_EQ(date.month, 1);
    EXPECT_EQ(date.day, 15);
    EXPECT_EQ(toIsoString(date), "1990-01-15");

    EXPECT_EQ(toIsoString({5, 1, 2}), "0005-01-02");
}

TEST(CalendarTest, IsoRejectsMalformed) {
    CalendarDate date;

    EXPECT_FALSE(parseIsoDate("1990-1-15", date));
    EXPECT_FALSE(parseIsoDate("1990/01/15", date));
    EXPECT_FALSE(parseIsoDate("1990-02-30", date));
    EXPECT_FALSE(parseIsoDate("19900115", date));
    EXPECT_FALSE(parseIsoDate("", date));
}
