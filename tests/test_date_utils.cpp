#include "DateUtils.h"

#include <gtest/gtest.h>

TEST(DateUtils, ParsesYearFirstFormats) {
    EXPECT_EQ(DateUtils::calendarDay("2024-03-05"), "2024-03-05");
    EXPECT_EQ(DateUtils::calendarDay("2024/3/5 14:22"), "2024-03-05");
    EXPECT_EQ(DateUtils::calendarDay("2024-03-05T23:59:59Z"), "2024-03-05");
    EXPECT_EQ(DateUtils::calendarDay("2024-03-05 08:15:30.250"), "2024-03-05");
}

TEST(DateUtils, DayFirstWhenFirstFieldExceedsTwelve) {
    EXPECT_EQ(DateUtils::calendarDay("25/12/2023"), "2023-12-25");
    EXPECT_EQ(DateUtils::calendarDay("12/25/2023"), "2023-12-25");
    EXPECT_EQ(DateUtils::calendarDay("03/04/2024"), "2024-03-04");
}

TEST(DateUtils, DashedDayMonthYear) {
    EXPECT_EQ(DateUtils::calendarDay("05-03-2024"), "2024-03-05");
    EXPECT_EQ(DateUtils::calendarDay("05.03.2024"), "2024-03-05");
}

TEST(DateUtils, LocaleHintOverridesAmbiguousOrder) {
    EXPECT_EQ(DateUtils::calendarDay("03/04/2024", DateUtils::LocaleHint::DMY), "2024-04-03");
    EXPECT_EQ(DateUtils::calendarDay("03/04/2024", DateUtils::LocaleHint::MDY), "2024-03-04");
}

TEST(DateUtils, TwoDigitYears) {
    EXPECT_EQ(DateUtils::calendarDay("01/02/99"), "1999-01-02");
    EXPECT_EQ(DateUtils::calendarDay("01/02/24"), "2024-01-02");
}

TEST(DateUtils, EpochSeconds) {
    EXPECT_EQ(DateUtils::calendarDay("1700000000"), "2023-11-14");
    int64_t ts = 0;
    ASSERT_TRUE(DateUtils::parseDateTime("1970-01-02 00:00:01", ts));
    EXPECT_EQ(ts, 86401);
}

TEST(DateUtils, RejectsInvalidDates) {
    EXPECT_FALSE(DateUtils::calendarDay("2023-02-30").has_value());
    EXPECT_FALSE(DateUtils::calendarDay("2024-13-01").has_value());
    EXPECT_FALSE(DateUtils::calendarDay("yesterday").has_value());
    EXPECT_FALSE(DateUtils::calendarDay("").has_value());
    EXPECT_TRUE(DateUtils::calendarDay("2024-02-29").has_value());
}

TEST(DateUtils, FormatCalendarDayHandlesNegativeTimestamps) {
    EXPECT_EQ(DateUtils::formatCalendarDay(0), "1970-01-01");
    EXPECT_EQ(DateUtils::formatCalendarDay(-1), "1969-12-31");
}

TEST(DateUtils, TimeZoneSuffixesKeepTheWrittenDay) {
    EXPECT_EQ(DateUtils::calendarDay("2024-03-05T09:00:00+07:00"), "2024-03-05");
    EXPECT_EQ(DateUtils::calendarDay("2024-03-05T23:30:00-05:00"), "2024-03-05");
    EXPECT_EQ(DateUtils::calendarDay("2024-03-05 09:00:00 UTC"), "2024-03-05");
    EXPECT_EQ(DateUtils::calendarDay("2024-03-05 09:00 GMT+0100"), "2024-03-05");

    int64_t ts = 0;
    ASSERT_TRUE(DateUtils::parseDateTime("1970-01-02T01:00:00+07:00", ts));
    EXPECT_EQ(ts, 86400 + 3600);
    EXPECT_FALSE(DateUtils::parseDateTime("1970-01-02T01:00:00+7x", ts));
}

TEST(DateUtils, TwelveHourClock) {
    EXPECT_EQ(DateUtils::calendarDay("3/5/2024 9:00 AM"), "2024-03-05");
    EXPECT_EQ(DateUtils::calendarDay("3/5/2024 5:45 PM"), "2024-03-05");

    int64_t ts = 0;
    ASSERT_TRUE(DateUtils::parseDateTime("1970-01-01 12:15 am", ts));
    EXPECT_EQ(ts, 15 * 60);
    ASSERT_TRUE(DateUtils::parseDateTime("1970-01-01 12:00PM", ts));
    EXPECT_EQ(ts, 12 * 3600);
    ASSERT_TRUE(DateUtils::parseDateTime("1970-01-01 5:45:10 PM", ts));
    EXPECT_EQ(ts, 17 * 3600 + 45 * 60 + 10);
    EXPECT_FALSE(DateUtils::parseDateTime("1970-01-01 13:00 PM", ts));
}

TEST(DateUtils, EnglishMonthNames) {
    EXPECT_EQ(DateUtils::calendarDay("05-Mar-2024 09:00"), "2024-03-05");
    EXPECT_EQ(DateUtils::calendarDay("05-MAR-24"), "2024-03-05");
    EXPECT_EQ(DateUtils::calendarDay("Mar 5, 2024"), "2024-03-05");
    EXPECT_EQ(DateUtils::calendarDay("March 5, 2024 9:00 PM"), "2024-03-05");
    EXPECT_EQ(DateUtils::calendarDay("5 September 2024"), "2024-09-05");
    EXPECT_EQ(DateUtils::calendarDay("Sept 30, 2024"), "2024-09-30");
    EXPECT_EQ(DateUtils::calendarDay("01-Oct-2024T10:00"), "2024-10-01");
    EXPECT_FALSE(DateUtils::calendarDay("31-Feb-2024").has_value());
    EXPECT_FALSE(DateUtils::calendarDay("05-Marz-2024").has_value());
}

TEST(DateUtils, UnreadableTimeStillYieldsTheDay) {
    EXPECT_EQ(DateUtils::calendarDay("2024-01-01 25:00"), "2024-01-01");
    EXPECT_EQ(DateUtils::calendarDay("2024-01-01 noon"), "2024-01-01");
    int64_t ts = 0;
    EXPECT_FALSE(DateUtils::parseDateTime("2024-01-01 25:00", ts));
    EXPECT_FALSE(DateUtils::parseDateTime("2024-01-01 noon", ts));
}
