#include <gtest/gtest.h>
#include "common/backup_error.hpp"
#include "common/cron_expression.hpp"
#include "common/utils.hpp"

class CronExpressionTest : public ::testing::Test {
protected:
    static CronExpression::TimePoint at(const std::string& iso) {
        return *utils::parseIsoTime(iso);
    }

    static std::string nextAfter(const std::string& expression, const std::string& after,
                                 const CronTimezone& tz = CronTimezone::utc()) {
        auto next = CronExpression::parse(expression).next(at(after), tz);
        return next ? utils::formatIsoTime(*next) : "none";
    }
};

TEST_F(CronExpressionTest, DailyAtFixedHour) {
    EXPECT_EQ(nextAfter("0 2 * * *", "2024-03-15T12:00:00.000Z"), "2024-03-16T02:00:00.000Z");
    EXPECT_EQ(nextAfter("0 2 * * *", "2024-03-15T01:59:59.000Z"), "2024-03-15T02:00:00.000Z");
}

TEST_F(CronExpressionTest, NextIsStrictlyAfter) {
    EXPECT_EQ(nextAfter("0 2 * * *", "2024-03-15T02:00:00.000Z"), "2024-03-16T02:00:00.000Z");
}

TEST_F(CronExpressionTest, StepsRangesAndLists) {
    EXPECT_EQ(nextAfter("*/15 * * * *", "2024-03-15T12:07:00.000Z"), "2024-03-15T12:15:00.000Z");
    EXPECT_EQ(nextAfter("0 9 * * 1-5", "2024-03-15T10:00:00.000Z"), "2024-03-18T09:00:00.000Z");
    EXPECT_EQ(nextAfter("0 6,18 * * *", "2024-03-15T07:00:00.000Z"), "2024-03-15T18:00:00.000Z");
    EXPECT_EQ(nextAfter("0 0 1 jan *", "2024-03-15T00:00:00.000Z"), "2025-01-01T00:00:00.000Z");
}

TEST_F(CronExpressionTest, SundayAsSeven) {
    EXPECT_EQ(nextAfter("0 0 * * 7", "2024-03-15T00:00:00.000Z"), "2024-03-17T00:00:00.000Z");
    EXPECT_EQ(nextAfter("0 0 * * sun", "2024-03-15T00:00:00.000Z"), "2024-03-17T00:00:00.000Z");
}

TEST_F(CronExpressionTest, RestrictedDayFieldsMatchEither) {
    EXPECT_EQ(nextAfter("0 0 13 * 5", "2024-03-15T12:00:00.000Z"), "2024-03-22T00:00:00.000Z");
}

TEST_F(CronExpressionTest, MacrosAndSecondsField) {
    EXPECT_EQ(nextAfter("@daily", "2024-03-15T12:00:00.000Z"), "2024-03-16T00:00:00.000Z");
    EXPECT_EQ(nextAfter("@hourly", "2024-03-15T12:00:00.000Z"), "2024-03-15T13:00:00.000Z");
    EXPECT_EQ(nextAfter("30 * * * * *", "2024-03-15T12:00:00.000Z"), "2024-03-15T12:00:30.000Z");
}

TEST_F(CronExpressionTest, ImpossibleDateHasNoNextRun) {
    EXPECT_EQ(nextAfter("0 0 30 2 *", "2024-03-15T12:00:00.000Z"), "none");
}

TEST_F(CronExpressionTest, MalformedExpressionsAreRejected) {
    EXPECT_FALSE(CronExpression::isValid("61 * * * *"));
    EXPECT_FALSE(CronExpression::isValid("* * *"));
    EXPECT_FALSE(CronExpression::isValid("*/0 * * * *"));
    EXPECT_FALSE(CronExpression::isValid("0 0 * * funday"));
    EXPECT_FALSE(CronExpression::isValid("5-1 * * * *"));
    EXPECT_TRUE(CronExpression::isValid("0 3 * * *"));

    try {
        CronExpression::parse("0 25 * * *");
        FAIL() << "expected parse to throw";
    } catch (const BackupError& e) {
        EXPECT_EQ(e.code(), BackupErrorCode::InvalidConfig);
    }
}

TEST_F(CronExpressionTest, FixedOffsetTimezone) {
    auto tz = CronTimezone::parse("UTC+05:30");
    ASSERT_TRUE(tz.has_value());
    EXPECT_EQ(tz->offsetMinutes, 330);
    EXPECT_EQ(nextAfter("0 2 * * *", "2024-03-15T12:00:00.000Z", *tz), "2024-03-15T20:30:00.000Z");

    auto west = CronTimezone::parse("-08:00");
    ASSERT_TRUE(west.has_value());
    EXPECT_EQ(west->offsetMinutes, -480);
    EXPECT_EQ(nextAfter("0 2 * * *", "2024-03-15T12:00:00.000Z", *west), "2024-03-16T10:00:00.000Z");
}

TEST_F(CronExpressionTest, TimezoneNames) {
    EXPECT_EQ(CronTimezone::parse("Etc/UTC")->offsetMinutes, 0);
    EXPECT_TRUE(CronTimezone::parse("local")->local);
    EXPECT_EQ(CronTimezone::parse("UTC-8")->offsetMinutes, -480);
    EXPECT_FALSE(CronTimezone::parse("America/New_York").has_value());
    EXPECT_FALSE(CronTimezone::parse("+25:00").has_value());
}
