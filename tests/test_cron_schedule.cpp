#include <gtest/gtest.h>
#include "../include/controller/cron_schedule.h"

using namespace kubesim;

namespace {

constexpr Tick kMinutesPerDay = 1440;

} // namespace

class CronScheduleTest : public ::testing::Test {
protected:
    CronSchedule parse(const std::string& expression) {
        auto schedule = CronSchedule::parse(expression);
        EXPECT_TRUE(schedule) << expression;
        return *schedule;
    }
};

TEST_F(CronScheduleTest, SimulatedCalendar) {
    SimulatedTime start = SimulatedTime::from_tick(0);
    EXPECT_EQ(start.minute, 0);
    EXPECT_EQ(start.hour, 0);
    EXPECT_EQ(start.day_of_month, 1);
    EXPECT_EQ(start.month, 1);
    EXPECT_EQ(start.day_of_week, 1); // 星期一

    SimulatedTime later = SimulatedTime::from_tick(31 * kMinutesPerDay + 90);
    EXPECT_EQ(later.month, 2);
    EXPECT_EQ(later.day_of_month, 1);
    EXPECT_EQ(later.hour, 1);
    EXPECT_EQ(later.minute, 30);

    // 2024是闰年
    SimulatedTime leap = SimulatedTime::from_tick(59 * kMinutesPerDay);
    EXPECT_EQ(leap.month, 2);
    EXPECT_EQ(leap.day_of_month, 29);
}

TEST_F(CronScheduleTest, EveryNTicks) {
    CronSchedule schedule = parse("every-5-ticks");
    EXPECT_EQ(schedule.interval(), 5);
    EXPECT_FALSE(schedule.matches(0));
    EXPECT_FALSE(schedule.matches(4));
    EXPECT_TRUE(schedule.matches(5));
    EXPECT_TRUE(schedule.matches(10));

    EXPECT_TRUE(CronSchedule::parse("every-1-tick"));
    EXPECT_FALSE(CronSchedule::parse("every-0-ticks"));
}

TEST_F(CronScheduleTest, MinuteStep) {
    CronSchedule schedule = parse("*/15 * * * *");
    EXPECT_TRUE(schedule.matches(0));
    EXPECT_TRUE(schedule.matches(15));
    EXPECT_FALSE(schedule.matches(16));
    EXPECT_TRUE(schedule.matches(60));
}

TEST_F(CronScheduleTest, RangesAndLists) {
    CronSchedule schedule = parse("0,30 9-17/4 * * *");
    EXPECT_TRUE(schedule.matches(9 * 60));
    EXPECT_TRUE(schedule.matches(13 * 60 + 30));
    EXPECT_TRUE(schedule.matches(17 * 60));
    EXPECT_FALSE(schedule.matches(10 * 60));
    EXPECT_FALSE(schedule.matches(9 * 60 + 15));
}

TEST_F(CronScheduleTest, DayOfWeek) {
    // 每周日午夜；2024-01-07 是星期日
    CronSchedule schedule = parse("0 0 * * 0");
    EXPECT_FALSE(schedule.matches(0));
    EXPECT_TRUE(schedule.matches(6 * kMinutesPerDay));
    EXPECT_TRUE(parse("0 0 * * 7").matches(6 * kMinutesPerDay));
}

TEST_F(CronScheduleTest, DayOfMonthOrDayOfWeek) {
    // 两者都受限时满足其一即可：1号或星期三
    CronSchedule schedule = parse("0 0 1 * 3");
    EXPECT_TRUE(schedule.matches(0));                   // 1月1日
    EXPECT_TRUE(schedule.matches(2 * kMinutesPerDay));  // 1月3日星期三
    EXPECT_FALSE(schedule.matches(kMinutesPerDay));     // 1月2日星期二
}

TEST_F(CronScheduleTest, RejectsMalformed) {
    std::string error;
    EXPECT_FALSE(CronSchedule::parse("* * * *", &error));
    EXPECT_FALSE(error.empty());
    EXPECT_FALSE(CronSchedule::parse("61 * * * *"));
    EXPECT_FALSE(CronSchedule::parse("*/0 * * * *"));
    EXPECT_FALSE(CronSchedule::parse("5-2 * * * *"));
    EXPECT_FALSE(CronSchedule::parse("a * * * *"));
    EXPECT_FALSE(CronSchedule::parse("1, * * * *"));
}
