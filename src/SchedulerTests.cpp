#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <chrono>
#include <ctime>
#include "TestDoubles.hpp"
#include "core/BackupScheduler.hpp"
#include "core/models/ServerConfig.hpp"

using namespace std::chrono_literals;
using Clock = std::chrono::system_clock;

static Clock::time_point localTime(int year, int month, int day, int hour, int minute) {
    std::tm tm{};
    tm.tm_year = year - 1900;
    tm.tm_mon = month - 1;
    tm.tm_mday = day;
    tm.tm_hour = hour;
    tm.tm_min = minute;
    tm.tm_isdst = -1;
    return Clock::from_time_t(std::mktime(&tm));
}

static std::tm toLocal(Clock::time_point point) {
    std::time_t t = Clock::to_time_t(point);
    std::tm tm{};
    localtime_r(&t, &tm);
    return tm;
}

TEST(BackupTimeTest, ParsesValidTimes) {
    BackupTime time;
    ASSERT_TRUE(BackupTime::parse("03:00", time));
    EXPECT_EQ(time.hour, 3);
    EXPECT_EQ(time.minute, 0);
    ASSERT_TRUE(BackupTime::parse(" 7:05 ", time));
    EXPECT_EQ(time.toString(), "07:05");
    ASSERT_TRUE(BackupTime::parse("23:59", time));
}

TEST(BackupTimeTest, RejectsInvalidTimes) {
    BackupTime time;
    EXPECT_FALSE(BackupTime::parse("24:00", time));
    EXPECT_FALSE(BackupTime::parse("12:60", time));
    EXPECT_FALSE(BackupTime::parse("1200", time));
    EXPECT_FALSE(BackupTime::parse("ab:cd", time));
    EXPECT_FALSE(BackupTime::parse("12:5", time));
    EXPECT_FALSE(BackupTime::parse("", time));
}

TEST(BackupTimeTest, SplitCommaList) {
    EXPECT_EQ(splitCommaList(" 03:00, 15:00 ,,"), (std::vector<std::string>{"03:00", "15:00"}));
    EXPECT_TRUE(splitCommaList("").empty());
}

TEST(BackupSchedulerTest, NextOccurrenceSameDayOrTomorrow) {
    Clock::time_point now = localTime(2026, 3, 10, 10, 0);

    std::tm later = toLocal(BackupScheduler::nextOccurrence(BackupTime{15, 0}, now));
    EXPECT_EQ(later.tm_mday, 10);
    EXPECT_EQ(later.tm_hour, 15);

    std::tm earlier = toLocal(BackupScheduler::nextOccurrence(BackupTime{3, 0}, now));
    EXPECT_EQ(earlier.tm_mday, 11);
    EXPECT_EQ(earlier.tm_hour, 3);

    // 恰好到点时排到明天
    std::tm exact = toLocal(BackupScheduler::nextOccurrence(BackupTime{10, 0}, now));
    EXPECT_EQ(exact.tm_mday, 11);
}

TEST(BackupSchedulerTest, NextOccurrenceRollsOverMonthEnd) {
    Clock::time_point now = localTime(2026, 1, 31, 22, 0);
    std::tm next = toLocal(BackupScheduler::nextOccurrence(BackupTime{3, 0}, now));
    EXPECT_EQ(next.tm_mon, 1);
    EXPECT_EQ(next.tm_mday, 1);
}

TEST(BackupSchedulerTest, CollectDueFiresOncePerDay) {
    MockLogger logger;
    logger.allowAll();
    BackupScheduler scheduler(&logger);

    ServerConfig first;
    first.address = "first";
    first.backupTimes = {BackupTime{3, 0}, BackupTime{15, 0}};
    ServerConfig second;
    second.address = "second";
    second.backupTimes = {BackupTime{3, 0}};

    Clock::time_point start = localTime(2026, 3, 10, 10, 0);
    scheduler.scheduleServer(0, first, start);
    scheduler.scheduleServer(1, second, start);
    ASSERT_EQ(scheduler.getJobs().size(), 3u);

    EXPECT_TRUE(scheduler.collectDue(start + 1h).empty());
    EXPECT_EQ(scheduler.collectDue(localTime(2026, 3, 10, 15, 0)), (std::vector<size_t>{0}));
    EXPECT_TRUE(scheduler.collectDue(localTime(2026, 3, 10, 15, 1)).empty());
    EXPECT_EQ(scheduler.collectDue(localTime(2026, 3, 11, 3, 0)), (std::vector<size_t>{0, 1}));
}

TEST(BackupSchedulerTest, MissedJobsFireOnlyOnce) {
    MockLogger logger;
    logger.allowAll();
    BackupScheduler scheduler(&logger);

    ServerConfig config;
    config.address = "host";
    config.backupTimes = {BackupTime{3, 0}, BackupTime{4, 0}};
    scheduler.scheduleServer(0, config, localTime(2026, 3, 10, 10, 0));

    // 进程暂停了两天：两个时间点都到期，但只投递一次
    Clock::time_point resumed = localTime(2026, 3, 12, 12, 0);
    EXPECT_EQ(scheduler.collectDue(resumed), (std::vector<size_t>{0}));
    EXPECT_TRUE(scheduler.collectDue(resumed + 1min).empty());
    for (const auto& job : scheduler.getJobs()) {
        EXPECT_GT(job.nextRun, resumed);
    }
}
