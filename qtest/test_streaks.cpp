#include "test_streaks.h"
#include <QtTest>

using TestCommon::FakeClock;
using TestCommon::at;

void StreaksTest::record(DailyTotals& totals, DailyGoals& goals, const QString& day, qint64 seconds, qint64 goal)
{
    totals.insert(day, seconds);
    goals.insert(day, goal);
}

void StreaksTest::test_streaks_longest_and_current()
{
    FakeClock clock(at(2024, 5, 6, 20, 0));
    DailyAggregator aggregator(clock);
    StreakCalculator streaks(aggregator);

    DailyTotals totals;
    DailyGoals goals;
    record(totals, goals, "2024-05-01", 3600, 3600);
    record(totals, goals, "2024-05-02", 4000, 3600);
    record(totals, goals, "2024-05-03", 3600, 3600);
    record(totals, goals, "2024-05-04", 100, 3600);
    record(totals, goals, "2024-05-05", 3600, 3600);
    record(totals, goals, "2024-05-06", 3600, 3600);
    aggregator.reset(totals, goals);

    const StreakResult result = streaks.calculate(QDate(2024, 5, 6));
    QCOMPARE(result.longest, 3);
    QCOMPARE(result.current, 2);
}

void StreaksTest::test_streaks_days_without_goal_ignored()
{
    FakeClock clock(at(2024, 5, 4, 20, 0));
    DailyAggregator aggregator(clock);
    StreakCalculator streaks(aggregator);

    DailyTotals totals;
    DailyGoals goals;
    record(totals, goals, "2024-05-01", 3600, 3600);
    // plenty of time but no goal recorded
    totals.insert("2024-05-02", 99999);
    record(totals, goals, "2024-05-03", 3600, 0);
    record(totals, goals, "2024-05-04", 3600, 3600);
    aggregator.reset(totals, goals);
    aggregator.setLiveGoalSeconds(60);

    QCOMPARE(streaks.longestStreak(), 1);
    QCOMPARE(streaks.currentStreak(QDate(2024, 5, 4)), 1);

    aggregator.reset(DailyTotals(), DailyGoals());
    QCOMPARE(streaks.longestStreak(), 0);
    QCOMPARE(streaks.currentStreak(QDate(2024, 5, 4)), 0);
}

void StreaksTest::test_streaks_lapsed_current_streak()
{
    FakeClock clock(at(2024, 5, 10, 9, 0));
    DailyAggregator aggregator(clock);
    StreakCalculator streaks(aggregator);

    DailyTotals totals;
    DailyGoals goals;
    record(totals, goals, "2024-05-06", 3600, 3600);
    record(totals, goals, "2024-05-07", 3600, 3600);
    record(totals, goals, "2024-05-08", 3600, 3600);
    aggregator.reset(totals, goals);

    // met until the day before yesterday: the streak is gone
    QCOMPARE(streaks.currentStreak(QDate(2024, 5, 10)), 0);
    // met until yesterday: still alive
    QCOMPARE(streaks.currentStreak(QDate(2024, 5, 9)), 3);
    QCOMPARE(streaks.longestStreak(), 3);

    // a missed day today does not break yesterday's streak
    record(totals, goals, "2024-05-09", 0, 3600);
    aggregator.reset(totals, goals);
    QCOMPARE(streaks.currentStreak(QDate(2024, 5, 9)), 3);
}

void StreaksTest::test_streaks_goal_met_stream()
{
    FakeClock clock(at(2024, 2, 1, 9, 0));
    DailyAggregator aggregator(clock);
    StreakCalculator streaks(aggregator);

    DailyTotals totals;
    DailyGoals goals;
    record(totals, goals, "2024-01-01", 3600, 1800);
    record(totals, goals, "2024-01-02", 100, 1800);
    aggregator.reset(totals, goals);

    const QMap<QString, bool> stream = streaks.goalMetStream(2024);
    // leap year
    QCOMPARE(stream.size(), 366);
    QCOMPARE(stream.value("2024-01-01"), true);
    QCOMPARE(stream.value("2024-01-02"), false);
    QCOMPARE(stream.value("2024-12-31"), false);
}
