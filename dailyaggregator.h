#ifndef DAILYAGGREGATOR_H
#define DAILYAGGREGATOR_H

#include <QDate>
#include <QPair>
#include <QVector>
#include <functional>
#include <vector>
#include "types.h"

class Clock;
class SessionTracker;

struct GoalResolutionStep {
	QString name;
	std::function<bool(const QString& date_key, qint64* goal)> resolve;
};

class DailyAggregator
{
private:
	const Clock& clock_;
	const SessionTracker* tracker_;
	DailyTotals totals_;
	DailyGoals goals_;
	qint64 live_goal_seconds_;

	qint64 liveSecondsFor(const QString& date_key) const;

public:
	explicit DailyAggregator(const Clock& clock, const SessionTracker* tracker = nullptr);

	void reset(const DailyTotals& totals, const DailyGoals& goals);
	void setSessionTracker(const SessionTracker* tracker);
	void setLiveGoalSeconds(qint64 seconds);
	qint64 liveGoalSeconds() const;

	void addDuration(const QString& date_key, qint64 seconds);
	void removeDuration(const QString& date_key, qint64 seconds);
	bool setDailyGoal(const QString& date_key, qint64 goal_seconds);

	const DailyTotals& totals() const;
	const DailyGoals& goals() const;

	qint64 totalSecondsForDay(const QString& date_key) const;
	std::vector<GoalResolutionStep> goalResolutionSteps() const;
	qint64 goalSecondsForDate(const QString& date_key) const;
	qint64 goalSecondsLeft(const QString& date_key) const;
	bool goalMetOnDate(const QString& date_key) const;
	DayProgress dayProgress(const QString& date_key) const;
	static QString percentOfGoal(qint64 seconds, qint64 goal_seconds);

	static QPair<QDate, QDate> weekRangeForDate(const QDate& date, int week_end_day);
	qint64 weekTotal(const QDate& date, int week_end_day) const;
	qint64 yearTotal(int year) const;
	qint64 yearAveragePerWeek(const QDate& today) const;
	QVector<qint64> dailyValues(const QDate& end, int days) const;
	QVector<qint64> monthlyValues(const QDate& end, int months) const;
};

#endif // DAILYAGGREGATOR_H
