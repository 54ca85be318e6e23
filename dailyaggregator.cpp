#include "dailyaggregator.h"
#include <QMap>
#include <algorithm>
#include "clock.h"
#include "helpers.h"
#include "sessiontracker.h"

DailyAggregator::DailyAggregator(const Clock& clock, const SessionTracker* tracker)
	: clock_(clock), tracker_(tracker), live_goal_seconds_(0)
{ }

void DailyAggregator::reset(const DailyTotals& totals, const DailyGoals& goals)
{
	totals_ = totals;
	goals_ = goals;
}

void DailyAggregator::setSessionTracker(const SessionTracker* tracker)
{
	tracker_ = tracker;
}

void DailyAggregator::setLiveGoalSeconds(qint64 seconds)
{
	live_goal_seconds_ = std::max<qint64>(0, seconds);
}

qint64 DailyAggregator::liveGoalSeconds() const
{
	return live_goal_seconds_;
}

void DailyAggregator::addDuration(const QString& date_key, qint64 seconds)
{
	if (seconds <= 0)
		return;
	totals_[date_key] += seconds;
}

void DailyAggregator::removeDuration(const QString& date_key, qint64 seconds)
{
	const qint64 updated = std::max<qint64>(0, totals_.value(date_key, 0) - seconds);
	if (updated <= 0)
		totals_.remove(date_key);
	else
		totals_[date_key] = updated;
}

bool DailyAggregator::setDailyGoal(const QString& date_key, qint64 goal_seconds)
{
	auto it = goals_.constFind(date_key);
	if (it != goals_.constEnd() && it.value() == goal_seconds)
		return false;
	goals_[date_key] = goal_seconds;
	return true;
}

const DailyTotals& DailyAggregator::totals() const
{
	return totals_;
}

const DailyGoals& DailyAggregator::goals() const
{
	return goals_;
}

qint64 DailyAggregator::liveSecondsFor(const QString& date_key) const
{
	if (tracker_ == nullptr)
		return 0;
	const ActiveSession* session = tracker_->activeSession();
	if (session == nullptr || session->dateKey != date_key)
		return 0;
	return session->accumulatedSeconds;
}

qint64 DailyAggregator::totalSecondsForDay(const QString& date_key) const
{
	return totals_.value(date_key, 0) + liveSecondsFor(date_key);
}

std::vector<GoalResolutionStep> DailyAggregator::goalResolutionSteps() const
{
	// first step that yields a value wins
	std::vector<GoalResolutionStep> steps;
	steps.push_back({ "recorded", [this](const QString& key, qint64* goal) {
		auto it = goals_.constFind(key);
		if (it == goals_.constEnd())
			return false;
		*goal = it.value();
		return true;
	} });
	steps.push_back({ "live", [this](const QString& key, qint64* goal) {
		if (key != dateKey(clock_.today()))
			return false;
		*goal = live_goal_seconds_;
		return true;
	} });
	steps.push_back({ "none", [](const QString&, qint64* goal) {
		*goal = 0;
		return true;
	} });
	return steps;
}

qint64 DailyAggregator::goalSecondsForDate(const QString& date_key) const
{
	for (const auto& step : goalResolutionSteps()) {
		qint64 goal = 0;
		if (step.resolve(date_key, &goal))
			return goal;
	}
	return 0;
}

qint64 DailyAggregator::goalSecondsLeft(const QString& date_key) const
{
	const qint64 goal = goalSecondsForDate(date_key);
	if (goal <= 0)
		return 0;
	return std::max<qint64>(0, goal - totalSecondsForDay(date_key));
}

bool DailyAggregator::goalMetOnDate(const QString& date_key) const
{
	// only goals that were actually recorded count here, never the live fallback
	const qint64 goal = goals_.value(date_key, 0);
	if (goal <= 0)
		return false;
	return totalSecondsForDay(date_key) >= goal;
}

DayProgress DailyAggregator::dayProgress(const QString& date_key) const
{
	const qint64 seconds = totalSecondsForDay(date_key);
	const qint64 goal = goalSecondsForDate(date_key);
	if (goal > 0 && seconds >= goal)
		return DayProgress::Met;
	if (seconds > 0)
		return DayProgress::Partial;
	return DayProgress::Empty;
}

QString DailyAggregator::percentOfGoal(qint64 seconds, qint64 goal_seconds)
{
	return formatPercent(seconds, goal_seconds);
}

QPair<QDate, QDate> DailyAggregator::weekRangeForDate(const QDate& date, int week_end_day)
{
	const int end_day = qBound(1, week_end_day, 7);
	const int delta = ((date.dayOfWeek() - end_day) % 7 + 7) % 7;
	const QDate end = date.addDays(-delta);
	return qMakePair(end.addDays(-6), end);
}

qint64 DailyAggregator::weekTotal(const QDate& date, int week_end_day) const
{
	const QPair<QDate, QDate> range = weekRangeForDate(date, week_end_day);
	qint64 total = 0;
	for (QDate d = range.first; d <= range.second; d = d.addDays(1))
		total += totalSecondsForDay(dateKey(d));
	return total;
}

qint64 DailyAggregator::yearTotal(int year) const
{
	const QString prefix = QString::number(year) + "-";
	qint64 total = 0;
	for (auto it = totals_.constBegin(); it != totals_.constEnd(); ++it) {
		if (it.key().startsWith(prefix))
			total += it.value();
	}
	if (tracker_ != nullptr) {
		const ActiveSession* session = tracker_->activeSession();
		if (session != nullptr && session->dateKey.startsWith(prefix))
			total += session->accumulatedSeconds;
	}
	return total;
}

qint64 DailyAggregator::yearAveragePerWeek(const QDate& today) const
{
	const qint64 total = yearTotal(today.year());
	const qint64 days_elapsed = std::max<qint64>(1, QDate(today.year(), 1, 1).daysTo(today) + 1);
	return qRound64(static_cast<double>(total) * 7.0 / static_cast<double>(days_elapsed));
}

QVector<qint64> DailyAggregator::dailyValues(const QDate& end, int days) const
{
	QVector<qint64> values;
	const QDate start = end.addDays(-(days - 1));
	for (int offset = 0; offset < days; ++offset)
		values.append(totals_.value(dateKey(start.addDays(offset)), 0));
	return values;
}

QVector<qint64> DailyAggregator::monthlyValues(const QDate& end, int months) const
{
	QMap<QPair<int, int>, qint64> monthly;
	for (auto it = totals_.constBegin(); it != totals_.constEnd(); ++it) {
		const QDate date = dateFromKey(it.key());
		if (!date.isValid())
			continue;
		monthly[qMakePair(date.year(), date.month())] += it.value();
	}

	QVector<qint64> values;
	const QDate first = QDate(end.year(), end.month(), 1).addMonths(-(months - 1));
	for (int offset = 0; offset < months; ++offset) {
		const QDate month = first.addMonths(offset);
		values.append(monthly.value(qMakePair(month.year(), month.month()), 0));
	}
	return values;
}
