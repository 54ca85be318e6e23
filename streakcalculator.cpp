#include "streakcalculator.h"
#include <algorithm>
#include <vector>
#include "dailyaggregator.h"
#include "helpers.h"

namespace {

std::vector<QDate> datesWithGoal(const DailyGoals& goals)
{
	std::vector<QDate> dates;
	for (auto it = goals.constBegin(); it != goals.constEnd(); ++it) {
		if (it.value() <= 0)
			continue;
		const QDate date = dateFromKey(it.key());
		if (date.isValid())
			dates.push_back(date);
	}
	std::sort(dates.begin(), dates.end());
	return dates;
}

}

StreakCalculator::StreakCalculator(const DailyAggregator& aggregator)
	: aggregator_(aggregator)
{ }

StreakResult StreakCalculator::calculate(const QDate& today) const
{
	StreakResult result;
	result.longest = longestStreak();
	result.current = currentStreak(today);
	return result;
}

int StreakCalculator::longestStreak() const
{
	int longest = 0;
	int running = 0;
	QDate prev;
	for (const auto& date : datesWithGoal(aggregator_.goals())) {
		if (aggregator_.goalMetOnDate(dateKey(date))) {
			if (prev.isValid() && prev.addDays(1) == date)
				++running;
			else
				running = 1;
			longest = std::max(longest, running);
		}
		else {
			running = 0;
		}
		prev = date;
	}
	return longest;
}

int StreakCalculator::currentStreak(const QDate& today) const
{
	const std::vector<QDate> dates = datesWithGoal(aggregator_.goals());

	QDate latest_met;
	for (auto it = dates.rbegin(); it != dates.rend(); ++it) {
		if (aggregator_.goalMetOnDate(dateKey(*it))) {
			latest_met = *it;
			break;
		}
	}

	// a streak whose last met day is before yesterday has lapsed
	if (!latest_met.isValid() || latest_met < today.addDays(-1))
		return 0;

	int streak = 0;
	for (QDate date = latest_met; aggregator_.goalMetOnDate(dateKey(date)); date = date.addDays(-1))
		++streak;
	return streak;
}

QMap<QString, bool> StreakCalculator::goalMetStream(int year) const
{
	QMap<QString, bool> stream;
	const QDate last(year, 12, 31);
	for (QDate date(year, 1, 1); date <= last; date = date.addDays(1)) {
		const QString key = dateKey(date);
		stream.insert(key, aggregator_.goalMetOnDate(key));
	}
	return stream;
}
