#ifndef STREAKCALCULATOR_H
#define STREAKCALCULATOR_H

#include <QDate>
#include <QMap>
#include "types.h"

class DailyAggregator;

class StreakCalculator
{
private:
	const DailyAggregator& aggregator_;

public:
	explicit StreakCalculator(const DailyAggregator& aggregator);

	StreakResult calculate(const QDate& today) const;
	int longestStreak() const;
	int currentStreak(const QDate& today) const;
	QMap<QString, bool> goalMetStream(int year) const;
};

#endif // STREAKCALCULATOR_H
