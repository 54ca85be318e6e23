#ifndef CLOCK_H
#define CLOCK_H

#include <QDateTime>

// Source of "now" for everything that attributes time to a date-key.
class Clock
{
public:
	virtual ~Clock() = default;
	virtual QDateTime now() const = 0;
	QDate today() const;
};

class SystemClock : public Clock
{
public:
	QDateTime now() const override;
};

#endif // CLOCK_H
