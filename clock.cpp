#include "clock.h"

QDate Clock::today() const
{
	return now().date();
}

QDateTime SystemClock::now() const
{
	return QDateTime::currentDateTime();
}
