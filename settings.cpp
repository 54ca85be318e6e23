#include "settings.h"

namespace {

int weekEndForStart(const int start_day)
{
	return (start_day == 1) ? 7 : start_day - 1;
}

}

Settings::Settings(ConfigRepository &repo) : repo_(repo)
{
	readSettingsFile();
	writeSettingsFile();
}

void Settings::readSettingsFile()
{
	log_to_file_ = repo_.value("debug/log_to_file", false).toBool();
	week_start_day_ = qBound(1, repo_.value("totals/week_start_day", 1).toInt(), 7);
	week_end_day_ = qBound(1, repo_.value("totals/week_end_day", 7).toInt(), 7);
	// the week always ends the day before it starts
	if (week_end_day_ != weekEndForStart(week_start_day_))
		week_end_day_ = weekEndForStart(week_start_day_);
}

void Settings::writeSettingsFile()
{
	repo_.setValue("debug/log_to_file", log_to_file_);
	repo_.setValue("totals/week_start_day", week_start_day_);
	repo_.setValue("totals/week_end_day", week_end_day_);
	repo_.sync();
}

bool Settings::logToFile() const
{
	return log_to_file_;
}

int Settings::getWeekStartDay() const
{
	return week_start_day_;
}

int Settings::getWeekEndDay() const
{
	return week_end_day_;
}

void Settings::setWeekStartDay(const int day)
{
	week_start_day_ = qBound(1, day, 7);
	week_end_day_ = weekEndForStart(week_start_day_);
	writeSettingsFile();
}

void Settings::setLogToFile(const bool enabled)
{
	log_to_file_ = enabled;
	writeSettingsFile();
}

ConfigRepository &Settings::repository() const
{
	return repo_;
}
