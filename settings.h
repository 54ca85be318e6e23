#ifndef SETTINGS_H
#define SETTINGS_H

#include <QtGlobal>
#include "configrepository.h"

class Settings
{
private:
	ConfigRepository &repo_;
	bool log_to_file_;
	int week_start_day_;
	int week_end_day_;

	void readSettingsFile();
	void writeSettingsFile();

public:
	explicit Settings(ConfigRepository &repo);
	bool logToFile() const;
	int getWeekStartDay() const;
	int getWeekEndDay() const;
	void setWeekStartDay(const int day);
	void setLogToFile(const bool enabled);
	ConfigRepository &repository() const;
};

#endif // SETTINGS_H
