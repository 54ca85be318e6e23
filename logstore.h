#ifndef LOGSTORE_H
#define LOGSTORE_H

#include <QString>
#include <QStringList>
#include <deque>
#include "types.h"

class Settings;

// One CSV file per profile. Rows are only ever appended; removing a row means
// rewriting the whole file.
class LogStore
{
public:
	LogStore(const Settings& settings, const QString& path);

	static QStringList canonicalHeader();

	const QString& path() const;
	bool ensure();
	LogLoadResult load(qint64 fallback_goal_seconds);
	bool append(const LogEntry& entry);
	bool append(const QString& date, const QString& start, const QString& end, qint64 duration, qint64 goal);
	bool rewrite(const std::deque<LogEntry>& entries, const DailyGoals& goals);

private:
	const Settings& settings_;
	QString path_;
};

#endif // LOGSTORE_H
