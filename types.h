#ifndef TYPES_H
#define TYPES_H

#include <QtGlobal>
#include <QString>
#include <QDateTime>
#include <QMap>
#include <QMetaType>
#include <deque>

enum class SessionMode { Idle, Counting, Clocking };

enum class DayProgress { Empty, Partial, Met };

enum class ProfileError {
	None,
	EmptyLabel,
	PathSeparator,
	ReservedLabel,
	DuplicateLabel,
	FileNameTaken,
	UnknownProfile,
	BuiltInProfile,
	InvalidColor
};

struct LogEntry {
	QString date;
	QString startTime;
	QString endTime;
	qint64 durationSeconds;
	qint64 goalSeconds; // negative when the row carried no goal

	LogEntry()
		: durationSeconds(0), goalSeconds(-1) {
	}

	LogEntry(const QString &date, const QString &start, const QString &end, qint64 duration, qint64 goal)
		: date(date), startTime(start), endTime(end), durationSeconds(duration), goalSeconds(goal) {
	}

	bool isGoalMarker() const {
		return durationSeconds == 0 && startTime == QLatin1String("goal") && endTime == QLatin1String("goal");
	}

	bool hasGoal() const {
		return goalSeconds >= 0;
	}

	bool operator==(const LogEntry &other) const {
		return date == other.date && startTime == other.startTime && endTime == other.endTime
			&& durationSeconds == other.durationSeconds && goalSeconds == other.goalSeconds;
	}
};

typedef QMap<QString, qint64> DailyTotals;
typedef QMap<QString, qint64> DailyGoals;

struct LogLoadResult {
	std::deque<LogEntry> entries;
	DailyTotals totals;
	DailyGoals goals;
	bool needsMigration = false;
};

struct ActiveSession {
	QDateTime start;
	qint64 accumulatedSeconds;
	QString dateKey;
};

struct StreakResult {
	int longest = 0;
	int current = 0;
};

Q_DECLARE_METATYPE(LogEntry)
Q_DECLARE_METATYPE(SessionMode)

#endif // TYPES_H
