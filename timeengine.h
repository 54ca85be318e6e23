#ifndef TIMEENGINE_H
#define TIMEENGINE_H

#include <QObject>
#include <QColor>
#include <QDate>
#include <QTime>
#include <deque>
#include <memory>
#include "types.h"
#include "settings.h"
#include "logstore.h"
#include "profilemanager.h"
#include "sessiontracker.h"
#include "dailyaggregator.h"
#include "streakcalculator.h"

class Clock;

class TimeEngine : public QObject
{
	Q_OBJECT
private:
	const Settings & settings_;
	const Clock & clock_;
	ProfileManager profiles_;
	SessionTracker tracker_;
	DailyAggregator aggregator_;
	StreakCalculator streaks_;
	std::unique_ptr<LogStore> store_;
	std::deque<LogEntry> entries_;
	bool has_pending_undo_;
	LogEntry last_added_entry_;
	size_t last_added_index_;

	void migrateProfileLogs();
	void loadActiveProfile();
	void discardPendingUndo();
	QString todayKey() const;

private slots:
	void recordSession(const LogEntry & entry);

public:
	TimeEngine(const Settings & settings, ConfigRepository & repo, const Clock & clock, const QString & data_dir, QObject *parent = nullptr);
	~TimeEngine();

	// countdown and stopwatch
	bool start();
	void pause();
	void toggleTimer();
	void startClock();
	void stopClock();
	void toggleClock();
	void resetClock();
	void setRemainingSeconds(qint64 seconds);

	// goals and manual edits
	void setGoal(qint64 seconds);
	bool addManualTime(const QDate & date, const QTime & start_time, qint64 duration_seconds);
	bool undoLastAddedTime();
	bool hasPendingUndo() const;

	// profiles
	bool switchProfile(const QString & label);
	ProfileError addProfile(const QString & label);
	ProfileError deleteProfile(const QString & label);
	ProfileError setProfileColor(const QString & label, const QColor & color);
	const QString & activeProfile() const;
	QColor profileColor(const QString & label) const;
	const ProfileManager & profiles() const;

	// read side
	SessionMode mode() const;
	qint64 remainingSeconds() const;
	qint64 clockDisplaySeconds() const;
	qint64 goalSeconds() const;
	qint64 totalSecondsForDay(const QDate & date) const;
	qint64 totalSecondsToday() const;
	qint64 goalSecondsForDate(const QDate & date) const;
	qint64 goalSecondsLeftToday() const;
	QString percentOfGoalToday() const;
	qint64 weekTotal() const;
	qint64 yearTotal() const;
	qint64 yearAveragePerWeek() const;
	StreakResult streaks() const;
	QMap<QString, bool> goalMetStream(int year) const;
	DayProgress dayProgress(const QDate & date) const;
	QVector<qint64> dailyValues(int days) const;
	QVector<qint64> monthlyValues(int months) const;
	const std::deque<LogEntry> & entries() const;
	std::deque<LogEntry> entriesForProfile(const QString & label) const;
	DailyTotals combinedTotals() const;
	const DailyAggregator & aggregator() const;
	const SessionTracker & tracker() const;

public slots:
	void tick();

signals:
	void statusMessage(const QString & text);
	void countdownFinished();
	void totalsChanged();
	void profileChanged(const QString & label);
};

#endif // TIMEENGINE_H
