#ifndef SESSIONTRACKER_H
#define SESSIONTRACKER_H

#include <QObject>
#include <QtGlobal>
#include <QDateTime>
#include "settings.h"
#include "types.h"

class Clock;

class SessionTracker : public QObject
{
	Q_OBJECT
private:
	const Settings & settings_;
	const Clock & clock_;
	SessionMode mode_;
	ActiveSession session_;
	bool session_open_;
	qint64 remaining_seconds_;
	qint64 clock_offset_seconds_;
	qint64 goal_seconds_;

	void tickOnce();
	void recordProgress(qint64 seconds);
	void finalizeAt(const QDateTime & end);
	void stopCountdown(const QString & status_text);
	void stopClockInternal(const QString & status_text);
	void handleTimeUp();
	void setMode(SessionMode mode);

public:
	explicit SessionTracker(const Settings & settings, const Clock & clock, QObject *parent = nullptr);

	SessionMode mode() const;
	bool isCounting() const;
	bool isClocking() const;
	bool isRunning() const;

	bool start();
	void pause();
	void toggleTimer();
	void startClock();
	void stopClock();
	void toggleClock();
	void stopAll();

	void begin();
	void finalize();
	const ActiveSession * activeSession() const;

	qint64 remainingSeconds() const;
	void setRemainingSeconds(qint64 seconds);
	qint64 clockOffsetSeconds() const;
	void setClockOffsetSeconds(qint64 seconds);
	qint64 goalSeconds() const;
	void setGoalSeconds(qint64 seconds);

public slots:
	void tick(int seconds = 1);

signals:
	void sessionFinalized(const LogEntry & entry);
	void countdownFinished();
	void modeChanged(SessionMode mode);
	void statusMessage(const QString & text);
};

#endif // SESSIONTRACKER_H
