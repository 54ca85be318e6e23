#include "sessiontracker.h"
#include <QtDebug>
#include <algorithm>
#include "clock.h"
#include "helpers.h"
#include "logger.h"

namespace {

const char *modeName(SessionMode mode)
{
	switch (mode) {
	case SessionMode::Counting: return "Counting";
	case SessionMode::Clocking: return "Clocking";
	default: return "Idle";
	}
}

}

SessionTracker::SessionTracker(const Settings &settings, const Clock &clock, QObject *parent)
	: QObject(parent), settings_(settings), clock_(clock), mode_(SessionMode::Idle),
	session_{ QDateTime(), 0, QString() }, session_open_(false),
	remaining_seconds_(0), clock_offset_seconds_(0), goal_seconds_(0)
{ }

SessionMode SessionTracker::mode() const
{
	return mode_;
}

bool SessionTracker::isCounting() const
{
	return mode_ == SessionMode::Counting;
}

bool SessionTracker::isClocking() const
{
	return mode_ == SessionMode::Clocking;
}

bool SessionTracker::isRunning() const
{
	return mode_ != SessionMode::Idle;
}

void SessionTracker::setMode(SessionMode mode)
{
	if (mode_ == mode)
		return;
	if (settings_.logToFile())
		Logger::Log(QString("[DEBUG] Mode %1 -> %2").arg(modeName(mode_), modeName(mode)));
	mode_ = mode;
	emit modeChanged(mode_);
}

bool SessionTracker::start()
{
	// Counting and Clocking never run together
	if (mode_ == SessionMode::Clocking)
		stopClockInternal("Clock off");

	if (mode_ == SessionMode::Counting) {
		if (settings_.logToFile())
			Logger::Log("[DEBUG] Trying to start countdown while already counting");
		return true;
	}

	if (remaining_seconds_ <= 0) {
		emit statusMessage("Set a goal time first");
		return false;
	}

	setMode(SessionMode::Counting);
	begin();
	if (settings_.logToFile())
		Logger::Log("[TIMER] >> Countdown started with " + convSecToTimeStr(remaining_seconds_) + " remaining");
	emit statusMessage("Counting down");
	return true;
}

void SessionTracker::pause()
{
	stopCountdown("Paused");
}

void SessionTracker::toggleTimer()
{
	if (mode_ == SessionMode::Counting)
		pause();
	else
		start();
}

void SessionTracker::startClock()
{
	if (mode_ == SessionMode::Clocking)
		return;
	if (mode_ == SessionMode::Counting)
		stopCountdown("Paused");

	setMode(SessionMode::Clocking);
	begin();
	if (settings_.logToFile())
		Logger::Log("[TIMER] >> Clock started");
	emit statusMessage("Clocking");
}

void SessionTracker::stopClock()
{
	stopClockInternal("Clock off");
}

void SessionTracker::toggleClock()
{
	if (mode_ == SessionMode::Clocking)
		stopClock();
	else
		startClock();
}

void SessionTracker::stopAll()
{
	if (mode_ == SessionMode::Counting)
		stopCountdown("Paused");
	if (mode_ == SessionMode::Clocking)
		stopClockInternal("Clock off");
}

void SessionTracker::stopCountdown(const QString &status_text)
{
	if (mode_ != SessionMode::Counting)
		return;
	setMode(SessionMode::Idle);
	finalize();
	if (settings_.logToFile())
		Logger::Log("[TIMER] Countdown paused <");
	emit statusMessage(status_text);
}

void SessionTracker::stopClockInternal(const QString &status_text)
{
	if (mode_ != SessionMode::Clocking)
		return;
	setMode(SessionMode::Idle);
	finalize();
	if (settings_.logToFile())
		Logger::Log("[TIMER] Clock stopped <<");
	emit statusMessage(status_text);
}

void SessionTracker::handleTimeUp()
{
	setMode(SessionMode::Idle);
	remaining_seconds_ = 0;
	finalize();
	if (settings_.logToFile())
		Logger::Log("[TIMER] Countdown reached zero");
	emit statusMessage("Time's up!");
	emit countdownFinished();
}

void SessionTracker::tick(int seconds)
{
	for (int i = 0; i < seconds; ++i)
		tickOnce();
}

void SessionTracker::tickOnce()
{
	if (mode_ == SessionMode::Clocking) {
		recordProgress(1);
		return;
	}
	if (mode_ != SessionMode::Counting)
		return;

	if (remaining_seconds_ <= 0) {
		handleTimeUp();
		return;
	}
	--remaining_seconds_;
	recordProgress(1);
	if (remaining_seconds_ <= 0)
		handleTimeUp();
}

void SessionTracker::recordProgress(qint64 seconds)
{
	if (seconds <= 0)
		return;
	if (!session_open_)
		begin();

	const QDateTime now = clock_.now();
	const QString current_key = dateKey(now.date());
	if (session_.dateKey != current_key) {
		// Midnight was crossed - flush what belongs to the old day and start over
		if (settings_.logToFile()) {
			Logger::Log(QString("[TIMER] Crossing detected! Anchor: %1, Now: %2")
				.arg(session_.dateKey, now.toString("yyyy-MM-dd HH:mm:ss")));
		}
		const QDate anchor = dateFromKey(session_.dateKey);
		finalizeAt(anchor.isValid() ? QDateTime(anchor, QTime(23, 59, 59)) : now);
		begin();
		clock_offset_seconds_ = 0;
	}
	session_.accumulatedSeconds += seconds;
}

void SessionTracker::begin()
{
	session_.start = clock_.now();
	session_.accumulatedSeconds = 0;
	session_.dateKey = dateKey(session_.start.date());
	session_open_ = true;
	if (settings_.logToFile())
		Logger::Log("[DEBUG] Session opened for " + session_.dateKey);
}

void SessionTracker::finalize()
{
	finalizeAt(clock_.now());
}

void SessionTracker::finalizeAt(const QDateTime &end)
{
	if (!session_open_)
		return;

	const ActiveSession closed = session_;
	session_open_ = false;
	session_ = ActiveSession{ QDateTime(), 0, QString() };

	// a session without elapsed time leaves no trace
	if (closed.accumulatedSeconds <= 0 || closed.dateKey.isEmpty()) {
		if (settings_.logToFile())
			Logger::Log("[DEBUG] Discarding empty session");
		return;
	}

	const LogEntry entry(closed.dateKey,
		closed.start.time().toString("HH:mm:ss"),
		end.time().toString("HH:mm:ss"),
		closed.accumulatedSeconds,
		goal_seconds_);
	if (settings_.logToFile()) {
		Logger::Log(QString("[TIMER] Session finalized: %1 %2-%3, %4")
			.arg(entry.date, entry.startTime, entry.endTime, convSecToTimeStr(entry.durationSeconds)));
	}
	emit sessionFinalized(entry);
}

const ActiveSession *SessionTracker::activeSession() const
{
	return session_open_ ? &session_ : nullptr;
}

qint64 SessionTracker::remainingSeconds() const
{
	return remaining_seconds_;
}

void SessionTracker::setRemainingSeconds(qint64 seconds)
{
	remaining_seconds_ = std::max<qint64>(0, seconds);
}

qint64 SessionTracker::clockOffsetSeconds() const
{
	return clock_offset_seconds_;
}

void SessionTracker::setClockOffsetSeconds(qint64 seconds)
{
	clock_offset_seconds_ = std::max<qint64>(0, seconds);
}

qint64 SessionTracker::goalSeconds() const
{
	return goal_seconds_;
}

void SessionTracker::setGoalSeconds(qint64 seconds)
{
	goal_seconds_ = std::max<qint64>(0, seconds);
}
