#include "timeengine.h"
#include <QtDebug>
#include <algorithm>
#include <cstddef>
#include "clock.h"
#include "helpers.h"
#include "logger.h"

TimeEngine::TimeEngine(const Settings & settings, ConfigRepository & repo, const Clock & clock, const QString & data_dir, QObject *parent)
	: QObject(parent), settings_(settings), clock_(clock),
	profiles_(repo, settings, data_dir),
	tracker_(settings, clock),
	aggregator_(clock, &tracker_),
	streaks_(aggregator_),
	has_pending_undo_(false), last_added_index_(0)
{
	connect(&tracker_, &SessionTracker::sessionFinalized, this, &TimeEngine::recordSession);
	connect(&tracker_, &SessionTracker::statusMessage, this, &TimeEngine::statusMessage);
	connect(&tracker_, &SessionTracker::countdownFinished, this, &TimeEngine::countdownFinished);

	migrateProfileLogs();
	loadActiveProfile();
}

TimeEngine::~TimeEngine()
{
	// close whatever is still running so the elapsed time reaches the log
	tracker_.stopAll();
	if (settings_.logToFile())
		Logger::Log("[ENGINE] Engine shut down with profile " + profiles_.activeProfile());
}

QString TimeEngine::todayKey() const
{
	return dateKey(clock_.today());
}

void TimeEngine::migrateProfileLogs()
{
	for (const auto & label : profiles_.labels()) {
		LogStore store(settings_, profiles_.filePath(label));
		const LogLoadResult result = store.load(profiles_.goalSeconds(label));
		if (!result.needsMigration)
			continue;
		if (store.rewrite(result.entries, result.goals)) {
			if (settings_.logToFile())
				Logger::Log("[ENGINE] Migrated log of profile " + label);
		}
		else {
			Logger::Warn("[ENGINE] Migration of profile " + label + " failed, keeping the old layout", settings_.logToFile());
		}
	}
}

void TimeEngine::loadActiveProfile()
{
	const QString label = profiles_.activeProfile();
	const qint64 goal = profiles_.goalSeconds(label);
	tracker_.setGoalSeconds(goal);
	aggregator_.setLiveGoalSeconds(goal);

	store_.reset(new LogStore(settings_, profiles_.filePath(label)));
	LogLoadResult result = store_->load(goal);
	if (result.needsMigration && !store_->rewrite(result.entries, result.goals))
		Logger::Warn("[ENGINE] Could not rewrite " + store_->path() + " in the current layout", settings_.logToFile());

	entries_ = std::move(result.entries);
	aggregator_.reset(result.totals, result.goals);
	discardPendingUndo();
	tracker_.setClockOffsetSeconds(0);

	if (settings_.logToFile()) {
		Logger::Log(QString("[ENGINE] Loaded profile %1 (%2 entries, goal %3)")
			.arg(label).arg(entries_.size()).arg(convSecToTimeStr(goal)));
	}
	emit profileChanged(label);
	emit totalsChanged();
}

void TimeEngine::discardPendingUndo()
{
	has_pending_undo_ = false;
	last_added_entry_ = LogEntry();
	last_added_index_ = 0;
}

void TimeEngine::recordSession(const LogEntry & entry)
{
	aggregator_.setDailyGoal(entry.date, entry.goalSeconds);
	if (!store_->append(entry))
		Logger::Warn("[ENGINE] Session of " + entry.date + " kept in memory only", settings_.logToFile());
	entries_.push_back(entry);
	aggregator_.addDuration(entry.date, entry.durationSeconds);
	emit totalsChanged();
}

void TimeEngine::tick()
{
	tracker_.tick();
}

bool TimeEngine::start()
{
	return tracker_.start();
}

void TimeEngine::pause()
{
	tracker_.pause();
}

void TimeEngine::toggleTimer()
{
	tracker_.toggleTimer();
}

void TimeEngine::startClock()
{
	tracker_.startClock();
}

void TimeEngine::stopClock()
{
	tracker_.stopClock();
}

void TimeEngine::toggleClock()
{
	tracker_.toggleClock();
}

void TimeEngine::resetClock()
{
	tracker_.setClockOffsetSeconds(totalSecondsToday());
	emit statusMessage("Clock reset");
}

void TimeEngine::setRemainingSeconds(qint64 seconds)
{
	tracker_.setRemainingSeconds(seconds);
}

void TimeEngine::setGoal(qint64 seconds)
{
	// goals are kept in whole minutes
	const qint64 goal = std::max<qint64>(0, seconds) / 60 * 60;
	profiles_.setGoalSeconds(profiles_.activeProfile(), goal);
	tracker_.setGoalSeconds(goal);
	aggregator_.setLiveGoalSeconds(goal);

	const QString key = todayKey();
	if (aggregator_.setDailyGoal(key, goal)) {
		const LogEntry marker(key, "goal", "goal", 0, goal);
		if (!store_->append(marker))
			Logger::Warn("[ENGINE] Goal change of " + key + " kept in memory only", settings_.logToFile());
		entries_.push_back(marker);
	}
	if (settings_.logToFile())
		Logger::Log("[ENGINE] Daily goal set to " + convSecToTimeStr(goal));
	emit statusMessage("Daily super goal set");
	emit totalsChanged();
}

bool TimeEngine::addManualTime(const QDate & date, const QTime & start_time, qint64 duration_seconds)
{
	if (duration_seconds <= 0) {
		emit statusMessage("Add time needs hours or minutes");
		return false;
	}
	if (!date.isValid()) {
		emit statusMessage("Add time needs a valid date");
		return false;
	}

	const QString key = dateKey(date);
	QString start_str = QStringLiteral("N/A");
	QString end_str = QStringLiteral("N/A");
	if (start_time.isValid()) {
		// seconds are dropped from the picked time
		const QTime start(start_time.hour(), start_time.minute(), 0);
		start_str = start.toString("HH:mm:ss");
		end_str = start.addSecs(static_cast<int>(duration_seconds % 86400)).toString("HH:mm:ss");
	}

	const qint64 goal = aggregator_.goalSecondsForDate(key);
	aggregator_.setDailyGoal(key, goal);

	const LogEntry entry(key, start_str, end_str, duration_seconds, goal);
	if (!store_->append(entry))
		Logger::Warn("[ENGINE] Added time of " + key + " kept in memory only", settings_.logToFile());
	entries_.push_back(entry);
	aggregator_.addDuration(key, duration_seconds);

	last_added_entry_ = entry;
	last_added_index_ = entries_.size() - 1;
	has_pending_undo_ = true;

	if (settings_.logToFile())
		Logger::Log(QString("[ENGINE] Added %1 on %2 at %3").arg(convSecToTimeStr(duration_seconds), key, start_str));
	emit statusMessage(key == todayKey() ? QStringLiteral("Added time to today") : "Added time to " + key);
	emit totalsChanged();
	return true;
}

bool TimeEngine::undoLastAddedTime()
{
	if (!has_pending_undo_) {
		emit statusMessage("No added time to undo");
		return false;
	}

	auto target = entries_.end();
	if (last_added_index_ < entries_.size() && entries_[last_added_index_] == last_added_entry_)
		target = entries_.begin() + static_cast<std::ptrdiff_t>(last_added_index_);
	else
		target = std::find(entries_.begin(), entries_.end(), last_added_entry_);

	const LogEntry removed = last_added_entry_;
	discardPendingUndo();

	if (target == entries_.end()) {
		Logger::Warn("[ENGINE] Undo target " + removed.date + " " + removed.startTime + " not found", settings_.logToFile());
		emit statusMessage("Undo failed: entry not found");
		return false;
	}

	entries_.erase(target);
	aggregator_.removeDuration(removed.date, removed.durationSeconds);
	if (!store_->rewrite(entries_, aggregator_.goals()))
		Logger::Warn("[ENGINE] Undo of " + removed.date + " not written to " + store_->path(), settings_.logToFile());

	if (settings_.logToFile())
		Logger::Log(QString("[ENGINE] Undid %1 on %2").arg(convSecToTimeStr(removed.durationSeconds), removed.date));
	emit statusMessage("Undid added time");
	emit totalsChanged();
	return true;
}

bool TimeEngine::hasPendingUndo() const
{
	return has_pending_undo_;
}

bool TimeEngine::switchProfile(const QString & label)
{
	const QString target = profiles_.canonicalLabel(label);
	if (target.isEmpty()) {
		emit statusMessage(ProfileManager::errorMessage(ProfileError::UnknownProfile));
		return false;
	}
	if (target == profiles_.activeProfile())
		return true;

	// running time belongs to the profile it was measured under
	tracker_.stopAll();
	const ProfileError error = profiles_.switchTo(target);
	if (error != ProfileError::None) {
		emit statusMessage(ProfileManager::errorMessage(error));
		return false;
	}
	loadActiveProfile();
	emit statusMessage("Profile: " + target);
	return true;
}

ProfileError TimeEngine::addProfile(const QString & label)
{
	const ProfileError error = profiles_.addProfile(label, aggregator_.liveGoalSeconds());
	if (error != ProfileError::None) {
		emit statusMessage(ProfileManager::errorMessage(error));
		return error;
	}
	switchProfile(ProfileManager::normalizeLabel(label));
	return ProfileError::None;
}

ProfileError TimeEngine::deleteProfile(const QString & label)
{
	const bool was_active = profiles_.canonicalLabel(label) == profiles_.activeProfile();
	if (was_active && !profiles_.isBuiltIn(label))
		tracker_.stopAll();

	const ProfileError error = profiles_.deleteProfile(label);
	if (error != ProfileError::None) {
		emit statusMessage(ProfileManager::errorMessage(error));
		return error;
	}
	if (was_active)
		loadActiveProfile();
	emit statusMessage("Profile deleted");
	return ProfileError::None;
}

ProfileError TimeEngine::setProfileColor(const QString & label, const QColor & color)
{
	const ProfileError error = profiles_.setProfileColor(label, color);
	if (error != ProfileError::None)
		emit statusMessage(ProfileManager::errorMessage(error));
	return error;
}

const QString & TimeEngine::activeProfile() const
{
	return profiles_.activeProfile();
}

QColor TimeEngine::profileColor(const QString & label) const
{
	return profiles_.profileColor(label);
}

const ProfileManager & TimeEngine::profiles() const
{
	return profiles_;
}

SessionMode TimeEngine::mode() const
{
	return tracker_.mode();
}

qint64 TimeEngine::remainingSeconds() const
{
	return tracker_.remainingSeconds();
}

qint64 TimeEngine::clockDisplaySeconds() const
{
	return std::max<qint64>(0, totalSecondsToday() - tracker_.clockOffsetSeconds());
}

qint64 TimeEngine::goalSeconds() const
{
	return aggregator_.liveGoalSeconds();
}

qint64 TimeEngine::totalSecondsForDay(const QDate & date) const
{
	return aggregator_.totalSecondsForDay(dateKey(date));
}

qint64 TimeEngine::totalSecondsToday() const
{
	return aggregator_.totalSecondsForDay(todayKey());
}

qint64 TimeEngine::goalSecondsForDate(const QDate & date) const
{
	return aggregator_.goalSecondsForDate(dateKey(date));
}

qint64 TimeEngine::goalSecondsLeftToday() const
{
	return aggregator_.goalSecondsLeft(todayKey());
}

QString TimeEngine::percentOfGoalToday() const
{
	const QString key = todayKey();
	return DailyAggregator::percentOfGoal(aggregator_.totalSecondsForDay(key), aggregator_.goalSecondsForDate(key));
}

qint64 TimeEngine::weekTotal() const
{
	return aggregator_.weekTotal(clock_.today(), settings_.getWeekEndDay());
}

qint64 TimeEngine::yearTotal() const
{
	return aggregator_.yearTotal(clock_.today().year());
}

qint64 TimeEngine::yearAveragePerWeek() const
{
	return aggregator_.yearAveragePerWeek(clock_.today());
}

StreakResult TimeEngine::streaks() const
{
	return streaks_.calculate(clock_.today());
}

QMap<QString, bool> TimeEngine::goalMetStream(int year) const
{
	return streaks_.goalMetStream(year);
}

DayProgress TimeEngine::dayProgress(const QDate & date) const
{
	return aggregator_.dayProgress(dateKey(date));
}

QVector<qint64> TimeEngine::dailyValues(int days) const
{
	return aggregator_.dailyValues(clock_.today(), days);
}

QVector<qint64> TimeEngine::monthlyValues(int months) const
{
	return aggregator_.monthlyValues(clock_.today(), months);
}

const std::deque<LogEntry> & TimeEngine::entries() const
{
	return entries_;
}

std::deque<LogEntry> TimeEngine::entriesForProfile(const QString & label) const
{
	const QString existing = profiles_.canonicalLabel(label);
	if (existing.isEmpty())
		return std::deque<LogEntry>();
	if (existing == profiles_.activeProfile())
		return entries_;

	LogStore store(settings_, profiles_.filePath(existing));
	return store.load(0).entries;
}

DailyTotals TimeEngine::combinedTotals() const
{
	DailyTotals combined;
	for (const auto & label : profiles_.labels()) {
		DailyTotals totals;
		if (label == profiles_.activeProfile()) {
			totals = aggregator_.totals();
		}
		else {
			LogStore store(settings_, profiles_.filePath(label));
			totals = store.load(0).totals;
		}
		for (auto it = totals.constBegin(); it != totals.constEnd(); ++it)
			combined[it.key()] += it.value();
	}
	return combined;
}

const DailyAggregator & TimeEngine::aggregator() const
{
	return aggregator_;
}

const SessionTracker & TimeEngine::tracker() const
{
	return tracker_;
}
