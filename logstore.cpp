#include "logstore.h"
#include <QFile>
#include <QFileInfo>
#include <QDir>
#include <QSaveFile>
#include <QTextStream>
#include <QHash>
#include <algorithm>
#include "helpers.h"
#include "logger.h"
#include "settings.h"

namespace {

QByteArray csvRow(const QString& date, const QString& start, const QString& end, qint64 duration, qint64 goal)
{
    const QStringList fields{ date, start, end, QString::number(duration), QString::number(goal) };
    return (joinCsvFields(fields) + "\n").toUtf8();
}

}

LogStore::LogStore(const Settings& settings, const QString& path)
    : settings_(settings), path_(path)
{ }

QStringList LogStore::canonicalHeader()
{
    return { "date", "start_time", "end_time", "duration_seconds", "goal_seconds" };
}

const QString& LogStore::path() const
{
    return path_;
}

bool LogStore::ensure()
{
    const QFileInfo info(path_);
    if (info.exists() && info.size() > 0) {
        return true;
    }

    QDir().mkpath(info.absolutePath());
    QSaveFile file(path_);
    if (!file.open(QIODevice::WriteOnly)) {
        Logger::Warn("[STORE] Could not create log file " + path_ + ": " + file.errorString(), settings_.logToFile());
        return false;
    }
    file.write((joinCsvFields(canonicalHeader()) + "\n").toUtf8());
    if (!file.commit()) {
        Logger::Warn("[STORE] Could not write header to " + path_ + ": " + file.errorString(), settings_.logToFile());
        return false;
    }

    if (settings_.logToFile())
        Logger::Log("[STORE] Created log file " + path_);
    return true;
}

LogLoadResult LogStore::load(qint64 fallback_goal_seconds)
{
    LogLoadResult result;
    ensure();

    QFile file(path_);
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        Logger::Warn("[STORE] Could not open log file " + path_ + ": " + file.errorString(), settings_.logToFile());
        return result;
    }

    QTextStream in(&file);
    in.setCodec("UTF-8");
    if (in.atEnd()) {
        return result;
    }

    QHash<QString, int> columns;
    const QStringList header = splitCsvLine(in.readLine());
    for (int i = 0; i < header.size(); ++i) {
        columns.insert(header.at(i).trimmed(), i);
    }
    if (!columns.contains("date") || !columns.contains("duration_seconds")) {
        Logger::Warn("[STORE] Unrecognized header in " + path_, settings_.logToFile());
        return result;
    }

    const bool has_start_time = columns.contains("start_time");
    const bool has_end_time = columns.contains("end_time");
    const bool has_goal_seconds = columns.contains("goal_seconds");
    result.needsMigration = columns.contains("time") || !has_start_time || !has_end_time || !has_goal_seconds;

    const qint64 fallback_goal = std::max<qint64>(0, fallback_goal_seconds);
    int skipped = 0;

    while (!in.atEnd()) {
        const QString line = in.readLine();
        if (line.trimmed().isEmpty()) {
            continue;
        }
        const QStringList fields = splitCsvLine(line);
        auto field = [&](const char* name) -> QString {
            const int idx = columns.value(QLatin1String(name), -1);
            return (idx >= 0 && idx < fields.size()) ? fields.at(idx).trimmed() : QString();
        };

        const QString date_key = field("date");
        if (date_key.isEmpty() || !dateFromKey(date_key).isValid()) {
            ++skipped;
            continue;
        }

        bool ok = false;
        const qint64 duration = field("duration_seconds").toLongLong(&ok);
        if (!ok) {
            ++skipped;
            continue;
        }

        qint64 goal_seconds = fallback_goal;
        if (has_goal_seconds) {
            const QString goal_str = field("goal_seconds");
            bool goal_ok = false;
            const qint64 parsed = goal_str.toLongLong(&goal_ok);
            if (goal_ok) {
                goal_seconds = std::max<qint64>(0, parsed);
            }
            else {
                result.needsMigration = true;
            }
        }

        QString start_time = has_start_time ? field("start_time") : field("time");
        QString end_time = has_end_time ? field("end_time") : QString();
        if (start_time.isEmpty()) {
            start_time = QStringLiteral("N/A");
            result.needsMigration = true;
        }

        const bool marker = duration == 0 && start_time == QLatin1String("goal")
            && (end_time.isEmpty() || end_time == QLatin1String("goal"));
        if (marker) {
            end_time = QStringLiteral("goal");
        }
        else if (end_time.isEmpty()) {
            end_time = (start_time == QLatin1String("N/A")) ? QStringLiteral("N/A") : computeEndTime(start_time, duration);
            result.needsMigration = true;
        }

        if (duration <= 0 && !marker) {
            ++skipped;
            continue;
        }

        result.goals[date_key] = goal_seconds;
        result.entries.emplace_back(LogEntry(date_key, start_time, end_time, duration, goal_seconds));
        if (!marker) {
            result.totals[date_key] += duration;
        }
    }

    if (settings_.logToFile()) {
        Logger::Log(QString("[STORE] Loaded %1 entries from %2 (skipped %3, migration %4)")
            .arg(result.entries.size()).arg(path_).arg(skipped).arg(result.needsMigration ? "needed" : "not needed"));
    }
    return result;
}

bool LogStore::append(const LogEntry& entry)
{
    return append(entry.date, entry.startTime, entry.endTime, entry.durationSeconds, std::max<qint64>(0, entry.goalSeconds));
}

bool LogStore::append(const QString& date, const QString& start, const QString& end, qint64 duration, qint64 goal)
{
    if (!ensure()) {
        return false;
    }

    QFile file(path_);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Append)) {
        Logger::Warn("[STORE] Could not open " + path_ + " for append: " + file.errorString(), settings_.logToFile());
        return false;
    }

    const QByteArray row = csvRow(date, start, end, duration, goal);
    if (file.write(row) != row.size() || !file.flush()) {
        Logger::Warn("[STORE] Error appending to " + path_ + ": " + file.errorString(), settings_.logToFile());
        return false;
    }

    if (settings_.logToFile())
        Logger::Log(QString("[STORE] Appended %1 %2-%3 %4s (goal %5s)").arg(date, start, end).arg(duration).arg(goal));
    return true;
}

bool LogStore::rewrite(const std::deque<LogEntry>& entries, const DailyGoals& goals)
{
    QDir().mkpath(QFileInfo(path_).absolutePath());
    QSaveFile file(path_);
    if (!file.open(QIODevice::WriteOnly)) {
        Logger::Warn("[STORE] Could not open " + path_ + " for rewrite: " + file.errorString(), settings_.logToFile());
        return false;
    }

    file.write((joinCsvFields(canonicalHeader()) + "\n").toUtf8());
    for (const auto& e : entries) {
        const qint64 goal = e.hasGoal() ? e.goalSeconds : goals.value(e.date, 0);
        const QString start = e.startTime.isEmpty() ? QStringLiteral("N/A") : e.startTime;
        const QString end = e.endTime.isEmpty() ? QStringLiteral("N/A") : e.endTime;
        file.write(csvRow(e.date, start, end, e.durationSeconds, goal));
    }

    // nothing replaces the old file unless every row made it
    if (!file.commit()) {
        Logger::Warn("[STORE] Error rewriting " + path_ + ": " + file.errorString(), settings_.logToFile());
        return false;
    }

    if (settings_.logToFile())
        Logger::Log(QString("[STORE] Rewrote %1 with %2 entries").arg(path_).arg(entries.size()));
    return true;
}
