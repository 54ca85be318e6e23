#include "helpers.h"
#include <algorithm>
#include <cmath>


QString dateKey(const QDate &date)
{
	return date.toString("yyyy-MM-dd");
}

QDate dateFromKey(const QString &key)
{
	return QDate::fromString(key, "yyyy-MM-dd");
}

qint64 convHmToSec(const int hours, const int minutes)
{
	return std::max<qint64>(0, static_cast<qint64>(hours) * 3600 + static_cast<qint64>(minutes) * 60);
}

QString convSecToTimeStr(const qint64 &seconds)
{
	const qint64 total = std::max<qint64>(0, seconds);
	return QString("%1:%2:%3")
		.arg(total / 3600, 2, 10, QChar('0'))
		.arg((total % 3600) / 60, 2, 10, QChar('0'))
		.arg(total % 60, 2, 10, QChar('0'));
}

QString formatDurationHm(const qint64 &seconds)
{
	return QString("%1h %2m").arg(seconds / 3600).arg((seconds % 3600) / 60);
}

QString formatDurationHms(const qint64 &seconds)
{
	return QString("%1h %2m %3s").arg(seconds / 3600).arg((seconds % 3600) / 60).arg(seconds % 60);
}

QString formatPercent(const qint64 part_seconds, const qint64 goal_seconds)
{
	if (goal_seconds <= 0)
		return QStringLiteral("N/A");
	const double percent = (static_cast<double>(part_seconds) / static_cast<double>(goal_seconds)) * 100.0;
	return QString::number(qRound64(percent)) + "%";
}

QTime parseTimeOfDay(const QString &time_str)
{
	QTime time = QTime::fromString(time_str, "HH:mm:ss");
	if (!time.isValid())
		time = QTime::fromString(time_str, "HH:mm");
	return time;
}

QString computeEndTime(const QString &start_time, const qint64 duration)
{
	const QTime start = parseTimeOfDay(start_time);
	if (!start.isValid())
		return QStringLiteral("N/A");
	return start.addSecs(static_cast<int>(duration % 86400)).toString("HH:mm:ss");
}

QStringList splitCsvLine(const QString &line)
{
	// RFC 4180 fields; a doubled quote inside a quoted field is a literal quote
	QStringList fields;
	QString current;
	bool quoted = false;
	for (int i = 0; i < line.size(); ++i) {
		const QChar c = line.at(i);
		if (quoted) {
			if (c == '"') {
				if (i + 1 < line.size() && line.at(i + 1) == '"') {
					current += '"';
					++i;
				}
				else {
					quoted = false;
				}
			}
			else {
				current += c;
			}
		}
		else if (c == '"') {
			quoted = true;
		}
		else if (c == ',') {
			fields << current;
			current.clear();
		}
		else {
			current += c;
		}
	}
	fields << current;
	return fields;
}

QString joinCsvFields(const QStringList &fields)
{
	QStringList escaped;
	for (const auto& field : fields) {
		if (field.contains(',') || field.contains('"') || field.contains('\n') || field.contains('\r')) {
			QString copy = field;
			copy.replace("\"", "\"\"");
			escaped << ("\"" + copy + "\"");
		}
		else {
			escaped << field;
		}
	}
	return escaped.join(',');
}
