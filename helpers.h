#ifndef HELPERS
#define HELPERS

#include <QtGlobal>
#include <QString>
#include <QStringList>
#include <QDate>
#include <QTime>


QString dateKey(const QDate &date);

QDate dateFromKey(const QString &key);

qint64 convHmToSec(const int hours, const int minutes);

QString convSecToTimeStr(const qint64 &seconds);

QString formatDurationHm(const qint64 &seconds);

QString formatDurationHms(const qint64 &seconds);

QString formatPercent(const qint64 part_seconds, const qint64 goal_seconds);

QTime parseTimeOfDay(const QString &time_str);

QString computeEndTime(const QString &start_time, const qint64 duration);

QStringList splitCsvLine(const QString &line);

QString joinCsvFields(const QStringList &fields);

#endif // HELPERS
