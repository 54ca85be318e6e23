#ifndef TESTCOMMON_H
#define TESTCOMMON_H

#include <QtTest>
#include <deque>
#include <functional>
#include <memory>
#include <vector>
#include <QColor>
#include <QMap>
#include <QVector>
#include <QCoreApplication>
#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QSettings>
#include <QTemporaryDir>
#include <QtDebug>

// Expose private members for testing
#define private public
#define protected public
#include "sessiontracker.h"
#include "timeengine.h"
#undef private
#undef protected

#include "clock.h"
#include "configrepository.h"
#include "dailyaggregator.h"
#include "helpers.h"
#include "logstore.h"
#include "profilemanager.h"
#include "settings.h"
#include "streakcalculator.h"

namespace TestCommon {

// Clock whose "now" only moves when a test moves it
class FakeClock : public Clock
{
public:
    explicit FakeClock(const QDateTime& start) : now_(start) {}

    QDateTime now() const override { return now_; }
    void set(const QDateTime& when) { now_ = when; }
    void advance(qint64 seconds) { now_ = now_.addSecs(seconds); }

private:
    QDateTime now_;
};

// Creates a settings.ini in dirPath with file logging off
QString createSettingsFile(const QString& dirPath, int weekStartDay = 1);

// Writes raw CSV lines to a file, replacing whatever was there
bool writeCsv(const QString& path, const QStringList& lines);

// Reads a file back as its non-empty lines
QStringList readLines(const QString& path);

QDateTime at(int year, int month, int day, int hour, int minute, int second = 0);

} // namespace TestCommon

#endif // TESTCOMMON_H
