#include "testcommon.h"
#include <QTextStream>

namespace TestCommon {

QString createSettingsFile(const QString& dirPath, int weekStartDay)
{
    QString settingsPath = QDir(dirPath).filePath("settings.ini");
    QSettings seed(settingsPath, QSettings::IniFormat);
    seed.setValue("totals/week_start_day", weekStartDay);
    seed.setValue("debug/log_to_file", false);
    seed.sync();
    return settingsPath;
}

bool writeCsv(const QString& path, const QStringList& lines)
{
    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate | QIODevice::Text))
        return false;
    QTextStream out(&file);
    out.setCodec("UTF-8");
    for (const auto& line : lines)
        out << line << "\n";
    out.flush();
    return out.status() == QTextStream::Ok;
}

QStringList readLines(const QString& path)
{
    QStringList lines;
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text))
        return lines;
    QTextStream in(&file);
    in.setCodec("UTF-8");
    while (!in.atEnd()) {
        const QString line = in.readLine();
        if (!line.trimmed().isEmpty())
            lines << line;
    }
    return lines;
}

QDateTime at(int year, int month, int day, int hour, int minute, int second)
{
    return QDateTime(QDate(year, month, day), QTime(hour, minute, second));
}

} // namespace TestCommon
