#ifndef LOGGER_H
#define LOGGER_H

#include <QString>
#include <QFile>

class Logger
{
	QFile *logfile_;
	static QString directory_;

	Logger();
	void log(const QString & text);

public:
	static void setDirectory(const QString & path);
	static void Log(const QString & text);
	static void Warn(const QString & text, bool to_file);
	~Logger();
};

#endif // LOGGER_H
