#include "logger.h"
#include <QDateTime>
#include <QDir>
#include <QTextStream>
#include <QtDebug>

QString Logger::directory_;

Logger::Logger()
{
	logfile_ = new QFile();
	const QString dir = directory_.isEmpty() ? QDir::currentPath() : directory_;
	logfile_->setFileName(QDir(dir).filePath("countdownmaster.log"));
	if (!logfile_->open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text))
		qWarning() << "Could not open log file" << logfile_->fileName() << logfile_->errorString();
	log("Countdown Master Startup");
}

void Logger::setDirectory(const QString &path)
{
	directory_ = path;
}

void Logger::Log(const QString &text)
{
	static Logger L;
	L.log(text);
}

void Logger::Warn(const QString &text, bool to_file)
{
	// failures are never silent, even with file logging disabled
	qWarning().noquote() << text;
	if (to_file)
		Log(text);
}

void Logger::log(const QString &text)
{
	if (logfile_ == nullptr || !logfile_->isOpen())
		return;
	const QString msg = QDateTime::currentDateTime().toString("yyyy-MM-dd HH:mm:ss.zzz: ") + text + "\n";
	QTextStream out(logfile_);
	out.setCodec("UTF-8");
	out << msg;
	out.flush();
}

Logger::~Logger()
{
	log("Countdown Master Shutdown");
	if (logfile_ != nullptr) {
		logfile_->close();
		delete logfile_;
		logfile_ = nullptr;
	}
}
