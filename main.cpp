#include <QCoreApplication>
#include <QCommandLineParser>
#include <QDebug>
#include <QDir>
#include <QSocketNotifier>
#include <QStandardPaths>
#include <QTextStream>
#include <QTimer>
#include <cstdio>

#include "clock.h"
#include "configrepository.h"
#include "helpers.h"
#include "logger.h"
#include "settings.h"
#include "timeengine.h"
#include "types.h"

namespace {

QTextStream &out()
{
	static QTextStream stream(stdout);
	return stream;
}

bool readMinutes(const QCommandLineParser &parser, const QString &option, qint64 *minutes)
{
	bool ok = false;
	*minutes = parser.value(option).toLongLong(&ok);
	if (!ok || *minutes < 0) {
		qWarning().noquote() << "Invalid number of minutes for --" + option + ":" << parser.value(option);
		return false;
	}
	return true;
}

void printReport(const TimeEngine &engine)
{
	const StreakResult streak = engine.streaks();
	out() << "Profile:        " << engine.activeProfile() << "\n"
		<< "Today:          " << formatDurationHms(engine.totalSecondsToday())
		<< " (" << engine.percentOfGoalToday() << " of " << formatDurationHm(engine.goalSeconds()) << ")\n"
		<< "Goal left:      " << formatDurationHms(engine.goalSecondsLeftToday()) << "\n"
		<< "This week:      " << formatDurationHm(engine.weekTotal()) << "\n"
		<< "This year:      " << formatDurationHm(engine.yearTotal()) << "\n"
		<< "Weekly average: " << formatDurationHm(engine.yearAveragePerWeek()) << "\n"
		<< "Streak:         " << streak.current << " days (longest " << streak.longest << ")\n";
	out().flush();
}

}

int main(int argc, char *argv[])
{
	QCoreApplication::setApplicationName("Countdown Master");
	QCoreApplication application(argc, argv);

	QCommandLineParser parser;
	parser.setApplicationDescription("Countdown timer and stopwatch that logs study time per profile.");
	parser.addHelpOption();
	parser.addOptions({
		{ "data-dir", "Directory holding the profile logs and settings.ini.", "path" },
		{ "profile", "Switch to the profile with this label.", "label" },
		{ "countdown", "Run a countdown of this many minutes.", "minutes" },
		{ "clock", "Run the stopwatch until a line is read on stdin." },
		{ "add", "Add this many minutes of manual time to today.", "minutes" },
		{ "at", "Start time of the added time.", "HH:mm" },
		{ "goal", "Set the daily goal of the active profile.", "minutes" },
		{ "report", "Print today's, the week's and the year's totals." },
	});
	parser.process(application);

	QString data_dir = parser.value("data-dir");
	if (data_dir.isEmpty())
		data_dir = QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
	if (!QDir().mkpath(data_dir)) {
		qWarning().noquote() << "Could not create data directory" << data_dir;
		return 1;
	}
	Logger::setDirectory(data_dir);

	IniConfigRepository repository(QDir(data_dir).filePath("settings.ini"));
	Settings settings(repository);
	SystemClock clock;
	TimeEngine engine(settings, repository, clock, data_dir);

	QObject::connect(&engine, &TimeEngine::statusMessage, [](const QString &text) {
		out() << text << "\n";
		out().flush();
	});

	if (parser.isSet("profile") && !engine.switchProfile(parser.value("profile")))
		return 1;

	if (parser.isSet("goal")) {
		qint64 minutes = 0;
		if (!readMinutes(parser, "goal", &minutes))
			return 1;
		engine.setGoal(minutes * 60);
	}

	if (parser.isSet("add")) {
		qint64 minutes = 0;
		if (!readMinutes(parser, "add", &minutes))
			return 1;
		QTime at = clock.now().time();
		if (parser.isSet("at")) {
			at = parseTimeOfDay(parser.value("at"));
			if (!at.isValid()) {
				qWarning().noquote() << "Invalid start time for --at:" << parser.value("at");
				return 1;
			}
		}
		if (!engine.addManualTime(clock.today(), at, minutes * 60))
			return 1;
	}

	bool run = false;
	if (parser.isSet("countdown")) {
		qint64 minutes = 0;
		if (!readMinutes(parser, "countdown", &minutes))
			return 1;
		engine.setRemainingSeconds(minutes * 60);
		run = engine.start();
	}
	else if (parser.isSet("clock")) {
		engine.startClock();
		run = true;
	}

	if (run) {
		QTimer timer;
		QObject::connect(&timer, SIGNAL(timeout()), &engine, SLOT(tick()));
		QObject::connect(&engine, SIGNAL(countdownFinished()), &application, SLOT(quit()));

		QSocketNotifier input(fileno(stdin), QSocketNotifier::Read);
		QObject::connect(&input, SIGNAL(activated(int)), &application, SLOT(quit()));

		timer.setInterval(1000);
		timer.start();
		application.exec();

		engine.pause();
		engine.stopClock();
	}

	if (parser.isSet("report") || (!run && !parser.isSet("add") && !parser.isSet("goal") && !parser.isSet("profile")))
		printReport(engine);

	return 0;
}
