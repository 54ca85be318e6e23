#include "test_integration.h"
#include <QtTest>

using TestCommon::FakeClock;
using TestCommon::at;
using TestCommon::createSettingsFile;
using TestCommon::readLines;
using TestCommon::writeCsv;

namespace {

const QString kHeader = "date,start_time,end_time,duration_seconds,goal_seconds";

}

void IntegrationTest::test_integration_session_logged_and_reloaded()
{
    QTemporaryDir tempDir;
    QVERIFY(tempDir.isValid());
    IniConfigRepository repo(createSettingsFile(tempDir.path()));
    Settings settings(repo);
    FakeClock clock(at(2024, 5, 6, 10, 0));
    const QString path = QDir(tempDir.path()).filePath("active.csv");

    {
        TimeEngine engine(settings, repo, clock, tempDir.path());
        engine.setRemainingSeconds(120);
        QVERIFY(engine.start());
        clock.advance(40);
        for (int i = 0; i < 40; ++i)
            engine.tick();
        QCOMPARE(engine.remainingSeconds(), qint64(80));
        QCOMPARE(engine.totalSecondsToday(), qint64(40));
        engine.pause();
        QCOMPARE(engine.entries().size(), size_t(1));

        // a running clock is finalized when the engine goes away
        engine.startClock();
        clock.advance(20);
        for (int i = 0; i < 20; ++i)
            engine.tick();
    }

    QCOMPARE(readLines(path), QStringList({
        kHeader,
        "2024-05-06,10:00:00,10:00:40,40,7200",
        "2024-05-06,10:00:40,10:01:00,20,7200" }));

    TimeEngine reloaded(settings, repo, clock, tempDir.path());
    QCOMPARE(reloaded.totalSecondsToday(), qint64(60));
    QCOMPARE(reloaded.entries().size(), size_t(2));
    QCOMPARE(reloaded.goalSecondsLeftToday(), qint64(7140));
}

void IntegrationTest::test_integration_add_and_undo_manual_time()
{
    QTemporaryDir tempDir;
    QVERIFY(tempDir.isValid());
    IniConfigRepository repo(createSettingsFile(tempDir.path()));
    Settings settings(repo);
    FakeClock clock(at(2024, 5, 6, 12, 0));
    const QString path = QDir(tempDir.path()).filePath("active.csv");

    TimeEngine engine(settings, repo, clock, tempDir.path());
    QStringList status;
    connect(&engine, &TimeEngine::statusMessage, [&status](const QString& m) { status << m; });

    QVERIFY(!engine.addManualTime(QDate(2024, 5, 6), QTime(9, 0), 0));
    QCOMPARE(status.last(), QString("Add time needs hours or minutes"));
    QCOMPARE(readLines(path), QStringList({ kHeader }));

    const qint64 before = engine.totalSecondsToday();
    QVERIFY(engine.addManualTime(QDate(2024, 5, 6), QTime(9, 15, 42), 1800));
    QCOMPARE(status.last(), QString("Added time to today"));
    QCOMPARE(engine.totalSecondsToday(), before + 1800);
    QVERIFY(engine.hasPendingUndo());
    QCOMPARE(readLines(path).last(), QString("2024-05-06,09:15:00,09:45:00,1800,7200"));

    QVERIFY(engine.undoLastAddedTime());
    QCOMPARE(engine.totalSecondsToday(), before);
    QVERIFY(engine.entries().empty());
    QCOMPARE(readLines(path), QStringList({ kHeader }));

    QVERIFY(!engine.undoLastAddedTime());
    QCOMPARE(status.last(), QString("No added time to undo"));

    // a day in the past has no goal of its own
    QVERIFY(engine.addManualTime(QDate(2024, 5, 1), QTime(20, 0), 600));
    QCOMPARE(status.last(), QString("Added time to 2024-05-01"));
    QCOMPARE(readLines(path).last(), QString("2024-05-01,20:00:00,20:10:00,600,0"));
    QCOMPARE(engine.totalSecondsForDay(QDate(2024, 5, 1)), qint64(600));
}

void IntegrationTest::test_integration_undo_discarded_on_switch()
{
    QTemporaryDir tempDir;
    QVERIFY(tempDir.isValid());
    IniConfigRepository repo(createSettingsFile(tempDir.path()));
    Settings settings(repo);
    FakeClock clock(at(2024, 5, 6, 12, 0));

    TimeEngine engine(settings, repo, clock, tempDir.path());
    QStringList status;
    connect(&engine, &TimeEngine::statusMessage, [&status](const QString& m) { status << m; });

    QVERIFY(engine.addManualTime(QDate(2024, 5, 6), QTime(9, 0), 900));
    QVERIFY(engine.switchProfile("Output"));
    QVERIFY(engine.switchProfile("Activate Immersion"));

    QVERIFY(!engine.undoLastAddedTime());
    QCOMPARE(status.last(), QString("No added time to undo"));
    QCOMPARE(engine.totalSecondsToday(), qint64(900));
}

void IntegrationTest::test_integration_switch_finalizes_old_profile()
{
    QTemporaryDir tempDir;
    QVERIFY(tempDir.isValid());
    IniConfigRepository repo(createSettingsFile(tempDir.path()));
    Settings settings(repo);
    FakeClock clock(at(2024, 5, 6, 12, 0));

    TimeEngine engine(settings, repo, clock, tempDir.path());
    QStringList status;
    connect(&engine, &TimeEngine::statusMessage, [&status](const QString& m) { status << m; });

    engine.startClock();
    clock.advance(60);
    for (int i = 0; i < 60; ++i)
        engine.tick();

    QVERIFY(engine.switchProfile("output"));
    QCOMPARE(engine.activeProfile(), QString("Output"));
    QCOMPARE(status.last(), QString("Profile: Output"));
    QCOMPARE(engine.mode(), SessionMode::Idle);
    QCOMPARE(engine.totalSecondsToday(), qint64(0));
    QCOMPARE(repo.value("profiles/active").toString(), QString("Output"));

    QCOMPARE(readLines(QDir(tempDir.path()).filePath("active.csv")).size(), 2);
    QCOMPARE(readLines(QDir(tempDir.path()).filePath("output.csv")), QStringList({ kHeader }));
    QCOMPARE(engine.entriesForProfile("Activate Immersion").size(), size_t(1));

    QVERIFY(!engine.switchProfile("Nope"));
    QCOMPARE(engine.activeProfile(), QString("Output"));
}

void IntegrationTest::test_integration_delete_active_profile_falls_back()
{
    QTemporaryDir tempDir;
    QVERIFY(tempDir.isValid());
    IniConfigRepository repo(createSettingsFile(tempDir.path()));
    Settings settings(repo);
    FakeClock clock(at(2024, 5, 6, 12, 0));

    TimeEngine engine(settings, repo, clock, tempDir.path());
    QVERIFY(engine.addManualTime(QDate(2024, 5, 6), QTime(8, 0), 300));

    engine.setGoal(2700);
    QCOMPARE(engine.addProfile("Reading"), ProfileError::None);
    QCOMPARE(engine.activeProfile(), QString("Reading"));
    // a new profile starts with the goal that was live when it was made
    QCOMPARE(engine.goalSeconds(), qint64(2700));
    QCOMPARE(engine.addProfile("reading"), ProfileError::DuplicateLabel);

    QVERIFY(engine.addManualTime(QDate(2024, 5, 6), QTime(9, 0), 600));
    const QString path = QDir(tempDir.path()).filePath("Reading.csv");
    QVERIFY(QFile::exists(path));

    QCOMPARE(engine.deleteProfile("Output"), ProfileError::BuiltInProfile);
    QCOMPARE(engine.deleteProfile("Reading"), ProfileError::None);
    QVERIFY(!QFile::exists(path));
    QCOMPARE(engine.activeProfile(), ProfileManager::defaultProfile());
    QCOMPARE(engine.totalSecondsToday(), qint64(300));
}

void IntegrationTest::test_integration_goal_markers()
{
    QTemporaryDir tempDir;
    QVERIFY(tempDir.isValid());
    IniConfigRepository repo(createSettingsFile(tempDir.path()));
    Settings settings(repo);
    FakeClock clock(at(2024, 5, 6, 12, 0));
    const QString path = QDir(tempDir.path()).filePath("active.csv");

    TimeEngine engine(settings, repo, clock, tempDir.path());
    engine.setGoal(3600);
    engine.setGoal(3600);
    QCOMPARE(readLines(path), QStringList({ kHeader, "2024-05-06,goal,goal,0,3600" }));
    QCOMPARE(engine.totalSecondsToday(), qint64(0));
    QCOMPARE(engine.goalSecondsForDate(QDate(2024, 5, 6)), qint64(3600));
    QCOMPARE(engine.percentOfGoalToday(), QString("0%"));
    QCOMPARE(repo.value("super_goal/profiles/activate immersion/hours").toInt(), 1);

    // the marker survives an undo rewrite
    QVERIFY(engine.addManualTime(QDate(2024, 5, 6), QTime(9, 0), 1800));
    QCOMPARE(engine.percentOfGoalToday(), QString("50%"));
    QVERIFY(engine.undoLastAddedTime());
    QCOMPARE(readLines(path), QStringList({ kHeader, "2024-05-06,goal,goal,0,3600" }));

    TimeEngine reloaded(settings, repo, clock, tempDir.path());
    QCOMPARE(reloaded.goalSecondsForDate(QDate(2024, 5, 6)), qint64(3600));
    QCOMPARE(reloaded.dayProgress(QDate(2024, 5, 6)), DayProgress::Empty);
}

void IntegrationTest::test_integration_midnight_rollover()
{
    QTemporaryDir tempDir;
    QVERIFY(tempDir.isValid());
    IniConfigRepository repo(createSettingsFile(tempDir.path()));
    Settings settings(repo);
    FakeClock clock(at(2024, 5, 6, 23, 59, 50));

    TimeEngine engine(settings, repo, clock, tempDir.path());
    engine.startClock();
    for (int i = 0; i < 20; ++i) {
        clock.advance(1);
        engine.tick();
    }
    engine.stopClock();

    QCOMPARE(engine.entries().size(), size_t(2));
    QCOMPARE(engine.totalSecondsForDay(QDate(2024, 5, 6)), qint64(9));
    QCOMPARE(engine.totalSecondsForDay(QDate(2024, 5, 7)), qint64(11));
    QCOMPARE(engine.entries().front().endTime, QString("23:59:59"));
    QCOMPARE(engine.clockDisplaySeconds(), qint64(11));
}

void IntegrationTest::test_integration_reset_clock_display()
{
    QTemporaryDir tempDir;
    QVERIFY(tempDir.isValid());
    IniConfigRepository repo(createSettingsFile(tempDir.path()));
    Settings settings(repo);
    FakeClock clock(at(2024, 5, 6, 12, 0));

    TimeEngine engine(settings, repo, clock, tempDir.path());
    QVERIFY(engine.addManualTime(QDate(2024, 5, 6), QTime(9, 0), 600));
    QCOMPARE(engine.clockDisplaySeconds(), qint64(600));

    engine.resetClock();
    QCOMPARE(engine.clockDisplaySeconds(), qint64(0));

    engine.toggleClock();
    clock.advance(5);
    for (int i = 0; i < 5; ++i)
        engine.tick();
    QCOMPARE(engine.clockDisplaySeconds(), qint64(5));
    QCOMPARE(engine.totalSecondsToday(), qint64(605));
}

void IntegrationTest::test_integration_startup_migration()
{
    QTemporaryDir tempDir;
    QVERIFY(tempDir.isValid());
    IniConfigRepository repo(createSettingsFile(tempDir.path()));
    Settings settings(repo);
    FakeClock clock(at(2024, 5, 6, 12, 0));

    // an inactive profile in the oldest layout
    const QString path = QDir(tempDir.path()).filePath("passive.csv");
    QVERIFY(writeCsv(path, { "date,time,duration_seconds", "2024-05-01,07:00:00,3600" }));

    TimeEngine engine(settings, repo, clock, tempDir.path());
    QCOMPARE(readLines(path), QStringList({ kHeader, "2024-05-01,07:00:00,08:00:00,3600,7200" }));
    QCOMPARE(engine.entriesForProfile("passive immersion").size(), size_t(1));
}

void IntegrationTest::test_integration_write_failure_keeps_memory()
{
    QTemporaryDir tempDir;
    QVERIFY(tempDir.isValid());
    IniConfigRepository repo(createSettingsFile(tempDir.path()));
    Settings settings(repo);
    FakeClock clock(at(2024, 5, 6, 12, 0));
    QVERIFY(QDir().mkpath(QDir(tempDir.path()).filePath("active.csv")));

    TimeEngine engine(settings, repo, clock, tempDir.path());
    QVERIFY(engine.addManualTime(QDate(2024, 5, 6), QTime(9, 0), 1200));
    QCOMPARE(engine.totalSecondsToday(), qint64(1200));
    QCOMPARE(engine.entries().size(), size_t(1));

    QVERIFY(engine.undoLastAddedTime());
    QCOMPARE(engine.totalSecondsToday(), qint64(0));
}

void IntegrationTest::test_integration_combined_totals()
{
    QTemporaryDir tempDir;
    QVERIFY(tempDir.isValid());
    IniConfigRepository repo(createSettingsFile(tempDir.path()));
    Settings settings(repo);
    FakeClock clock(at(2024, 5, 6, 12, 0));

    QVERIFY(writeCsv(QDir(tempDir.path()).filePath("output.csv"), { kHeader, "2024-05-06,08:00:00,08:10:00,600,0" }));

    TimeEngine engine(settings, repo, clock, tempDir.path());
    QVERIFY(engine.addManualTime(QDate(2024, 5, 6), QTime(9, 0), 300));

    const DailyTotals combined = engine.combinedTotals();
    QCOMPARE(combined.value("2024-05-06"), qint64(900));
    QCOMPARE(engine.weekTotal(), qint64(0));
    QCOMPARE(engine.yearTotal(), qint64(300));
    QCOMPARE(engine.streaks().longest, 0);
    QCOMPARE(engine.profileColor("Output"), ProfileManager::paletteColor("Output"));
}

void IntegrationTest::test_integration_custom_profile_cannot_take_builtin_file()
{
    QTemporaryDir tempDir;
    QVERIFY(tempDir.isValid());
    IniConfigRepository repo(createSettingsFile(tempDir.path()));
    Settings settings(repo);
    FakeClock clock(at(2024, 5, 6, 12, 0));
    const QString path = QDir(tempDir.path()).filePath("active.csv");

    TimeEngine engine(settings, repo, clock, tempDir.path());
    QVERIFY(engine.addManualTime(QDate(2024, 5, 6), QTime(9, 0), 900));

    QCOMPARE(engine.addProfile("active"), ProfileError::FileNameTaken);
    QCOMPARE(engine.activeProfile(), QString("Activate Immersion"));
    QCOMPARE(engine.deleteProfile("active"), ProfileError::UnknownProfile);

    // a real custom profile only ever removes its own file
    QCOMPARE(engine.addProfile("Reading"), ProfileError::None);
    QCOMPARE(engine.deleteProfile("Reading"), ProfileError::None);

    QVERIFY(QFile::exists(path));
    QCOMPARE(readLines(path), QStringList({ kHeader, "2024-05-06,09:00:00,09:15:00,900,7200" }));
    QCOMPARE(engine.totalSecondsToday(), qint64(900));
}

void IntegrationTest::test_integration_goal_kept_in_whole_minutes()
{
    QTemporaryDir tempDir;
    QVERIFY(tempDir.isValid());
    IniConfigRepository repo(createSettingsFile(tempDir.path()));
    Settings settings(repo);
    FakeClock clock(at(2024, 5, 6, 12, 0));
    const QString path = QDir(tempDir.path()).filePath("active.csv");

    {
        TimeEngine engine(settings, repo, clock, tempDir.path());
        engine.setGoal(5430);
        QCOMPARE(engine.goalSeconds(), qint64(5400));
        QCOMPARE(readLines(path).last(), QString("2024-05-06,goal,goal,0,5400"));
    }

    TimeEngine reloaded(settings, repo, clock, tempDir.path());
    QCOMPARE(reloaded.goalSeconds(), qint64(5400));
    QCOMPARE(reloaded.goalSecondsForDate(QDate(2024, 5, 6)), qint64(5400));
}

void IntegrationTest::test_integration_empty_session_writes_nothing()
{
    QTemporaryDir tempDir;
    QVERIFY(tempDir.isValid());
    IniConfigRepository repo(createSettingsFile(tempDir.path()));
    Settings settings(repo);
    FakeClock clock(at(2024, 5, 6, 12, 0));
    const QString path = QDir(tempDir.path()).filePath("active.csv");

    TimeEngine engine(settings, repo, clock, tempDir.path());
    engine.startClock();
    engine.stopClock();
    engine.setRemainingSeconds(300);
    QVERIFY(engine.start());
    engine.pause();

    QVERIFY(engine.entries().empty());
    QCOMPARE(engine.totalSecondsToday(), qint64(0));
    QCOMPARE(readLines(path), QStringList({ kHeader }));
}
