#include <QCoreApplication>
#include <QtTest>

// Forward declarations of all test classes
class SettingsTest;
class HelpersTest;
class LogStoreTest;
class SessionTrackerTest;
class DailyAggregatorTest;
class StreaksTest;
class ProfileManagerTest;
class IntegrationTest;

// Include test class headers
#include "test_settings.h"
#include "test_helpers.h"
#include "test_logstore.h"
#include "test_sessiontracker.h"
#include "test_dailyaggregator.h"
#include "test_streaks.h"
#include "test_profilemanager.h"
#include "test_integration.h"

// Test runner main function
// Executes all test suites sequentially using QTest::qExec()
// Returns non-zero exit code if any test suite fails
int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    int status = 0;

    // Lambda to run a test suite and track failures
    auto runTest = [&](auto* test, const char* name) {
        qDebug() << "\n================" << name << "================";
        int result = QTest::qExec(test, argc, argv);
        delete test;
        if (result != 0) {
            status = result;
        }
        return result;
    };

    // Run test suites
    runTest(new SettingsTest, "SettingsTest");
    runTest(new HelpersTest, "HelpersTest");
    runTest(new LogStoreTest, "LogStoreTest");
    runTest(new SessionTrackerTest, "SessionTrackerTest");
    runTest(new DailyAggregatorTest, "DailyAggregatorTest");
    runTest(new StreaksTest, "StreaksTest");
    runTest(new ProfileManagerTest, "ProfileManagerTest");
    runTest(new IntegrationTest, "IntegrationTest");

    qDebug() << "\n================ All Tests Complete ================";
    return status;
}
