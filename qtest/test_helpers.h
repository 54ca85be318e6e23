#ifndef TEST_HELPERS_H
#define TEST_HELPERS_H

#include <QObject>
#include "testcommon.h"

class HelpersTest : public QObject
{
    Q_OBJECT

private slots:
    void test_helpers_conversions();
    void test_helpers_percent();
    void test_helpers_end_time();
    void test_helpers_csv_fields();
};

#endif // TEST_HELPERS_H
