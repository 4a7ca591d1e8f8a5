#include <gtest/gtest.h>

#include <QCoreApplication>
#include <QStandardPaths>

// Queued callbacks and timers need a running Qt application object.
int main(int argc, char **argv)
{
    ::testing::InitGoogleTest(&argc, argv);

    QCoreApplication app(argc, argv);
    QCoreApplication::setOrganizationName(QStringLiteral("TailControlTests"));
    QCoreApplication::setApplicationName(QStringLiteral("tailcontrol_tests"));
    QStandardPaths::setTestModeEnabled(true);

    return RUN_ALL_TESTS();
}
