#include <gtest/gtest.h>

#include <QCoreApplication>

// Timers, QtConcurrent results and queued signals need an application object.
int main(int argc, char **argv)
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setOrganizationName("sftp-browser-tests");
    QCoreApplication::setApplicationName("sftp-browser-tests");

    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
