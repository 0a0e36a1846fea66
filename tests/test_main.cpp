// Test runner: queues deliver their events through the Qt event loop, so a
// QCoreApplication must exist for the whole run.
#include <gtest/gtest.h>
#include <QCoreApplication>

int main(int argc, char** argv) {
    QCoreApplication app(argc, argv);
    QCoreApplication::setOrganizationName("OpenS3Tests");
    QCoreApplication::setApplicationName("opens3_tests");
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
