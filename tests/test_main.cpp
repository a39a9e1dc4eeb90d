#include <QCoreApplication>
#include <QDir>
#include <QStandardPaths>
#include <catch2/catch_session.hpp>

#include "crypto/keys.hpp"
#include "transfer/session_events.hpp"

int main(int argc, char** argv) {
    QCoreApplication app(argc, argv);
    QCoreApplication::setOrganizationName("dropline");
    QCoreApplication::setOrganizationDomain("dropline.local");
    QCoreApplication::setApplicationName("dropline_tests");
    const auto testHome = QDir::tempPath() + QStringLiteral("/dropline_tests_home");
    QDir().mkpath(testHome);
    qputenv("HOME", testHome.toUtf8());
    QStandardPaths::setTestModeEnabled(true);

    qRegisterMetaType<dropline::transfer::SessionEvent>();
    if (dropline::crypto::init().is_err()) {
        return 1;
    }

    Catch::Session session;
    return session.run(argc, argv);
}
