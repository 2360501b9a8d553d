#include <catch2/catch_test_macros.hpp>
#include "app/logging.hpp"

#include <QFile>
#include <QLoggingCategory>
#include <QTemporaryDir>
#include <QTimeZone>

using namespace ledmark;
using namespace ledmark::app;

namespace {
Q_LOGGING_CATEGORY(lmTestLog, "ledmark.test")

QByteArray read_all(const QString& path) {
    QFile file(path);
    REQUIRE(file.open(QIODevice::ReadOnly));
    return file.readAll();
}
} // namespace

TEST_CASE("format_log_line stamps UTC time, level and category", "[logging]") {
    const QDateTime when(QDate(2024, 3, 1), QTime(12, 30, 5, 250), QTimeZone::utc());

    REQUIRE(format_log_line(QtWarningMsg, "ledmark.store", QStringLiteral("locked"), when) ==
            QByteArray("2024-03-01T12:30:05.250Z W ledmark.store locked\n"));
    REQUIRE(format_log_line(QtInfoMsg, nullptr, QStringLiteral("hi"), when) ==
            QByteArray("2024-03-01T12:30:05.250Z I default hi\n"));
}

TEST_CASE("install_logging appends to the log file", "[logging]") {
    QTemporaryDir dir;
    REQUIRE(dir.isValid());
    const auto path = dir.filePath(QStringLiteral("logs/ledmark.log"));

    SECTION("Debug lines follow the debug option") {
        REQUIRE(install_logging({.debug = false, .file_path = path}).is_ok());
        qCDebug(lmTestLog) << "hidden";
        qCInfo(lmTestLog) << "visible";
        uninstall_logging();

        const auto contents = read_all(path);
        REQUIRE(contents.contains(" I ledmark.test visible"));
        REQUIRE_FALSE(contents.contains("hidden"));

        REQUIRE(install_logging({.debug = true, .file_path = path}).is_ok());
        qCDebug(lmTestLog) << "shown";
        uninstall_logging();

        const auto appended = read_all(path);
        REQUIRE(appended.startsWith(contents));
        REQUIRE(appended.contains(" D ledmark.test shown"));

        REQUIRE(install_logging({.debug = false, .file_path = QString{}}).is_ok());
        uninstall_logging();
    }

    SECTION("An unwritable location is reported") {
        QFile blocker(dir.filePath(QStringLiteral("logs")));
        REQUIRE(blocker.open(QIODevice::WriteOnly));
        blocker.close();

        auto result = install_logging({.debug = false, .file_path = path});
        uninstall_logging();

        REQUIRE(result.is_err());
        REQUIRE(result.unwrap_err().kind == ErrorKind::IOFailure);
    }
}
