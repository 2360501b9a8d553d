#pragma once

#include "core/result.hpp"

#include <QByteArray>
#include <QDateTime>
#include <QString>
#include <QtGlobal>

namespace ledmark::app {

struct LogOptions {
    bool debug = false;
    // Empty disables the file copy; stderr is always written.
    QString file_path;
};

// "<utc time> <level> <category> <message>\n", UTF-8 encoded.
[[nodiscard]] QByteArray format_log_line(QtMsgType type, const char* category,
                                         const QString& message, const QDateTime& when);

/**
 * Routes all Qt logging to stderr and, when a path is given, appends to that
 * file. The handler is installed even when the file cannot be opened; the
 * error is returned so the caller can report it.
 */
[[nodiscard]] Result<void> install_logging(const LogOptions& options);

// Restores Qt's default handler and closes the log file.
void uninstall_logging();

// <AppLocalDataLocation>/logs/ledmark.log, or empty if unavailable.
QString default_log_file_path();

} // namespace ledmark::app
