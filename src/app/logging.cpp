#include "app/logging.hpp"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QLoggingCategory>
#include <QMutex>
#include <QStandardPaths>

#include <cstdio>

namespace ledmark::app {
namespace {

class LogSink {
public:
    Result<void> open(const QString& path) {
        QMutexLocker lock(&mutex_);
        file_.close();
        if (path.isEmpty()) return Result<void>::ok();

        if (!QDir().mkpath(QFileInfo(path).absolutePath())) {
            return Result<void>::err(Error{ErrorKind::IOFailure,
                                           "Cannot create log directory for " + path.toStdString()});
        }
        file_.setFileName(path);
        if (!file_.open(QIODevice::WriteOnly | QIODevice::Append)) {
            return Result<void>::err(Error{ErrorKind::IOFailure,
                                           "Cannot open log file " + path.toStdString() + ": " +
                                               file_.errorString().toStdString()});
        }
        return Result<void>::ok();
    }

    void close() {
        QMutexLocker lock(&mutex_);
        file_.close();
    }

    void write(const QByteArray& line) {
        QMutexLocker lock(&mutex_);
        std::fwrite(line.constData(), 1, static_cast<size_t>(line.size()), stderr);
        std::fflush(stderr);
        if (file_.isOpen()) {
            file_.write(line);
            file_.flush();
        }
    }

private:
    QMutex mutex_;
    QFile file_;
};

LogSink& sink() {
    static LogSink s;
    return s;
}

char level_tag(QtMsgType type) {
    switch (type) {
        case QtDebugMsg: return 'D';
        case QtInfoMsg: return 'I';
        case QtWarningMsg: return 'W';
        case QtCriticalMsg: return 'C';
        case QtFatalMsg: return 'F';
    }
    return '?';
}

void message_handler(QtMsgType type, const QMessageLogContext& ctx, const QString& msg) {
    sink().write(format_log_line(type, ctx.category, msg, QDateTime::currentDateTimeUtc()));
}

} // namespace

QByteArray format_log_line(QtMsgType type, const char* category,
                           const QString& message, const QDateTime& when) {
    QByteArray line = when.toUTC().toString(Qt::ISODateWithMs).toUtf8();
    line += ' ';
    line += level_tag(type);
    line += ' ';
    line += category ? category : "default";
    line += ' ';
    line += message.toUtf8();
    line += '\n';
    return line;
}

Result<void> install_logging(const LogOptions& options) {
    QLoggingCategory::setFilterRules(options.debug ? QStringLiteral("ledmark.*.debug=true")
                                                   : QStringLiteral("ledmark.*.debug=false"));
    auto opened = sink().open(options.file_path);
    qInstallMessageHandler(message_handler);
    return opened;
}

void uninstall_logging() {
    qInstallMessageHandler(nullptr);
    sink().close();
}

QString default_log_file_path() {
    const auto base = QStandardPaths::writableLocation(QStandardPaths::AppLocalDataLocation);
    if (base.isEmpty()) return QString{};
    return QDir(base).filePath(QStringLiteral("logs/ledmark.log"));
}

} // namespace ledmark::app
