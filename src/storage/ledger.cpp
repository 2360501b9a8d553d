#include "storage/ledger.hpp"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QJsonObject>
#include <QLoggingCategory>
#include <QSaveFile>

namespace ledmark::storage {
namespace {

Q_LOGGING_CATEGORY(lmLedgerLog, "ledmark.store")

Error io_error(const QString& what, const QString& detail) {
    return Error{ErrorKind::IOFailure, (what + QStringLiteral(": ") + detail).toStdString()};
}

} // namespace

QByteArray Ledger::encode(const BookmarkEntry& entry) {
    QJsonObject obj;
    obj["id"] = static_cast<qint64>(entry.id);
    obj["title"] = QString::fromStdString(entry.title);
    obj["url"] = QString::fromStdString(entry.url);
    obj["parent_id"] = static_cast<qint64>(entry.parent_folder_id);
    obj["added_at"] = static_cast<qint64>(entry.added_at.micros());
    obj["database"] = QString::fromStdString(entry.database);
    return QJsonDocument(obj).toJson(QJsonDocument::Compact);
}

std::optional<BookmarkEntry> Ledger::decode(const QByteArray& line) {
    QJsonParseError err{};
    const auto doc = QJsonDocument::fromJson(line, &err);
    if (err.error != QJsonParseError::NoError || !doc.isObject()) {
        return std::nullopt;
    }

    const auto obj = doc.object();
    if (!obj["id"].isDouble() || !obj["url"].isString()) {
        return std::nullopt;
    }

    BookmarkEntry entry;
    entry.id = obj["id"].toInteger();
    entry.title = obj["title"].toString().toStdString();
    entry.url = obj["url"].toString().toStdString();
    entry.parent_folder_id = obj["parent_id"].toInteger();
    entry.added_at = Timestamp(obj["added_at"].toInteger());
    entry.database = obj["database"].toString().toStdString();
    return entry;
}

Result<void> Ledger::append(const BookmarkEntry& entry) {
    const QFileInfo info(path_);
    if (!QDir().mkpath(info.absolutePath())) {
        return Result<void>::err(io_error(QStringLiteral("Cannot create ledger directory"),
                                          info.absolutePath()));
    }

    QFile file(path_);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Append)) {
        return Result<void>::err(io_error(QStringLiteral("Cannot open ledger ") + path_,
                                          file.errorString()));
    }

    const auto line = encode(entry) + '\n';
    if (file.write(line) != line.size() || !file.flush()) {
        return Result<void>::err(io_error(QStringLiteral("Cannot write ledger ") + path_,
                                          file.errorString()));
    }
    return Result<void>::ok();
}

Result<std::vector<Ledger::Line>> Ledger::read() const {
    using R = Result<std::vector<Line>>;

    QFile file(path_);
    if (!file.exists()) {
        return R::ok({});
    }
    if (!file.open(QIODevice::ReadOnly)) {
        return R::err(io_error(QStringLiteral("Cannot read ledger ") + path_, file.errorString()));
    }

    std::vector<Line> lines;
    while (!file.atEnd()) {
        auto raw = file.readLine();
        while (raw.endsWith('\n') || raw.endsWith('\r')) {
            raw.chop(1);
        }
        if (raw.trimmed().isEmpty()) continue;

        auto entry = decode(raw);
        if (!entry) {
            qCWarning(lmLedgerLog) << "Ledger: unreadable line kept as-is:" << raw;
        }
        lines.push_back(Line{std::move(raw), std::move(entry)});
    }
    return R::ok(std::move(lines));
}

Result<void> Ledger::replace(const std::vector<Line>& lines) {
    QSaveFile file(path_);
    if (!file.open(QIODevice::WriteOnly)) {
        return Result<void>::err(io_error(QStringLiteral("Cannot rewrite ledger ") + path_,
                                          file.errorString()));
    }

    for (const auto& line : lines) {
        const auto bytes = line.raw + '\n';
        if (file.write(bytes) != bytes.size()) {
            file.cancelWriting();
            return Result<void>::err(io_error(QStringLiteral("Cannot rewrite ledger ") + path_,
                                              file.errorString()));
        }
    }

    if (!file.commit()) {
        return Result<void>::err(io_error(QStringLiteral("Cannot commit ledger ") + path_,
                                          file.errorString()));
    }
    return Result<void>::ok();
}

} // namespace ledmark::storage
