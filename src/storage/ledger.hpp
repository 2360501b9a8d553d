#pragma once

#include "core/bookmark.hpp"
#include "core/result.hpp"

#include <QByteArray>
#include <QString>

#include <optional>
#include <vector>

namespace ledmark::storage {

/**
 * Ledger - Append-only record of the bookmarks this tool created.
 *
 * One JSON object per line:
 *   {"id":42,"title":"alpha","url":"http://10.0.0.5:80/","parent_id":7,
 *    "added_at":1700000000000000,"database":"/home/me/.mozilla/.../places.sqlite"}
 *
 * Lines are only ever appended, except by replace(), which restore uses to
 * drop the entries it removed from the store.
 */
class Ledger {
public:
    struct Line {
        QByteArray raw;                      // line as read, without newline
        std::optional<BookmarkEntry> entry;  // empty for unparseable lines
    };

    explicit Ledger(QString path) : path_(std::move(path)) {}

    [[nodiscard]] const QString& path() const { return path_; }

    /**
     * Append one entry and flush it to disk.
     */
    [[nodiscard]] Result<void> append(const BookmarkEntry& entry);

    /**
     * All lines in file order. A missing ledger reads as empty.
     */
    [[nodiscard]] Result<std::vector<Line>> read() const;

    /**
     * Atomically replace the ledger with `lines`.
     */
    [[nodiscard]] Result<void> replace(const std::vector<Line>& lines);

    [[nodiscard]] static QByteArray encode(const BookmarkEntry& entry);
    [[nodiscard]] static std::optional<BookmarkEntry> decode(const QByteArray& line);

private:
    QString path_;
};

} // namespace ledmark::storage
