#include "storage/bookmark_manager.hpp"

#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QLoggingCategory>

#include <algorithm>
#include <utility>
#include <variant>

namespace ledmark::storage {
namespace {

Q_LOGGING_CATEGORY(lmStoreLog, "ledmark.store")

using SqlValue = std::variant<std::nullptr_t, int64_t, std::string>;

/**
 * INSERT statement over a column set that depends on the schema version.
 */
class InsertBuilder {
public:
    explicit InsertBuilder(std::string table) : table_(std::move(table)) {}

    void add(std::string column, SqlValue value) {
        columns_.emplace_back(std::move(column), std::move(value));
    }

    Result<void> execute(Database& db) const {
        std::string names;
        std::string placeholders;
        for (const auto& [column, value] : columns_) {
            if (!names.empty()) {
                names += ", ";
                placeholders += ", ";
            }
            names += column;
            placeholders += "?";
        }

        auto stmt_result = db.prepare("INSERT INTO " + table_ + " (" + names + ") VALUES (" +
                                      placeholders + ");");
        if (stmt_result.is_err()) return Result<void>::err(stmt_result.unwrap_err());
        auto stmt = std::move(stmt_result).unwrap();

        int index = 0;
        for (const auto& [column, value] : columns_) {
            ++index;
            auto bound = std::visit(
                [&](const auto& v) -> Result<void> {
                    using V = std::decay_t<decltype(v)>;
                    if constexpr (std::is_same_v<V, std::nullptr_t>) {
                        return stmt.bind_null(index);
                    } else if constexpr (std::is_same_v<V, int64_t>) {
                        return stmt.bind_int64(index, v);
                    } else {
                        return stmt.bind_text(index, v);
                    }
                },
                value);
            if (bound.is_err()) return bound;
        }

        auto step = stmt.step();
        if (step.is_err()) return Result<void>::err(step.unwrap_err());
        return Result<void>::ok();
    }

private:
    std::string table_;
    std::vector<std::pair<std::string, SqlValue>> columns_;
};

/**
 * Run a statement that returns at most one integer.
 */
template<typename... Args>
Result<std::optional<int64_t>> query_int(Database& db, const std::string& sql, const Args&... args) {
    using R = Result<std::optional<int64_t>>;

    auto stmt_result = db.prepare(sql);
    if (stmt_result.is_err()) return R::err(stmt_result.unwrap_err());
    auto stmt = std::move(stmt_result).unwrap();

    auto bound = stmt.bind_all(args...);
    if (bound.is_err()) return R::err(bound.unwrap_err());

    auto row = stmt.step();
    if (row.is_err()) return R::err(row.unwrap_err());
    if (!row.unwrap() || stmt.column_is_null(0)) return R::ok(std::nullopt);
    return R::ok(stmt.column_int64(0));
}

template<typename... Args>
Result<void> exec(Database& db, const std::string& sql, const Args&... args) {
    auto stmt_result = db.prepare(sql);
    if (stmt_result.is_err()) return Result<void>::err(stmt_result.unwrap_err());
    auto stmt = std::move(stmt_result).unwrap();

    auto bound = stmt.bind_all(args...);
    if (bound.is_err()) return bound;

    auto step = stmt.step();
    if (step.is_err()) return Result<void>::err(step.unwrap_err());
    return Result<void>::ok();
}

QString unique_backup_path(const QFileInfo& source) {
    const auto stamp = QDateTime::currentDateTimeUtc().toString(QStringLiteral("yyyyMMdd'T'HHmmsszzz"));
    const auto dir = source.absoluteDir();
    const auto stem = source.completeBaseName() + QStringLiteral(".backup-") + stamp;
    const auto suffix = source.suffix().isEmpty() ? QString{} : QLatin1Char('.') + source.suffix();

    auto candidate = dir.filePath(stem + suffix);
    for (int n = 1; QFileInfo::exists(candidate) || QFileInfo::exists(candidate + QStringLiteral("-wal")); ++n) {
        candidate = dir.filePath(stem + QLatin1Char('-') + QString::number(n) + suffix);
    }
    return candidate;
}

} // namespace

BookmarkManager::BookmarkManager(QString database_path, QString ledger_path)
    : database_path_(QFileInfo(database_path).absoluteFilePath())
    , ledger_(std::move(ledger_path))
{
}

Result<BookmarkManager::Store> BookmarkManager::open_store() {
    using R = Result<Store>;

    if (!QFileInfo(database_path_).isFile()) {
        return R::err(Error{ErrorKind::IOFailure,
                            "Bookmark database not found: " + database_path_.toStdString()});
    }

    auto db_result = Database::open(database_path_.toStdString());
    if (db_result.is_err()) return R::err(db_result.unwrap_err());
    auto db = std::move(db_result).unwrap();

    auto schema = inspect_places_schema(db);
    if (schema.is_err()) return R::err(schema.unwrap_err());

    return R::ok(Store{std::move(db), schema.unwrap()});
}

// ============================================================================
// Backup
// ============================================================================

Result<BackupSnapshot> BookmarkManager::backup() {
    using R = Result<BackupSnapshot>;

    if (snapshot_) {
        return R::ok(*snapshot_);
    }

    const QFileInfo source(database_path_);
    if (!source.isFile() || !source.isReadable()) {
        return R::err(Error{ErrorKind::IOFailure,
                            "Cannot read bookmark database: " + database_path_.toStdString()});
    }

    auto db_result = Database::open(database_path_.toStdString());
    if (db_result.is_err()) return R::err(db_result.unwrap_err());
    auto db = std::move(db_result).unwrap();

    // Hold the write lock while copying so nobody commits mid-copy.
    TransactionGuard lock(db);
    if (lock.begin_result().is_err()) return R::err(lock.begin_result().unwrap_err());

    const auto backup_path = unique_backup_path(source);
    if (!QFile::copy(database_path_, backup_path)) {
        return R::err(Error{ErrorKind::IOFailure,
                            "Failed to create backup " + backup_path.toStdString()});
    }

    const auto wal = database_path_ + QStringLiteral("-wal");
    if (QFileInfo::exists(wal) && !QFile::copy(wal, backup_path + QStringLiteral("-wal"))) {
        QFile::remove(backup_path);
        return R::err(Error{ErrorKind::IOFailure,
                            "Failed to copy write-ahead log to " + backup_path.toStdString() + "-wal"});
    }

    lock.rollback();

    snapshot_ = BackupSnapshot{
        .source_path = database_path_.toStdString(),
        .backup_path = backup_path.toStdString(),
        .created_at = Timestamp::now(),
    };
    qCInfo(lmStoreLog) << "Backup created at" << backup_path;
    return R::ok(*snapshot_);
}

Result<void> BookmarkManager::ensure_snapshot() {
    if (snapshot_) return Result<void>::ok();

    auto snapshot = backup();
    if (snapshot.is_err()) {
        qCWarning(lmStoreLog) << "Backup failed, not modifying" << database_path_ << ":"
                              << snapshot.unwrap_err().message.c_str();
        return Result<void>::err(snapshot.unwrap_err());
    }
    return Result<void>::ok();
}

// ============================================================================
// Folder
// ============================================================================

Result<int64_t> BookmarkManager::next_position(Store& store, int64_t parent_id) {
    auto max = query_int(store.db,
                         "SELECT MAX(position) FROM moz_bookmarks WHERE parent = ?;",
                         parent_id);
    if (max.is_err()) return Result<int64_t>::err(max.unwrap_err());
    return Result<int64_t>::ok(max.unwrap() ? *max.unwrap() + 1 : 0);
}

Result<void> BookmarkManager::touch_folder(Store& store, int64_t folder_id, Timestamp when) {
    if (store.schema.bookmark_sync_change_counter) {
        return exec(store.db,
                    "UPDATE moz_bookmarks SET lastModified = ?, "
                    "syncChangeCounter = syncChangeCounter + 1 WHERE id = ?;",
                    when.micros(), folder_id);
    }
    return exec(store.db, "UPDATE moz_bookmarks SET lastModified = ? WHERE id = ?;",
                when.micros(), folder_id);
}

Result<int64_t> BookmarkManager::ensure_folder(const std::string& name) {
    using R = Result<int64_t>;

    if (name.empty()) {
        return R::err(Error{ErrorKind::InvalidArgument, "Folder name must not be empty"});
    }

    auto store_result = open_store();
    if (store_result.is_err()) return R::err(store_result.unwrap_err());
    auto store = std::move(store_result).unwrap();

    auto snapshot = ensure_snapshot();
    if (snapshot.is_err()) return R::err(snapshot.unwrap_err());
    const auto root = store.schema.menu_root_id;

    TransactionGuard tx(store.db);
    if (tx.begin_result().is_err()) return R::err(tx.begin_result().unwrap_err());

    auto existing = query_int(store.db,
                              "SELECT id FROM moz_bookmarks WHERE parent = ? AND type = ? AND title = ? "
                              "ORDER BY position LIMIT 1;",
                              root, kBookmarkTypeFolder, name);
    if (existing.is_err()) return R::err(existing.unwrap_err());
    if (existing.unwrap()) {
        qCDebug(lmStoreLog) << "Folder" << name.c_str() << "exists with id" << *existing.unwrap();
        return R::ok(*existing.unwrap());
    }

    auto position = next_position(store, root);
    if (position.is_err()) return R::err(position.unwrap_err());

    const auto now = Timestamp::now();
    InsertBuilder insert("moz_bookmarks");
    insert.add("type", int64_t{kBookmarkTypeFolder});
    insert.add("fk", nullptr);
    insert.add("parent", root);
    insert.add("position", position.unwrap());
    insert.add("title", name);
    insert.add("dateAdded", now.micros());
    insert.add("lastModified", now.micros());
    if (store.schema.bookmark_guid) insert.add("guid", make_places_guid());
    if (store.schema.bookmark_sync_change_counter) insert.add("syncChangeCounter", int64_t{1});

    auto inserted = insert.execute(store.db);
    if (inserted.is_err()) return R::err(inserted.unwrap_err());
    const auto folder_id = store.db.last_insert_rowid();

    auto touched = touch_folder(store, root, now);
    if (touched.is_err()) return R::err(touched.unwrap_err());

    auto committed = tx.commit();
    if (committed.is_err()) return R::err(committed.unwrap_err());

    qCInfo(lmStoreLog) << "Created folder" << name.c_str() << "with id" << folder_id;
    return R::ok(folder_id);
}

// ============================================================================
// Bookmarks
// ============================================================================

Result<int64_t> BookmarkManager::find_or_create_place(Store& store, const PlacesUrl& url,
                                                      const std::string& title) {
    using R = Result<int64_t>;

    auto existing = query_int(store.db, "SELECT id FROM moz_places WHERE url = ?;", url.href);
    if (existing.is_err()) return R::err(existing.unwrap_err());
    if (existing.unwrap()) return R::ok(*existing.unwrap());

    InsertBuilder insert("moz_places");
    insert.add("url", url.href);
    insert.add("title", title);
    insert.add("rev_host", url.rev_host);
    if (store.schema.place_url_hash) {
        insert.add("url_hash", static_cast<int64_t>(places_url_hash(url.href)));
    }
    if (store.schema.place_guid) insert.add("guid", make_places_guid());
    if (store.schema.place_frecency) insert.add("frecency", int64_t{1});

    if (store.schema.place_origin) {
        auto origin = exec(store.db,
                           "INSERT OR IGNORE INTO moz_origins (prefix, host, frecency) VALUES (?, ?, 0);",
                           url.prefix, url.host);
        if (origin.is_err()) return R::err(origin.unwrap_err());

        auto origin_id = query_int(store.db,
                                   "SELECT id FROM moz_origins WHERE prefix = ? AND host = ?;",
                                   url.prefix, url.host);
        if (origin_id.is_err()) return R::err(origin_id.unwrap_err());
        if (!origin_id.unwrap()) {
            return R::err(Error{ErrorKind::SchemaViolation, "moz_origins row missing after insert"});
        }
        insert.add("origin_id", *origin_id.unwrap());
    }

    auto inserted = insert.execute(store.db);
    if (inserted.is_err()) return R::err(inserted.unwrap_err());
    return R::ok(store.db.last_insert_rowid());
}

Result<BookmarkEntry> BookmarkManager::insert_bookmark(Store& store, int64_t folder_id,
                                                       const DeviceRecord& device) {
    using R = Result<BookmarkEntry>;

    if (device.name.empty()) {
        return R::err(Error{ErrorKind::InvalidArgument, "Device has no name"});
    }
    auto url = parse_places_url(device.url());
    if (url.is_err()) return R::err(url.unwrap_err());

    TransactionGuard tx(store.db);
    if (tx.begin_result().is_err()) return R::err(tx.begin_result().unwrap_err());

    auto place_id = find_or_create_place(store, url.unwrap(), device.name);
    if (place_id.is_err()) return R::err(place_id.unwrap_err());

    auto position = next_position(store, folder_id);
    if (position.is_err()) return R::err(position.unwrap_err());

    const auto now = Timestamp::now();
    InsertBuilder insert("moz_bookmarks");
    insert.add("type", int64_t{kBookmarkTypeUrl});
    insert.add("fk", place_id.unwrap());
    insert.add("parent", folder_id);
    insert.add("position", position.unwrap());
    insert.add("title", device.name);
    insert.add("dateAdded", now.micros());
    insert.add("lastModified", now.micros());
    if (store.schema.bookmark_guid) insert.add("guid", make_places_guid());
    if (store.schema.bookmark_sync_change_counter) insert.add("syncChangeCounter", int64_t{1});

    auto inserted = insert.execute(store.db);
    if (inserted.is_err()) return R::err(inserted.unwrap_err());
    const auto bookmark_id = store.db.last_insert_rowid();

    if (store.schema.place_foreign_count) {
        auto counted = exec(store.db,
                            "UPDATE moz_places SET foreign_count = foreign_count + 1 WHERE id = ?;",
                            place_id.unwrap());
        if (counted.is_err()) return R::err(counted.unwrap_err());
    }

    auto touched = touch_folder(store, folder_id, now);
    if (touched.is_err()) return R::err(touched.unwrap_err());

    BookmarkEntry entry{
        .id = bookmark_id,
        .title = device.name,
        .url = url.unwrap().href,
        .parent_folder_id = folder_id,
        .added_at = now,
        .database = database_path_.toStdString(),
    };

    // Ledger first: a row that cannot be ledgered is rolled back.
    auto ledgered = ledger_.append(entry);
    if (ledgered.is_err()) return R::err(ledgered.unwrap_err());

    auto committed = tx.commit();
    if (committed.is_err()) {
        qCWarning(lmStoreLog) << "Commit failed after ledgering bookmark" << bookmark_id
                              << "; restore will skip it";
        return R::err(committed.unwrap_err());
    }

    return R::ok(std::move(entry));
}

Result<AddReport> BookmarkManager::add_bookmarks(int64_t folder_id,
                                                 const std::vector<DeviceRecord>& devices) {
    using R = Result<AddReport>;

    auto store_result = open_store();
    if (store_result.is_err()) return R::err(store_result.unwrap_err());
    auto store = std::move(store_result).unwrap();

    auto snapshot = ensure_snapshot();
    if (snapshot.is_err()) return R::err(snapshot.unwrap_err());

    auto folder_type = query_int(store.db, "SELECT type FROM moz_bookmarks WHERE id = ?;", folder_id);
    if (folder_type.is_err()) return R::err(folder_type.unwrap_err());
    if (!folder_type.unwrap() || *folder_type.unwrap() != kBookmarkTypeFolder) {
        return R::err(Error{ErrorKind::InvalidArgument,
                            "Bookmark folder " + std::to_string(folder_id) + " does not exist"});
    }

    AddReport report;
    for (const auto& device : devices) {
        auto entry = insert_bookmark(store, folder_id, device);
        if (entry.is_err()) {
            qCWarning(lmStoreLog) << "Failed to add bookmark" << device.name.c_str() << ":"
                                  << entry.unwrap_err().message.c_str();
            report.failed.push_back(AddFailure{device, entry.unwrap_err()});
            continue;
        }
        qCInfo(lmStoreLog) << "Bookmark" << device.name.c_str() << "added with id" << entry.unwrap().id;
        report.added.push_back(std::move(entry).unwrap());
    }

    return R::ok(std::move(report));
}

// ============================================================================
// Restore
// ============================================================================

Result<bool> BookmarkManager::delete_bookmark(Store& store, const BookmarkEntry& entry) {
    using R = Result<bool>;

    TransactionGuard tx(store.db);
    if (tx.begin_result().is_err()) return R::err(tx.begin_result().unwrap_err());

    int64_t parent = 0;
    int64_t position = 0;
    int64_t place_id = 0;
    std::optional<std::string> tombstone_guid;

    // Rows the sync server already holds need a tombstone, or the next sync
    // brings them back.
    const bool tracks_sync = store.schema.bookmark_guid && store.schema.bookmark_sync_status &&
                             store.schema.deleted_tombstones;
    {
        std::string sql = "SELECT b.parent, b.position, b.fk, b.title, p.url";
        if (tracks_sync) sql += ", b.guid, b.syncStatus";
        sql += " FROM moz_bookmarks b LEFT JOIN moz_places p ON p.id = b.fk"
               " WHERE b.id = ? AND b.type = ?;";

        auto stmt_result = store.db.prepare(sql);
        if (stmt_result.is_err()) return R::err(stmt_result.unwrap_err());
        auto stmt = std::move(stmt_result).unwrap();

        auto bound = stmt.bind_all(entry.id, kBookmarkTypeUrl);
        if (bound.is_err()) return R::err(bound.unwrap_err());

        auto row = stmt.step();
        if (row.is_err()) return R::err(row.unwrap_err());
        if (!row.unwrap()) return R::ok(false);

        if (stmt.column_text(3) != entry.title || stmt.column_text(4) != entry.url) {
            // The id was reused for a bookmark this tool did not create.
            qCWarning(lmStoreLog) << "Bookmark" << entry.id << "no longer matches the ledger, leaving it";
            return R::ok(false);
        }
        parent = stmt.column_int64(0);
        position = stmt.column_int64(1);
        place_id = stmt.column_int64(2);
        if (tracks_sync && stmt.column_int64(6) == kSyncStatusNormal) {
            tombstone_guid = stmt.column_text(5);
        }
    }

    auto deleted = exec(store.db, "DELETE FROM moz_bookmarks WHERE id = ?;", entry.id);
    if (deleted.is_err()) return R::err(deleted.unwrap_err());

    auto shifted = exec(store.db,
                        "UPDATE moz_bookmarks SET position = position - 1 WHERE parent = ? AND position > ?;",
                        parent, position);
    if (shifted.is_err()) return R::err(shifted.unwrap_err());

    if (store.schema.place_foreign_count) {
        auto counted = exec(store.db,
                            "UPDATE moz_places SET foreign_count = foreign_count - 1 "
                            "WHERE id = ? AND foreign_count > 0;",
                            place_id);
        if (counted.is_err()) return R::err(counted.unwrap_err());
    }

    const auto now = Timestamp::now();
    if (tombstone_guid) {
        auto tombstoned = exec(store.db,
                               "INSERT OR REPLACE INTO moz_bookmarks_deleted (guid, dateRemoved) VALUES (?, ?);",
                               *tombstone_guid, now.micros());
        if (tombstoned.is_err()) return R::err(tombstoned.unwrap_err());
    }

    auto touched = touch_folder(store, parent, now);
    if (touched.is_err()) return R::err(touched.unwrap_err());

    auto committed = tx.commit();
    if (committed.is_err()) return R::err(committed.unwrap_err());
    return R::ok(true);
}

Result<int> BookmarkManager::restore() {
    using R = Result<int>;

    auto lines_result = ledger_.read();
    if (lines_result.is_err()) return R::err(lines_result.unwrap_err());
    auto lines = std::move(lines_result).unwrap();

    const auto database = database_path_.toStdString();
    const bool any_ours = std::any_of(lines.begin(), lines.end(), [&](const Ledger::Line& line) {
        return line.entry && line.entry->database == database;
    });
    if (!any_ours) {
        qCInfo(lmStoreLog) << "Ledger has no bookmarks for" << database_path_;
        return R::ok(0);
    }

    auto store_result = open_store();
    if (store_result.is_err()) return R::err(store_result.unwrap_err());
    auto store = std::move(store_result).unwrap();

    auto snapshot = ensure_snapshot();
    if (snapshot.is_err()) return R::err(snapshot.unwrap_err());

    std::vector<Ledger::Line> remaining;
    std::optional<Error> failure;
    int removed = 0;

    for (auto& line : lines) {
        if (failure || !line.entry || line.entry->database != database) {
            remaining.push_back(std::move(line));
            continue;
        }

        auto deleted = delete_bookmark(store, *line.entry);
        if (deleted.is_err()) {
            failure = deleted.unwrap_err();
            remaining.push_back(std::move(line));
            continue;
        }
        if (!deleted.unwrap()) {
            qCInfo(lmStoreLog) << "Bookmark" << line.entry->id << "already gone, keeping ledger entry";
            remaining.push_back(std::move(line));
            continue;
        }

        qCInfo(lmStoreLog) << "Removed bookmark" << line.entry->title.c_str() << "id" << line.entry->id;
        ++removed;
    }

    if (removed > 0) {
        auto replaced = ledger_.replace(remaining);
        if (replaced.is_err()) return R::err(replaced.unwrap_err());
    }
    if (failure) return R::err(*failure);

    return R::ok(removed);
}

} // namespace ledmark::storage
