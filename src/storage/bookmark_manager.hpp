#pragma once

#include "core/bookmark.hpp"
#include "core/device.hpp"
#include "core/result.hpp"
#include "storage/database.hpp"
#include "storage/ledger.hpp"
#include "storage/places.hpp"

#include <QString>

#include <optional>
#include <string>
#include <vector>

namespace ledmark::storage {

/**
 * A device that could not be bookmarked, and why.
 */
struct AddFailure {
    DeviceRecord device;
    Error error;
};

struct AddReport {
    std::vector<BookmarkEntry> added;
    std::vector<AddFailure> failed;
};

/**
 * BookmarkManager - All mutation of one places database.
 *
 * Each operation opens its own connection and takes the write lock with
 * BEGIN IMMEDIATE, one transaction per row, so a failure leaves at most the
 * current row rolled back. A database locked by the browser fails with
 * ResourceBusy instead of waiting.
 *
 * The first mutation of a manager's lifetime is preceded by a backup; if the
 * backup fails, nothing is modified.
 */
class BookmarkManager {
public:
    BookmarkManager(QString database_path, QString ledger_path);

    /**
     * Copy the database (and its -wal file, if any) to a new timestamped
     * sibling. Only the first call copies; later calls return that snapshot.
     */
    [[nodiscard]] Result<BackupSnapshot> backup();

    /**
     * Id of the folder titled `name` under the bookmarks menu, created when
     * missing.
     */
    [[nodiscard]] Result<int64_t> ensure_folder(const std::string& name);

    /**
     * Bookmark each device under `folder_id` in input order and ledger every
     * row created. Devices that fail are skipped and reported; the call
     * itself fails only when the store cannot be opened or backed up.
     */
    [[nodiscard]] Result<AddReport> add_bookmarks(int64_t folder_id,
                                                  const std::vector<DeviceRecord>& devices);

    /**
     * Delete every ledgered bookmark of this database that is still present
     * and drop those entries from the ledger. Returns how many were deleted.
     */
    [[nodiscard]] Result<int> restore();

    [[nodiscard]] const QString& database_path() const { return database_path_; }
    [[nodiscard]] const std::optional<BackupSnapshot>& snapshot() const { return snapshot_; }

private:
    struct Store {
        Database db;
        PlacesSchema schema;
    };

    [[nodiscard]] Result<Store> open_store();
    [[nodiscard]] Result<void> ensure_snapshot();

    [[nodiscard]] Result<int64_t> find_or_create_place(Store& store, const PlacesUrl& url,
                                                       const std::string& title);
    [[nodiscard]] Result<int64_t> next_position(Store& store, int64_t parent_id);
    [[nodiscard]] Result<void> touch_folder(Store& store, int64_t folder_id, Timestamp when);
    [[nodiscard]] Result<BookmarkEntry> insert_bookmark(Store& store, int64_t folder_id,
                                                        const DeviceRecord& device);
    [[nodiscard]] Result<bool> delete_bookmark(Store& store, const BookmarkEntry& entry);

    QString database_path_;
    Ledger ledger_;
    std::optional<BackupSnapshot> snapshot_;
};

} // namespace ledmark::storage
