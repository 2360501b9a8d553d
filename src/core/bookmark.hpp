#pragma once

#include "core/types.hpp"
#include <cstdint>
#include <string>

namespace ledmark {

/**
 * BookmarkEntry - A bookmark row this tool created, as recorded in the
 * ledger.
 */
struct BookmarkEntry {
    int64_t id = 0;
    std::string title;
    std::string url;
    int64_t parent_folder_id = 0;
    Timestamp added_at;
    // Absolute path of the places database the row lives in.
    std::string database;

    bool operator==(const BookmarkEntry&) const = default;
};

/**
 * BackupSnapshot - Copy of the places database taken before the first
 * mutation of a run.
 */
struct BackupSnapshot {
    std::string source_path;
    std::string backup_path;
    Timestamp created_at;
};

} // namespace ledmark
