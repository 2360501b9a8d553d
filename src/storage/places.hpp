#pragma once

#include "core/result.hpp"
#include "storage/database.hpp"

#include <cstdint>
#include <string>
#include <string_view>

namespace ledmark::storage {

constexpr int kBookmarkTypeUrl = 1;
constexpr int kBookmarkTypeFolder = 2;

// moz_bookmarks.syncStatus of a row the sync server already has.
constexpr int kSyncStatusNormal = 2;

// moz_bookmarks.guid of the "Bookmarks Menu" root.
constexpr const char* kMenuRootGuid = "menu________";

/**
 * PlacesSchema - Which parts of the places schema this database has.
 *
 * The required columns are checked by inspect_places_schema(); the optional
 * ones vary across browser versions and are written only when present.
 */
struct PlacesSchema {
    int64_t menu_root_id = 0;

    bool bookmark_guid = false;
    bool bookmark_sync_change_counter = false;
    bool bookmark_sync_status = false;
    bool deleted_tombstones = false;  // moz_bookmarks_deleted(guid, dateRemoved)

    bool place_guid = false;
    bool place_url_hash = false;
    bool place_foreign_count = false;
    bool place_frecency = false;
    bool place_origin = false;  // moz_places.origin_id + moz_origins table
};

/**
 * Verify moz_bookmarks/moz_places carry the columns bookmarks need and
 * locate the menu root. Missing pieces fail with SchemaViolation.
 */
[[nodiscard]] Result<PlacesSchema> inspect_places_schema(Database& db);

/**
 * The parts of a bookmark URL the places tables store separately.
 */
struct PlacesUrl {
    std::string href;      // the URL as stored in moz_places.url
    std::string prefix;    // "http://"
    std::string host;      // host[:port], as moz_origins.host
    std::string rev_host;  // reversed host with trailing dot
};

/**
 * Validate an http(s) URL with a host. Anything else is InvalidArgument.
 */
[[nodiscard]] Result<PlacesUrl> parse_places_url(const std::string& url);

/**
 * Reverse a host name for moz_places.rev_host: "10.0.0.5" -> "5.0.0.01.".
 */
[[nodiscard]] std::string reversed_host(std::string_view host);

/**
 * The browser's 48-bit URL hash used for moz_places.url_hash: the low 16 bits
 * of the scheme hash in the upper bits, the hash of the whole URL below.
 */
[[nodiscard]] uint64_t places_url_hash(std::string_view url);

/**
 * A fresh 12-character base64url guid.
 */
[[nodiscard]] std::string make_places_guid();

} // namespace ledmark::storage
