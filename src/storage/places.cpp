#include "storage/places.hpp"

#include <QByteArray>
#include <QRandomGenerator>
#include <QUrl>

#include <algorithm>
#include <array>
#include <cctype>

namespace ledmark::storage {
namespace {

constexpr uint32_t kGoldenRatioU32 = 0x9E3779B9U;
constexpr size_t kMaxCharsToHash = 1500;
constexpr size_t kMaxSchemeSearch = 50;

constexpr std::array kRequiredBookmarkColumns = {
    "id", "type", "fk", "parent", "position", "title", "dateAdded", "lastModified",
};
constexpr std::array kRequiredPlaceColumns = {"id", "url", "title", "rev_host"};

uint32_t add_u32_to_hash(uint32_t hash, uint32_t value) {
    const uint32_t rotated = (hash << 5) | (hash >> 27);
    return kGoldenRatioU32 * (rotated ^ value);
}

uint32_t hash_string(std::string_view s) {
    uint32_t hash = 0;
    for (unsigned char c : s) {
        // Bytes widen unsigned, so UTF-8 hosts hash like the browser's.
        hash = add_u32_to_hash(hash, c);
    }
    return hash;
}

Error schema_error(const std::string& what) {
    return Error{ErrorKind::SchemaViolation, "Unexpected places schema: " + what};
}

template<typename Columns>
Result<void> require_columns(const std::set<std::string>& present,
                             const Columns& required,
                             const std::string& table) {
    if (present.empty()) {
        return Result<void>::err(schema_error(table + " table missing"));
    }
    for (const char* column : required) {
        if (!present.contains(column)) {
            return Result<void>::err(schema_error(table + "." + column + " missing"));
        }
    }
    return Result<void>::ok();
}

Result<std::optional<int64_t>> query_single_id(Database& db, const std::string& sql,
                                               const std::string& arg) {
    using R = Result<std::optional<int64_t>>;

    auto stmt_result = db.prepare(sql);
    if (stmt_result.is_err()) return R::err(stmt_result.unwrap_err());
    auto stmt = std::move(stmt_result).unwrap();

    auto bound = stmt.bind_all(arg);
    if (bound.is_err()) return R::err(bound.unwrap_err());

    auto row = stmt.step();
    if (row.is_err()) return R::err(row.unwrap_err());
    if (!row.unwrap()) return R::ok(std::nullopt);
    return R::ok(stmt.column_int64(0));
}

} // namespace

Result<PlacesSchema> inspect_places_schema(Database& db) {
    using R = Result<PlacesSchema>;

    auto bookmark_columns = db.table_columns("moz_bookmarks");
    if (bookmark_columns.is_err()) return R::err(bookmark_columns.unwrap_err());
    auto place_columns = db.table_columns("moz_places");
    if (place_columns.is_err()) return R::err(place_columns.unwrap_err());

    const auto& bookmarks = bookmark_columns.unwrap();
    const auto& places = place_columns.unwrap();

    auto required = require_columns(bookmarks, kRequiredBookmarkColumns, "moz_bookmarks");
    if (required.is_err()) return R::err(required.unwrap_err());
    required = require_columns(places, kRequiredPlaceColumns, "moz_places");
    if (required.is_err()) return R::err(required.unwrap_err());

    PlacesSchema schema;
    schema.bookmark_guid = bookmarks.contains("guid");
    schema.bookmark_sync_change_counter = bookmarks.contains("syncChangeCounter");
    schema.bookmark_sync_status = bookmarks.contains("syncStatus");
    schema.place_guid = places.contains("guid");
    schema.place_url_hash = places.contains("url_hash");
    schema.place_foreign_count = places.contains("foreign_count");
    schema.place_frecency = places.contains("frecency");

    if (places.contains("origin_id")) {
        auto origin_columns = db.table_columns("moz_origins");
        if (origin_columns.is_err()) return R::err(origin_columns.unwrap_err());
        const auto& origins = origin_columns.unwrap();
        schema.place_origin = origins.contains("prefix") && origins.contains("host") &&
                              origins.contains("frecency");
    }

    auto deleted_columns = db.table_columns("moz_bookmarks_deleted");
    if (deleted_columns.is_err()) return R::err(deleted_columns.unwrap_err());
    schema.deleted_tombstones = deleted_columns.unwrap().contains("guid") &&
                                deleted_columns.unwrap().contains("dateRemoved");

    Result<std::optional<int64_t>> menu = Result<std::optional<int64_t>>::ok(std::nullopt);
    if (schema.bookmark_guid) {
        menu = query_single_id(db, "SELECT id FROM moz_bookmarks WHERE guid = ?;", kMenuRootGuid);
    } else {
        auto roots = db.table_columns("moz_bookmarks_roots");
        if (roots.is_err()) return R::err(roots.unwrap_err());
        if (roots.unwrap().contains("root_name") && roots.unwrap().contains("folder_id")) {
            menu = query_single_id(db, "SELECT folder_id FROM moz_bookmarks_roots WHERE root_name = ?;",
                                   "menu");
        }
    }
    if (menu.is_err()) return R::err(menu.unwrap_err());
    if (!menu.unwrap()) {
        return R::err(schema_error("bookmarks menu root not found"));
    }
    schema.menu_root_id = *menu.unwrap();

    return R::ok(schema);
}

Result<PlacesUrl> parse_places_url(const std::string& url) {
    const QUrl parsed(QString::fromStdString(url), QUrl::StrictMode);
    const auto scheme = parsed.scheme().toLower();

    if (!parsed.isValid() || (scheme != QStringLiteral("http") && scheme != QStringLiteral("https"))
        || parsed.host().isEmpty()) {
        return Result<PlacesUrl>::err(Error{ErrorKind::InvalidArgument, "Malformed URL: " + url});
    }

    PlacesUrl out;
    out.href = url;
    out.prefix = scheme.toStdString() + "://";
    auto host = parsed.host().toLower();
    if (host.contains(QLatin1Char(':'))) {
        host = QLatin1Char('[') + host + QLatin1Char(']');
    }
    if (parsed.port() != -1) {
        host += QLatin1Char(':') + QString::number(parsed.port());
    }
    out.host = host.toStdString();
    out.rev_host = reversed_host(parsed.host().toStdString());
    return Result<PlacesUrl>::ok(std::move(out));
}

std::string reversed_host(std::string_view host) {
    std::string out(host.rbegin(), host.rend());
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    out += '.';
    return out;
}

uint64_t places_url_hash(std::string_view url) {
    const uint32_t url_hash = hash_string(url.substr(0, kMaxCharsToHash));

    const auto head = url.substr(0, kMaxSchemeSearch);
    const auto colon = head.find(':');
    if (colon == std::string_view::npos) {
        return url_hash;
    }

    const uint64_t prefix_hash = hash_string(head.substr(0, colon)) & 0x0000FFFFU;
    return (prefix_hash << 32) + url_hash;
}

std::string make_places_guid() {
    QByteArray bytes(9, '\0');
    auto* rng = QRandomGenerator::global();
    for (auto& b : bytes) {
        b = static_cast<char>(rng->bounded(256));
    }
    return bytes.toBase64(QByteArray::Base64UrlEncoding | QByteArray::OmitTrailingEquals).toStdString();
}

} // namespace ledmark::storage
