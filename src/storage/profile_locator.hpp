#pragma once

#include "core/result.hpp"

#include <QString>
#include <QStringList>

#include <functional>
#include <optional>
#include <vector>

namespace ledmark::storage {

constexpr const char* kPlacesFileName = "places.sqlite";

/**
 * ProfileCandidate - A directory holding a places database.
 */
struct ProfileCandidate {
    QString path;           // profile directory
    QString database_path;  // <path>/places.sqlite
    bool is_excluded = false;
};

/**
 * Picks one of the offered database paths; nullopt when the user declines.
 */
using ProfileSelector = std::function<std::optional<QString>(const QStringList&)>;

/**
 * Paths containing any of these are skipped by default: archived profiles,
 * mail clients and sandboxed browsers that share the places format.
 */
[[nodiscard]] QStringList default_excluded_keywords();

/**
 * Every directory under `root` (hidden ones included, symlinks not followed)
 * holding a places database, sorted by path, each flagged when its full path
 * contains one of `excluded_keywords` (case-sensitive substring match).
 */
[[nodiscard]] std::vector<ProfileCandidate> enumerate_profiles(const QString& root,
                                                               const QStringList& excluded_keywords);

/**
 * enumerate_profiles() without the excluded candidates.
 */
[[nodiscard]] std::vector<ProfileCandidate> locate_profiles(const QString& root,
                                                            const QStringList& excluded_keywords);

/**
 * Pick the database to modify.
 *
 * One candidate resolves directly. Several need `selector`; without one, or
 * when it declines or answers with a path that was not offered, this fails
 * with AmbiguousProfile. None fails with NoProfileFound.
 */
[[nodiscard]] Result<QString> resolve_profile(const std::vector<ProfileCandidate>& candidates,
                                              const ProfileSelector& selector = {});

} // namespace ledmark::storage
