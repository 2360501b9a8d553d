#include "storage/profile_locator.hpp"

#include <QDir>
#include <QDirIterator>
#include <QFileInfo>
#include <QLoggingCategory>

#include <algorithm>

namespace ledmark::storage {
namespace {
Q_LOGGING_CATEGORY(lmProfileLog, "ledmark.store")
} // namespace

QStringList default_excluded_keywords() {
    return {
        QStringLiteral("Old"),
        QStringLiteral(".thunderbird"),
        QStringLiteral(".wine"),
        QStringLiteral("TorBrowser"),
    };
}

std::vector<ProfileCandidate> enumerate_profiles(const QString& root,
                                                 const QStringList& excluded_keywords) {
    std::vector<ProfileCandidate> candidates;

    QDirIterator it(root,
                    QStringList{QString::fromLatin1(kPlacesFileName)},
                    QDir::Files | QDir::Hidden | QDir::System,
                    QDirIterator::Subdirectories);
    while (it.hasNext()) {
        const QFileInfo file(it.next());
        if (file.fileName() != QLatin1String(kPlacesFileName)) continue;

        ProfileCandidate candidate;
        candidate.path = file.absolutePath();
        candidate.database_path = file.absoluteFilePath();
        candidate.is_excluded = std::any_of(
            excluded_keywords.begin(), excluded_keywords.end(),
            [&](const QString& keyword) {
                return !keyword.isEmpty() && candidate.database_path.contains(keyword, Qt::CaseSensitive);
            });
        candidates.push_back(std::move(candidate));
    }

    std::sort(candidates.begin(), candidates.end(),
              [](const ProfileCandidate& a, const ProfileCandidate& b) {
                  return a.database_path < b.database_path;
              });
    return candidates;
}

std::vector<ProfileCandidate> locate_profiles(const QString& root,
                                              const QStringList& excluded_keywords) {
    auto all = enumerate_profiles(root, excluded_keywords);

    std::vector<ProfileCandidate> kept;
    for (auto& candidate : all) {
        if (candidate.is_excluded) {
            qCDebug(lmProfileLog) << "Skipping excluded profile" << candidate.database_path;
            continue;
        }
        kept.push_back(std::move(candidate));
    }
    return kept;
}

Result<QString> resolve_profile(const std::vector<ProfileCandidate>& candidates,
                                const ProfileSelector& selector) {
    if (candidates.empty()) {
        return Result<QString>::err(Error{ErrorKind::NoProfileFound, "No valid places.sqlite found"});
    }

    if (candidates.size() == 1) {
        qCInfo(lmProfileLog) << "Found places.sqlite at" << candidates.front().database_path;
        return Result<QString>::ok(candidates.front().database_path);
    }

    QStringList offered;
    for (const auto& candidate : candidates) {
        offered.push_back(candidate.database_path);
    }

    if (!selector) {
        return Result<QString>::err(Error{
            ErrorKind::AmbiguousProfile,
            std::to_string(candidates.size()) + " profiles found and no way to choose"});
    }

    const auto chosen = selector(offered);
    if (!chosen || !offered.contains(*chosen)) {
        return Result<QString>::err(Error{ErrorKind::AmbiguousProfile, "No profile selected"});
    }

    qCInfo(lmProfileLog) << "Selected places.sqlite:" << *chosen;
    return Result<QString>::ok(*chosen);
}

} // namespace ledmark::storage
