#include "app/session.hpp"

#include "network/device_export.hpp"
#include "storage/bookmark_manager.hpp"

#include <QDir>
#include <QFileInfo>
#include <QLoggingCategory>

namespace ledmark::app {
namespace {
Q_LOGGING_CATEGORY(lmSessionLog, "ledmark.session")
} // namespace

std::string_view to_string(SessionState state) noexcept {
    switch (state) {
        case SessionState::Idle: return "Idle";
        case SessionState::Scanning: return "Scanning";
        case SessionState::ResolvingProfile: return "ResolvingProfile";
        case SessionState::Bookmarking: return "Bookmarking";
        case SessionState::Restoring: return "Restoring";
        case SessionState::Done: return "Done";
        case SessionState::Failed: return "Failed";
    }
    return "Unknown";
}

int exit_code_for(const SessionOutcome& outcome) {
    if (!outcome.error) {
        return outcome.succeeded() ? 0 : 1;
    }
    switch (outcome.error->kind) {
        case ErrorKind::NoProfileFound: return 2;
        case ErrorKind::NoDevicesFound: return 3;
        case ErrorKind::PartialInsertFailure: return 4;
        case ErrorKind::AmbiguousProfile: return 5;
        case ErrorKind::ResourceBusy: return 6;
        default: return 1;
    }
}

Session::Session(Config config, network::DiscoveryEngine* engine, storage::ProfileSelector selector)
    : config_(std::move(config))
    , engine_(engine)
    , selector_(std::move(selector))
{
}

void Session::transition(SessionState next) {
    qCDebug(lmSessionLog) << "Session:" << to_string(state_).data() << "->" << to_string(next).data();
    state_ = next;
    outcome_.state = next;
    if (on_state_changed) {
        on_state_changed(next);
    }
}

void Session::fail(Error error) {
    qCWarning(lmSessionLog) << "Session failed in" << to_string(state_).data() << "("
                            << to_string(error.kind).data() << "):" << error.message.c_str();
    outcome_.error = std::move(error);
    transition(SessionState::Failed);
}

SessionOutcome Session::run() {
    outcome_ = SessionOutcome{};
    state_ = SessionState::Idle;

    if (config_.mode == RunMode::Restore) {
        run_restore();
    } else {
        run_bookmark();
    }
    return outcome_;
}

Result<QString> Session::resolve_database() {
    if (!config_.profile_path.isEmpty()) {
        QFileInfo info(config_.profile_path);
        if (info.isDir()) {
            info = QFileInfo(QDir(info.absoluteFilePath()).filePath(QString::fromLatin1(storage::kPlacesFileName)));
        }
        if (!info.isFile()) {
            return Result<QString>::err(Error{ErrorKind::NoProfileFound,
                                              "Profile path does not exist: " +
                                                  config_.profile_path.toStdString()});
        }
        qCInfo(lmSessionLog) << "Using places.sqlite from override:" << info.absoluteFilePath();
        return Result<QString>::ok(info.absoluteFilePath());
    }

    qCInfo(lmSessionLog) << "Searching for places.sqlite under" << config_.search_root;
    const auto candidates = storage::locate_profiles(config_.search_root, config_.excluded_keywords);
    return storage::resolve_profile(candidates, selector_);
}

void Session::run_bookmark() {
    if (!engine_) {
        fail(Error{ErrorKind::InvalidArgument, "No discovery engine configured"});
        return;
    }

    transition(SessionState::Scanning);
    qCInfo(lmSessionLog) << "Scanning for WLED devices for" << config_.scan_duration.count() << "ms";
    auto scanned = engine_->scan(config_.scan_duration);
    if (scanned.is_err()) {
        fail(scanned.unwrap_err());
        return;
    }
    outcome_.devices = std::move(scanned).unwrap();
    if (outcome_.devices.empty()) {
        fail(Error{ErrorKind::NoDevicesFound, "No WLED devices found"});
        return;
    }
    for (const auto& device : outcome_.devices) {
        qCInfo(lmSessionLog) << "Found" << device.name.c_str() << "at" << device.url().c_str();
    }

    auto exported = network::export_devices(outcome_.devices, config_.output_path);
    if (exported.is_err()) {
        qCWarning(lmSessionLog) << "Export failed:" << exported.unwrap_err().message.c_str();
    } else {
        qCInfo(lmSessionLog) << "Discovered devices written to" << config_.output_path;
    }

    transition(SessionState::ResolvingProfile);
    auto database = resolve_database();
    if (database.is_err()) {
        fail(database.unwrap_err());
        return;
    }
    outcome_.database_path = database.unwrap();

    transition(SessionState::Bookmarking);
    storage::BookmarkManager manager(outcome_.database_path, config_.ledger_path);

    auto folder = manager.ensure_folder(config_.folder_name.toStdString());
    outcome_.snapshot = manager.snapshot();
    if (folder.is_err()) {
        fail(folder.unwrap_err());
        return;
    }

    auto report = manager.add_bookmarks(folder.unwrap(), outcome_.devices);
    if (report.is_err()) {
        fail(report.unwrap_err());
        return;
    }

    auto& added = report.unwrap();
    outcome_.added = std::move(added.added);
    for (auto& failure : added.failed) {
        outcome_.skipped.push_back(std::move(failure.device));
    }

    if (!outcome_.skipped.empty()) {
        outcome_.error = Error{ErrorKind::PartialInsertFailure,
                               std::to_string(outcome_.skipped.size()) + " of " +
                                   std::to_string(outcome_.devices.size()) +
                                   " devices could not be bookmarked"};
        qCWarning(lmSessionLog) << outcome_.error->message.c_str();
    }
    qCInfo(lmSessionLog) << "Added" << outcome_.added.size() << "bookmarks to" << config_.folder_name;
    transition(SessionState::Done);
}

void Session::run_restore() {
    transition(SessionState::ResolvingProfile);
    auto database = resolve_database();
    if (database.is_err()) {
        fail(database.unwrap_err());
        return;
    }
    outcome_.database_path = database.unwrap();

    transition(SessionState::Restoring);
    storage::BookmarkManager manager(outcome_.database_path, config_.ledger_path);
    auto removed = manager.restore();
    outcome_.snapshot = manager.snapshot();
    if (removed.is_err()) {
        fail(removed.unwrap_err());
        return;
    }

    outcome_.removed = removed.unwrap();
    qCInfo(lmSessionLog) << "Restore removed" << outcome_.removed << "bookmarks";
    transition(SessionState::Done);
}

} // namespace ledmark::app
