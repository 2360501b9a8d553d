#pragma once

#include "app/config.hpp"
#include "core/bookmark.hpp"
#include "core/device.hpp"
#include "core/result.hpp"
#include "network/discovery.hpp"
#include "storage/profile_locator.hpp"

#include <QString>

#include <functional>
#include <optional>
#include <string_view>
#include <vector>

namespace ledmark::app {

enum class SessionState {
    Idle,
    Scanning,
    ResolvingProfile,
    Bookmarking,
    Restoring,
    Done,
    Failed,
};

[[nodiscard]] std::string_view to_string(SessionState state) noexcept;

/**
 * SessionOutcome - Where a run ended and what it did on the way.
 *
 * `error` is set when the run Failed, and also when it reached Done with
 * some devices skipped (PartialInsertFailure).
 */
struct SessionOutcome {
    SessionState state = SessionState::Idle;
    std::optional<Error> error;

    std::vector<DeviceRecord> devices;
    QString database_path;
    std::optional<BackupSnapshot> snapshot;
    std::vector<BookmarkEntry> added;
    std::vector<DeviceRecord> skipped;
    int removed = 0;

    [[nodiscard]] bool succeeded() const { return state == SessionState::Done; }
};

/**
 * Process exit code for an outcome: 0 success, 2 no profile, 3 no devices,
 * 4 partial bookmark failure, 5 ambiguous profile, 6 database busy, 1 for
 * anything else.
 */
[[nodiscard]] int exit_code_for(const SessionOutcome& outcome);

/**
 * Session - One run: scan and bookmark, or restore.
 *
 *   Idle -> Scanning -> ResolvingProfile -> Bookmarking -> Done
 *   Idle -> ResolvingProfile -> Restoring -> Done
 *
 * Any error moves to Failed, except skipped devices, which still end in Done.
 * Nothing is retried.
 */
class Session {
public:
    /**
     * `engine` is only used for scanning and may be null in restore mode.
     * `selector` picks a profile when several are found.
     */
    Session(Config config, network::DiscoveryEngine* engine, storage::ProfileSelector selector = {});

    SessionOutcome run();

    [[nodiscard]] SessionState state() const { return state_; }

    // Called after every state change.
    std::function<void(SessionState)> on_state_changed;

private:
    void transition(SessionState next);
    void fail(Error error);

    [[nodiscard]] Result<QString> resolve_database();

    void run_bookmark();
    void run_restore();

    Config config_;
    network::DiscoveryEngine* engine_;
    storage::ProfileSelector selector_;
    SessionState state_ = SessionState::Idle;
    SessionOutcome outcome_;
};

} // namespace ledmark::app
