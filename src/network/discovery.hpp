#pragma once

#include "core/device.hpp"
#include "core/result.hpp"

#include <QString>

#include <atomic>
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace ledmark::network {

/**
 * DiscoveryBackend - Abstract interface for platform-specific mDNS browsing.
 *
 * Callbacks may be invoked from a backend-owned thread (Avahi) or from the
 * Qt event loop (built-in querier). stop_browsing() must be idempotent and
 * must not return while a callback is still running.
 */
class DiscoveryBackend {
public:
    virtual ~DiscoveryBackend() = default;

    // service_type as "_wled._tcp"
    virtual Result<void, Error> start_browsing(const std::string& service_type) = 0;
    virtual void stop_browsing() = 0;

    // Callbacks
    std::function<void(DeviceRecord)> on_service_resolved;
    std::function<void(std::string)> on_service_removed;
};

/**
 * DiscoveryEngine - One-shot, time-boxed discovery of lighting controllers.
 *
 * DNS-SD service type: _wled._tcp
 *
 * scan() browses for the given window, merging every resolved announcement
 * into a map keyed by instance name (last write wins), then stops the
 * backend and returns the map's values ordered by name.
 */
class DiscoveryEngine {
public:
    static constexpr const char* SERVICE_TYPE = "_wled._tcp";

    explicit DiscoveryEngine(std::unique_ptr<DiscoveryBackend> backend);
    ~DiscoveryEngine();

    DiscoveryEngine(const DiscoveryEngine&) = delete;
    DiscoveryEngine& operator=(const DiscoveryEngine&) = delete;

    /**
     * Browse for `duration`. Fails with InvalidArgument for a non-positive
     * duration and IOFailure when the backend cannot start.
     */
    [[nodiscard]] Result<std::vector<DeviceRecord>> scan(std::chrono::milliseconds duration);

    /**
     * Stop browsing. Safe to call repeatedly and outside a scan.
     */
    void stop();

private:
    void merge(DeviceRecord record);
    void note_removed(const std::string& name);

    std::unique_ptr<DiscoveryBackend> backend_;
    std::mutex mutex_;
    std::map<std::string, DeviceRecord> devices_;
    bool accepting_ = false;  // guarded by mutex_
    std::atomic<bool> browsing_{false};
};

/**
 * Create a discovery backend.
 *
 * `preference` is "avahi", "mdns" or empty (Avahi when built with it, the
 * built-in querier otherwise). Returns nullptr for an unknown or unavailable
 * backend.
 */
std::unique_ptr<DiscoveryBackend> createDiscoveryBackend(const QString& preference);

} // namespace ledmark::network
