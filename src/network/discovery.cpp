#include "network/discovery.hpp"
#include "network/mdns_discovery_backend.hpp"

#include <QEventLoop>
#include <QLoggingCategory>
#include <QTimer>

namespace ledmark::network {
namespace {
Q_LOGGING_CATEGORY(lmDiscoveryLog, "ledmark.discovery")
} // namespace

DiscoveryEngine::DiscoveryEngine(std::unique_ptr<DiscoveryBackend> backend)
    : backend_(std::move(backend))
{
    if (backend_) {
        backend_->on_service_resolved = [this](DeviceRecord record) {
            merge(std::move(record));
        };
        backend_->on_service_removed = [this](std::string name) {
            note_removed(name);
        };
    }
}

DiscoveryEngine::~DiscoveryEngine() {
    stop();
}

Result<std::vector<DeviceRecord>> DiscoveryEngine::scan(std::chrono::milliseconds duration) {
    using R = Result<std::vector<DeviceRecord>>;

    if (duration.count() <= 0) {
        return R::err(Error{ErrorKind::InvalidArgument, "Scan duration must be positive"});
    }
    if (!backend_) {
        return R::err(Error{ErrorKind::IOFailure, "Discovery backend not available"});
    }

    {
        std::lock_guard lock(mutex_);
        devices_.clear();
        accepting_ = true;
    }

    auto started = backend_->start_browsing(SERVICE_TYPE);
    if (started.is_err()) {
        {
            std::lock_guard lock(mutex_);
            accepting_ = false;
        }
        backend_->stop_browsing();
        return R::err(Error{ErrorKind::IOFailure,
                            "Failed to start browsing: " + started.unwrap_err().message,
                            started.unwrap_err().code});
    }
    browsing_ = true;

    qCInfo(lmDiscoveryLog) << "Browsing for" << SERVICE_TYPE << "for"
                           << duration.count() << "ms";

    QEventLoop loop;
    QTimer::singleShot(duration, &loop, &QEventLoop::quit);
    loop.exec();

    stop();

    std::vector<DeviceRecord> result;
    {
        std::lock_guard lock(mutex_);
        result.reserve(devices_.size());
        for (const auto& [name, record] : devices_) {
            result.push_back(record);
        }
    }

    qCInfo(lmDiscoveryLog) << "Scan finished," << result.size() << "device(s) found";
    return R::ok(std::move(result));
}

void DiscoveryEngine::stop() {
    {
        std::lock_guard lock(mutex_);
        accepting_ = false;
    }
    if (backend_ && browsing_.exchange(false)) {
        backend_->stop_browsing();
    }
}

void DiscoveryEngine::merge(DeviceRecord record) {
    std::lock_guard lock(mutex_);
    if (!accepting_) return;

    auto it = devices_.find(record.name);
    if (it == devices_.end()) {
        qCInfo(lmDiscoveryLog) << "Found" << record.name.c_str() << "at"
                               << record.host.c_str() << "port" << record.port;
        devices_.emplace(record.name, std::move(record));
    } else if (!(it->second == record)) {
        qCDebug(lmDiscoveryLog) << "Updated" << record.name.c_str() << "to"
                                << record.host.c_str() << "port" << record.port;
        it->second = std::move(record);
    }
}

void DiscoveryEngine::note_removed(const std::string& name) {
    // A device seen earlier in the window stays in the result.
    qCDebug(lmDiscoveryLog) << "Service removed:" << name.c_str();
}

std::unique_ptr<DiscoveryBackend> createDiscoveryBackend(const QString& preference) {
    const auto backend = preference.trimmed().toLower();
    if (backend == QStringLiteral("mdns")) {
        return std::make_unique<MdnsDiscoveryBackend>();
    }

#ifdef LEDMARK_HAS_AVAHI
    // Defined in platform/linux/avahi_discovery.cpp
    extern std::unique_ptr<DiscoveryBackend> createAvahiBackend();
    if (backend.isEmpty() || backend == QStringLiteral("avahi")) {
        return createAvahiBackend();
    }
#else
    if (backend.isEmpty()) {
        return std::make_unique<MdnsDiscoveryBackend>();
    }
#endif

    qCWarning(lmDiscoveryLog) << "Unknown or unavailable discovery backend:" << preference;
    return nullptr;
}

} // namespace ledmark::network
