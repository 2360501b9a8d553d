#include <catch2/catch_test_macros.hpp>
#include "network/discovery.hpp"

#include <QElapsedTimer>

#include <memory>
#include <thread>

using namespace ledmark;
using namespace ledmark::network;
using namespace std::chrono_literals;

namespace {

struct BackendLog {
    int starts = 0;
    int stops = 0;
    std::string service_type;
};

// Announces from its own thread, the way the Avahi poll thread does.
class FakeBackend : public DiscoveryBackend {
public:
    FakeBackend(std::shared_ptr<BackendLog> log, std::vector<DeviceRecord> announce,
                std::vector<std::string> removals = {}, bool fail_start = false)
        : log_(std::move(log))
        , announce_(std::move(announce))
        , removals_(std::move(removals))
        , fail_start_(fail_start) {}

    ~FakeBackend() override {
        if (worker_.joinable()) worker_.join();
    }

    Result<void, Error> start_browsing(const std::string& service_type) override {
        ++log_->starts;
        log_->service_type = service_type;
        if (fail_start_) {
            return Result<void, Error>::err(Error{"Daemon not running"});
        }
        worker_ = std::thread([this] {
            for (const auto& device : announce_) {
                std::this_thread::sleep_for(2ms);
                on_service_resolved(device);
            }
            for (const auto& name : removals_) {
                on_service_removed(name);
            }
        });
        return Result<void, Error>::ok();
    }

    void stop_browsing() override {
        ++log_->stops;
        if (worker_.joinable()) worker_.join();
    }

private:
    std::shared_ptr<BackendLog> log_;
    std::vector<DeviceRecord> announce_;
    std::vector<std::string> removals_;
    bool fail_start_;
    std::thread worker_;
};

DeviceRecord device(std::string name, std::string host, uint16_t port) {
    return DeviceRecord{.name = std::move(name), .host = std::move(host), .port = port};
}

} // namespace

TEST_CASE("DeviceRecord builds an http URL", "[discovery]") {
    REQUIRE(device("alpha", "10.0.0.5", 80).url() == "http://10.0.0.5:80/");
    REQUIRE(device("beta", "wled-beta.local", 8080).url() == "http://wled-beta.local:8080/");
    REQUIRE(device("gamma", "fe80::1", 80).url() == "http://[fe80::1]:80/");
}

TEST_CASE("DiscoveryEngine merges announcements by name", "[discovery]") {
    auto log = std::make_shared<BackendLog>();
    DiscoveryEngine engine(std::make_unique<FakeBackend>(
        log,
        std::vector<DeviceRecord>{
            device("beta", "10.0.0.6", 80),
            device("alpha", "10.0.0.5", 80),
            device("alpha", "10.0.0.7", 8080),
        }));

    auto result = engine.scan(200ms);
    REQUIRE(result.is_ok());
    const auto& devices = result.unwrap();

    REQUIRE(log->service_type == "_wled._tcp");
    REQUIRE(devices.size() == 2);
    REQUIRE(devices[0].name == "alpha");
    REQUIRE(devices[0].host == "10.0.0.7");
    REQUIRE(devices[0].port == 8080);
    REQUIRE(devices[1].name == "beta");
}

TEST_CASE("DiscoveryEngine keeps devices announced as removed", "[discovery]") {
    auto log = std::make_shared<BackendLog>();
    DiscoveryEngine engine(std::make_unique<FakeBackend>(
        log, std::vector<DeviceRecord>{device("alpha", "10.0.0.5", 80)},
        std::vector<std::string>{"alpha"}));

    auto result = engine.scan(150ms);
    REQUIRE(result.is_ok());
    REQUIRE(result.unwrap().size() == 1);
}

TEST_CASE("DiscoveryEngine rejects a non-positive duration", "[discovery]") {
    auto log = std::make_shared<BackendLog>();
    DiscoveryEngine engine(std::make_unique<FakeBackend>(log, std::vector<DeviceRecord>{}));

    for (auto duration : {0ms, -5ms}) {
        auto result = engine.scan(duration);
        REQUIRE(result.is_err());
        REQUIRE(result.unwrap_err().kind == ErrorKind::InvalidArgument);
    }
    REQUIRE(log->starts == 0);
}

TEST_CASE("DiscoveryEngine reports a backend that cannot start", "[discovery]") {
    SECTION("Start failure") {
        auto log = std::make_shared<BackendLog>();
        DiscoveryEngine engine(std::make_unique<FakeBackend>(log, std::vector<DeviceRecord>{},
                                                             std::vector<std::string>{}, true));
        auto result = engine.scan(100ms);
        REQUIRE(result.is_err());
        REQUIRE(result.unwrap_err().kind == ErrorKind::IOFailure);
    }

    SECTION("No backend") {
        DiscoveryEngine engine(nullptr);
        auto result = engine.scan(100ms);
        REQUIRE(result.is_err());
        REQUIRE(result.unwrap_err().kind == ErrorKind::IOFailure);
    }
}

TEST_CASE("DiscoveryEngine returns after the scan window", "[discovery]") {
    auto log = std::make_shared<BackendLog>();
    DiscoveryEngine engine(std::make_unique<FakeBackend>(log, std::vector<DeviceRecord>{}));

    QElapsedTimer timer;
    timer.start();
    auto result = engine.scan(300ms);
    const auto elapsed = timer.elapsed();

    REQUIRE(result.is_ok());
    REQUIRE(result.unwrap().empty());
    REQUIRE(elapsed >= 250);
    REQUIRE(elapsed < 3000);
}

TEST_CASE("DiscoveryEngine::stop is idempotent", "[discovery]") {
    auto log = std::make_shared<BackendLog>();
    DiscoveryEngine engine(std::make_unique<FakeBackend>(
        log, std::vector<DeviceRecord>{device("alpha", "10.0.0.5", 80)}));

    engine.stop();
    REQUIRE(log->stops == 0);

    REQUIRE(engine.scan(100ms).is_ok());
    REQUIRE(log->stops == 1);

    engine.stop();
    engine.stop();
    REQUIRE(log->stops == 1);
}
