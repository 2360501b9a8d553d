#pragma once

#include <chrono>
#include <cstdint>
#include <compare>

namespace ledmark {

/**
 * Timestamp - Represents a point in time.
 *
 * Stored as microseconds since the Unix epoch, the resolution the browser
 * uses for dateAdded/lastModified columns.
 */
class Timestamp {
public:
    using Duration = std::chrono::microseconds;
    using Clock = std::chrono::system_clock;
    using TimePoint = std::chrono::time_point<Clock, Duration>;

    constexpr Timestamp() noexcept : micros_(0) {}

    explicit constexpr Timestamp(int64_t micros) noexcept : micros_(micros) {}

    explicit Timestamp(TimePoint tp) noexcept
        : micros_(tp.time_since_epoch().count()) {}

    [[nodiscard]] static Timestamp now() {
        return Timestamp(std::chrono::time_point_cast<Duration>(Clock::now()));
    }

    [[nodiscard]] constexpr int64_t micros() const noexcept {
        return micros_;
    }

    auto operator<=>(const Timestamp&) const = default;
    bool operator==(const Timestamp&) const = default;

private:
    int64_t micros_;
};

} // namespace ledmark
