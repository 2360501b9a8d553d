#pragma once

#include <cstdint>
#include <string>

namespace ledmark {

/**
 * DeviceRecord - One discovered lighting controller.
 *
 * `name` is the service instance name and identifies the device within a
 * scan; later announcements for the same name replace host and port.
 */
struct DeviceRecord {
    std::string name;
    std::string host;
    uint16_t port = 0;

    /**
     * http://<host>:<port>/ (IPv6 literals are bracketed).
     */
    [[nodiscard]] std::string url() const {
        const bool ipv6_literal = host.find(':') != std::string::npos;
        std::string authority = ipv6_literal ? "[" + host + "]" : host;
        return "http://" + authority + ":" + std::to_string(port) + "/";
    }

    bool operator==(const DeviceRecord&) const = default;
};

} // namespace ledmark
