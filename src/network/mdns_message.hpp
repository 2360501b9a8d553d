#pragma once

#include "core/device.hpp"
#include "core/result.hpp"

#include <QByteArray>

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace ledmark::network {

// Multicast DNS wire helpers (used by MdnsDiscoveryBackend).
// Kept separate so the codec can be tested without sockets.

constexpr const char* kMdnsGroupIPv4 = "224.0.0.251";
constexpr uint16_t kMdnsPort = 5353;

enum class RecordType : uint16_t {
    A = 1,
    PTR = 12,
    TXT = 16,
    AAAA = 28,
    SRV = 33,
    ANY = 255,
};

struct Question {
    std::string name;
    uint16_t type = 0;
    uint16_t rclass = 0;
};

/**
 * A decoded resource record. Only the rdata fields of the record types
 * discovery cares about are filled in; others keep their name/type/ttl.
 */
struct ResourceRecord {
    std::string name;
    uint16_t type = 0;
    uint16_t rclass = 0;
    uint32_t ttl = 0;

    std::string target;   // PTR instance name, SRV target host
    uint16_t port = 0;    // SRV
    std::string address;  // A / AAAA, textual
};

struct Message {
    uint16_t id = 0;
    uint16_t flags = 0;
    std::vector<Question> questions;
    // Answer, authority and additional sections, in wire order.
    std::vector<ResourceRecord> records;

    [[nodiscard]] bool is_response() const { return (flags & 0x8000) != 0; }
};

/**
 * Encode a one-question query. Names are dotted, without the trailing dot.
 */
[[nodiscard]] QByteArray encode_query(const std::string& name, RecordType type);

/**
 * Decode a datagram. Compression pointers are followed; pointer loops,
 * truncated sections and out-of-range offsets are errors.
 */
[[nodiscard]] Result<Message> decode_message(const QByteArray& datagram);

/**
 * Case-insensitive DNS name comparison.
 */
[[nodiscard]] bool dns_name_equal(const std::string& a, const std::string& b);

/**
 * ServiceCollector - Folds PTR/SRV/A records from successive responses into
 * resolved service instances of one service type.
 */
class ServiceCollector {
public:
    struct Update {
        enum class Kind { Resolved, Removed };
        Kind kind;
        DeviceRecord device;  // only name is set for Removed
    };

    // service_type as "_wled._tcp.local"
    explicit ServiceCollector(std::string service_type);

    /**
     * Ingest one response; returns instances that became resolved or changed
     * address/port, and instances announced with TTL 0. SRV records count
     * only for instances a PTR record has named.
     */
    [[nodiscard]] std::vector<Update> ingest(const Message& message);

private:
    struct Instance {
        std::string target;
        uint16_t port = 0;
        DeviceRecord last_reported;
        bool reported = false;
    };

    [[nodiscard]] std::string instance_label(const std::string& full_name) const;

    std::string service_type_;
    std::map<std::string, Instance> instances_;       // keyed by instance label
    std::map<std::string, std::string> addresses_;    // lower-cased host -> IPv4
};

} // namespace ledmark::network
