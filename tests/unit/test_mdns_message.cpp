#include <catch2/catch_test_macros.hpp>
#include "network/mdns_message.hpp"

#include <string_view>

using namespace ledmark;
using namespace ledmark::network;

namespace {

// Hand-assembled DNS packets, so compression offsets are explicit.
class Packet {
public:
    Packet& u16(uint16_t v) {
        bytes.append(static_cast<char>(v >> 8));
        bytes.append(static_cast<char>(v & 0xFF));
        return *this;
    }
    Packet& u32(uint32_t v) {
        return u16(static_cast<uint16_t>(v >> 16)).u16(static_cast<uint16_t>(v & 0xFFFF));
    }
    Packet& label(std::string_view s) {
        bytes.append(static_cast<char>(s.size()));
        bytes.append(s.data(), static_cast<qsizetype>(s.size()));
        return *this;
    }
    Packet& pointer(int offset) {
        bytes.append(static_cast<char>(0xC0 | (offset >> 8)));
        bytes.append(static_cast<char>(offset & 0xFF));
        return *this;
    }
    Packet& end() {
        bytes.append('\0');
        return *this;
    }

    // Writes type/class/ttl and a placeholder rdlength; returns where rdata starts.
    int begin_rdata(uint16_t type, uint16_t rclass, uint32_t ttl) {
        u16(type).u16(rclass).u32(ttl).u16(0);
        return offset();
    }
    void end_rdata(int start) {
        const auto len = offset() - start;
        bytes[start - 2] = static_cast<char>(len >> 8);
        bytes[start - 1] = static_cast<char>(len & 0xFF);
    }

    [[nodiscard]] int offset() const { return static_cast<int>(bytes.size()); }

    QByteArray bytes;
};

struct Announcement {
    uint32_t ptr_ttl = 4500;
    bool with_address = true;
};

// PTR _wled._tcp.local -> alpha, SRV alpha -> wled-alpha.local:80, A 10.0.0.5,
// every name after the first compressed.
QByteArray alpha_response(Announcement opts = {}) {
    Packet p;
    p.u16(0).u16(0x8400).u16(0).u16(1).u16(0).u16(opts.with_address ? 2 : 1);

    const int service = p.offset();
    p.label("_wled").label("_tcp").label("local").end();
    const int local = service + 6 + 5;

    auto rd = p.begin_rdata(12, 1, opts.ptr_ttl);
    const int instance = p.offset();
    p.label("alpha").pointer(service);
    p.end_rdata(rd);

    p.pointer(instance);
    rd = p.begin_rdata(33, 0x8001, 120);
    p.u16(0).u16(0).u16(80);
    const int target = p.offset();
    p.label("wled-alpha").pointer(local);
    p.end_rdata(rd);

    if (opts.with_address) {
        p.pointer(target);
        rd = p.begin_rdata(1, 0x8001, 120);
        p.bytes.append(static_cast<char>(10)).append('\0').append('\0').append(static_cast<char>(5));
        p.end_rdata(rd);
    }
    return p.bytes;
}

} // namespace

TEST_CASE("encode_query builds a single PTR question", "[mdns]") {
    const auto query = encode_query("_wled._tcp.local", RecordType::PTR);

    auto decoded = decode_message(query);
    REQUIRE(decoded.is_ok());
    const auto& msg = decoded.unwrap();
    REQUIRE_FALSE(msg.is_response());
    REQUIRE(msg.questions.size() == 1);
    REQUIRE(msg.questions[0].name == "_wled._tcp.local");
    REQUIRE(msg.questions[0].type == 12);
    REQUIRE(msg.questions[0].rclass == 1);
    REQUIRE(msg.records.empty());
}

TEST_CASE("decode_message follows compression pointers", "[mdns]") {
    auto decoded = decode_message(alpha_response());
    REQUIRE(decoded.is_ok());
    const auto& msg = decoded.unwrap();

    REQUIRE(msg.is_response());
    REQUIRE(msg.records.size() == 3);

    REQUIRE(msg.records[0].name == "_wled._tcp.local");
    REQUIRE(msg.records[0].target == "alpha._wled._tcp.local");
    REQUIRE(msg.records[0].ttl == 4500);

    REQUIRE(msg.records[1].name == "alpha._wled._tcp.local");
    REQUIRE(msg.records[1].port == 80);
    REQUIRE(msg.records[1].target == "wled-alpha.local");
    REQUIRE(msg.records[1].rclass == 1);

    REQUIRE(msg.records[2].name == "wled-alpha.local");
    REQUIRE(msg.records[2].address == "10.0.0.5");
}

TEST_CASE("decode_message rejects broken packets", "[mdns]") {
    SECTION("Short header") {
        auto decoded = decode_message(QByteArray("\x00\x00\x84", 3));
        REQUIRE(decoded.is_err());
        REQUIRE(decoded.unwrap_err().kind == ErrorKind::InvalidArgument);
    }

    SECTION("Compression loop") {
        Packet p;
        p.u16(0).u16(0x8400).u16(0).u16(1).u16(0).u16(0);
        p.pointer(12);
        auto decoded = decode_message(p.bytes);
        REQUIRE(decoded.is_err());
        REQUIRE(decoded.unwrap_err().message.find("compression loop") != std::string::npos);
    }

    SECTION("Pointer past the end") {
        Packet p;
        p.u16(0).u16(0x8400).u16(0).u16(1).u16(0).u16(0);
        p.pointer(0x3FF);
        auto decoded = decode_message(p.bytes);
        REQUIRE(decoded.is_err());
        REQUIRE(decoded.unwrap_err().message.find("out of range") != std::string::npos);
    }

    SECTION("Record count larger than the packet") {
        auto bytes = alpha_response();
        bytes[7] = 5;  // ancount
        REQUIRE(decode_message(bytes).is_err());
    }
}

TEST_CASE("dns_name_equal ignores case", "[mdns]") {
    REQUIRE(dns_name_equal("_WLED._tcp.Local", "_wled._tcp.local"));
    REQUIRE_FALSE(dns_name_equal("_wled._tcp.local", "_wled._udp.local"));
}

TEST_CASE("ServiceCollector resolves an announced instance", "[mdns]") {
    ServiceCollector collector("_wled._tcp.local");
    const auto msg = decode_message(alpha_response()).unwrap();

    auto updates = collector.ingest(msg);
    REQUIRE(updates.size() == 1);
    REQUIRE(updates[0].kind == ServiceCollector::Update::Kind::Resolved);
    REQUIRE(updates[0].device.name == "alpha");
    REQUIRE(updates[0].device.host == "10.0.0.5");
    REQUIRE(updates[0].device.port == 80);

    SECTION("Repeated responses are not reported again") {
        REQUIRE(collector.ingest(msg).empty());
    }

    SECTION("A goodbye packet reports a removal") {
        const auto goodbye = decode_message(alpha_response({.ptr_ttl = 0})).unwrap();
        auto removed = collector.ingest(goodbye);
        REQUIRE(removed.size() == 1);
        REQUIRE(removed[0].kind == ServiceCollector::Update::Kind::Removed);
        REQUIRE(removed[0].device.name == "alpha");
    }
}

TEST_CASE("ServiceCollector falls back to the SRV target without an A record", "[mdns]") {
    ServiceCollector collector("_wled._tcp.local");
    auto updates = collector.ingest(decode_message(alpha_response({.with_address = false})).unwrap());

    REQUIRE(updates.size() == 1);
    REQUIRE(updates[0].device.host == "wled-alpha.local");

    SECTION("A later address updates the host") {
        auto later = collector.ingest(decode_message(alpha_response()).unwrap());
        REQUIRE(later.size() == 1);
        REQUIRE(later[0].device.host == "10.0.0.5");
    }
}

TEST_CASE("ServiceCollector ignores queries and other service types", "[mdns]") {
    ServiceCollector collector("_http._tcp.local");
    REQUIRE(collector.ingest(decode_message(alpha_response()).unwrap()).empty());

    ServiceCollector wled("_wled._tcp.local");
    REQUIRE(wled.ingest(decode_message(encode_query("_wled._tcp.local", RecordType::PTR)).unwrap()).empty());
}
