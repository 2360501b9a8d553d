#include "network/mdns_message.hpp"

#include <QHostAddress>

#include <algorithm>
#include <cctype>

namespace ledmark::network {
namespace {

constexpr size_t kHeaderSize = 12;
constexpr size_t kMaxNameLength = 255;
constexpr int kMaxPointerJumps = 32;
constexpr uint16_t kClassIn = 1;

Error malformed(const std::string& what) {
    return Error{ErrorKind::InvalidArgument, "malformed mDNS message: " + what};
}

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

void put_u16(QByteArray& out, uint16_t v) {
    out.append(static_cast<char>(v >> 8));
    out.append(static_cast<char>(v & 0xFF));
}

void put_name(QByteArray& out, const std::string& name) {
    size_t start = 0;
    while (start < name.size()) {
        auto dot = name.find('.', start);
        if (dot == std::string::npos) dot = name.size();
        const auto len = std::min<size_t>(dot - start, 63);
        out.append(static_cast<char>(len));
        out.append(name.data() + start, static_cast<qsizetype>(len));
        start = dot + 1;
    }
    out.append('\0');
}

class Reader {
public:
    explicit Reader(const QByteArray& data)
        : data_(reinterpret_cast<const uint8_t*>(data.constData()))
        , size_(static_cast<size_t>(data.size())) {}

    [[nodiscard]] size_t offset() const { return offset_; }
    [[nodiscard]] size_t size() const { return size_; }
    void seek(size_t offset) { offset_ = offset; }

    Result<uint16_t> u16() {
        if (offset_ + 2 > size_) return Result<uint16_t>::err(malformed("truncated"));
        uint16_t v = static_cast<uint16_t>((data_[offset_] << 8) | data_[offset_ + 1]);
        offset_ += 2;
        return Result<uint16_t>::ok(v);
    }

    Result<uint32_t> u32() {
        if (offset_ + 4 > size_) return Result<uint32_t>::err(malformed("truncated"));
        uint32_t v = (static_cast<uint32_t>(data_[offset_]) << 24) |
                     (static_cast<uint32_t>(data_[offset_ + 1]) << 16) |
                     (static_cast<uint32_t>(data_[offset_ + 2]) << 8) |
                     static_cast<uint32_t>(data_[offset_ + 3]);
        offset_ += 4;
        return Result<uint32_t>::ok(v);
    }

    /**
     * Read a possibly compressed name starting at the current offset and
     * advance past its in-place encoding.
     */
    Result<std::string> name() {
        std::string out;
        size_t pos = offset_;
        bool jumped = false;
        int jumps = 0;

        while (true) {
            if (pos >= size_) return Result<std::string>::err(malformed("name runs past end"));
            const uint8_t len = data_[pos];

            if ((len & 0xC0) == 0xC0) {
                if (pos + 1 >= size_) {
                    return Result<std::string>::err(malformed("truncated pointer"));
                }
                const size_t target = (static_cast<size_t>(len & 0x3F) << 8) | data_[pos + 1];
                if (!jumped) offset_ = pos + 2;
                jumped = true;
                if (++jumps > kMaxPointerJumps) {
                    return Result<std::string>::err(malformed("compression loop"));
                }
                if (target >= size_) {
                    return Result<std::string>::err(malformed("pointer out of range"));
                }
                pos = target;
                continue;
            }
            if ((len & 0xC0) != 0) {
                return Result<std::string>::err(malformed("unsupported label type"));
            }
            if (len == 0) {
                if (!jumped) offset_ = pos + 1;
                break;
            }
            if (pos + 1 + len > size_) {
                return Result<std::string>::err(malformed("label runs past end"));
            }
            if (!out.empty()) out += '.';
            out.append(reinterpret_cast<const char*>(data_ + pos + 1), len);
            if (out.size() > kMaxNameLength) {
                return Result<std::string>::err(malformed("name too long"));
            }
            pos += 1 + len;
        }
        return Result<std::string>::ok(std::move(out));
    }

    const uint8_t* at(size_t offset) const { return data_ + offset; }

private:
    const uint8_t* data_;
    size_t size_;
    size_t offset_ = 0;
};

Result<ResourceRecord> read_record(Reader& reader) {
    ResourceRecord rr;

    auto name = reader.name();
    if (name.is_err()) return Result<ResourceRecord>::err(name.unwrap_err());
    rr.name = std::move(name).unwrap();

    auto type = reader.u16();
    auto rclass = reader.u16();
    auto ttl = reader.u32();
    auto rdlength = reader.u16();
    if (type.is_err() || rclass.is_err() || ttl.is_err() || rdlength.is_err()) {
        return Result<ResourceRecord>::err(malformed("truncated record header"));
    }
    rr.type = type.unwrap();
    rr.rclass = rclass.unwrap() & 0x7FFF;  // strip cache-flush bit
    rr.ttl = ttl.unwrap();

    const size_t rdata_start = reader.offset();
    const size_t rdata_end = rdata_start + rdlength.unwrap();
    if (rdata_end > reader.size()) {
        return Result<ResourceRecord>::err(malformed("rdata runs past end"));
    }

    switch (static_cast<RecordType>(rr.type)) {
        case RecordType::PTR: {
            auto target = reader.name();
            if (target.is_err()) return Result<ResourceRecord>::err(target.unwrap_err());
            rr.target = std::move(target).unwrap();
            break;
        }
        case RecordType::SRV: {
            auto priority = reader.u16();
            auto weight = reader.u16();
            auto port = reader.u16();
            if (priority.is_err() || weight.is_err() || port.is_err()) {
                return Result<ResourceRecord>::err(malformed("truncated SRV"));
            }
            rr.port = port.unwrap();
            auto target = reader.name();
            if (target.is_err()) return Result<ResourceRecord>::err(target.unwrap_err());
            rr.target = std::move(target).unwrap();
            break;
        }
        case RecordType::A: {
            if (rdlength.unwrap() != 4) return Result<ResourceRecord>::err(malformed("bad A length"));
            const uint8_t* p = reader.at(rdata_start);
            rr.address = std::to_string(p[0]) + "." + std::to_string(p[1]) + "." +
                         std::to_string(p[2]) + "." + std::to_string(p[3]);
            break;
        }
        case RecordType::AAAA: {
            if (rdlength.unwrap() != 16) {
                return Result<ResourceRecord>::err(malformed("bad AAAA length"));
            }
            rr.address = QHostAddress(reader.at(rdata_start)).toString().toStdString();
            break;
        }
        default:
            break;
    }

    reader.seek(rdata_end);
    return Result<ResourceRecord>::ok(std::move(rr));
}

} // namespace

QByteArray encode_query(const std::string& name, RecordType type) {
    QByteArray out;
    out.reserve(static_cast<qsizetype>(kHeaderSize + name.size() + 6));
    put_u16(out, 0);  // id, always 0 for multicast queries
    put_u16(out, 0);  // flags
    put_u16(out, 1);  // qdcount
    put_u16(out, 0);
    put_u16(out, 0);
    put_u16(out, 0);
    put_name(out, name);
    put_u16(out, static_cast<uint16_t>(type));
    put_u16(out, kClassIn);
    return out;
}

Result<Message> decode_message(const QByteArray& datagram) {
    if (static_cast<size_t>(datagram.size()) < kHeaderSize) {
        return Result<Message>::err(malformed("short header"));
    }

    Reader reader(datagram);
    Message msg;
    msg.id = reader.u16().unwrap();
    msg.flags = reader.u16().unwrap();
    const uint16_t qdcount = reader.u16().unwrap();
    const uint16_t ancount = reader.u16().unwrap();
    const uint16_t nscount = reader.u16().unwrap();
    const uint16_t arcount = reader.u16().unwrap();

    for (uint16_t i = 0; i < qdcount; ++i) {
        auto name = reader.name();
        if (name.is_err()) return Result<Message>::err(name.unwrap_err());
        auto type = reader.u16();
        auto rclass = reader.u16();
        if (type.is_err() || rclass.is_err()) {
            return Result<Message>::err(malformed("truncated question"));
        }
        msg.questions.push_back(Question{
            .name = std::move(name).unwrap(),
            .type = type.unwrap(),
            .rclass = static_cast<uint16_t>(rclass.unwrap() & 0x7FFF),
        });
    }

    const int total = ancount + nscount + arcount;
    msg.records.reserve(static_cast<size_t>(total));
    for (int i = 0; i < total; ++i) {
        auto rr = read_record(reader);
        if (rr.is_err()) return Result<Message>::err(rr.unwrap_err());
        msg.records.push_back(std::move(rr).unwrap());
    }

    return Result<Message>::ok(std::move(msg));
}

bool dns_name_equal(const std::string& a, const std::string& b) {
    return a.size() == b.size() && to_lower(a) == to_lower(b);
}

// ============================================================================
// ServiceCollector
// ============================================================================

ServiceCollector::ServiceCollector(std::string service_type)
    : service_type_(std::move(service_type)) {}

std::string ServiceCollector::instance_label(const std::string& full_name) const {
    const std::string suffix = "." + service_type_;
    if (full_name.size() <= suffix.size()) return {};
    const auto tail = full_name.substr(full_name.size() - suffix.size());
    if (!dns_name_equal(tail, suffix)) return {};
    return full_name.substr(0, full_name.size() - suffix.size());
}

std::vector<ServiceCollector::Update> ServiceCollector::ingest(const Message& message) {
    std::vector<Update> updates;
    if (!message.is_response()) return updates;

    for (const auto& rr : message.records) {
        switch (static_cast<RecordType>(rr.type)) {
            case RecordType::A: {
                const auto host = to_lower(rr.name);
                if (rr.ttl == 0) {
                    addresses_.erase(host);
                } else {
                    addresses_[host] = rr.address;
                }
                break;
            }
            case RecordType::PTR: {
                if (!dns_name_equal(rr.name, service_type_)) break;
                auto label = instance_label(rr.target);
                if (label.empty()) break;
                if (rr.ttl == 0) {
                    // Goodbye packet.
                    auto it = instances_.find(label);
                    if (it != instances_.end()) {
                        if (it->second.reported) {
                            updates.push_back(Update{Update::Kind::Removed, DeviceRecord{.name = label}});
                        }
                        instances_.erase(it);
                    }
                } else {
                    instances_.try_emplace(label);
                }
                break;
            }
            default:
                break;
        }
    }

    // SRV after PTR, so only instances still announced pick up a target.
    for (const auto& rr : message.records) {
        if (static_cast<RecordType>(rr.type) != RecordType::SRV || rr.ttl == 0) continue;
        auto it = instances_.find(instance_label(rr.name));
        if (it == instances_.end()) continue;
        it->second.target = rr.target;
        it->second.port = rr.port;
    }

    for (auto& [label, inst] : instances_) {
        if (inst.port == 0 || inst.target.empty()) continue;

        DeviceRecord device{.name = label, .host = inst.target, .port = inst.port};
        auto addr = addresses_.find(to_lower(inst.target));
        if (addr != addresses_.end()) {
            device.host = addr->second;
        }

        if (!inst.reported || !(device == inst.last_reported)) {
            inst.reported = true;
            inst.last_reported = device;
            updates.push_back(Update{Update::Kind::Resolved, device});
        }
    }

    return updates;
}

} // namespace ledmark::network
