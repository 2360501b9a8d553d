#include "network/mdns_discovery_backend.hpp"

#include <QHostAddress>
#include <QLoggingCategory>
#include <QNetworkDatagram>
#include <QTimer>
#include <QUdpSocket>

namespace ledmark::network {
namespace {

Q_LOGGING_CATEGORY(lmMdnsLog, "ledmark.discovery")

const QHostAddress kMulticastGroup(QString::fromLatin1(kMdnsGroupIPv4));
constexpr int kQueryIntervalMs = 1000;

} // namespace

MdnsDiscoveryBackend::MdnsDiscoveryBackend(QObject* parent)
    : QObject(parent)
    , query_timer_(std::make_unique<QTimer>(this))
{
    query_timer_->setInterval(kQueryIntervalMs);
    connect(query_timer_.get(), &QTimer::timeout, this, &MdnsDiscoveryBackend::onQueryTick);
}

MdnsDiscoveryBackend::~MdnsDiscoveryBackend() {
    stop_browsing();
}

Result<void, Error> MdnsDiscoveryBackend::ensureSocket() {
    if (socket_) {
        return Result<void, Error>::ok();
    }

    socket_ = std::make_unique<QUdpSocket>(this);

    // Share 5353 with a running responder when possible; otherwise fall back
    // to an ephemeral port, where responders answer by unicast.
    bool bound = socket_->bind(QHostAddress::AnyIPv4, kMdnsPort,
                               QUdpSocket::ShareAddress | QUdpSocket::ReuseAddressHint);
    if (bound) {
        if (!socket_->joinMulticastGroup(kMulticastGroup)) {
            qCWarning(lmMdnsLog) << "mDNS: failed to join multicast group:" << socket_->errorString();
        }
    } else {
        qCDebug(lmMdnsLog) << "mDNS: port" << kMdnsPort << "unavailable, using an ephemeral port";
        socket_ = std::make_unique<QUdpSocket>(this);
        bound = socket_->bind(QHostAddress::AnyIPv4, 0);
    }

    if (!bound) {
        auto msg = socket_->errorString().toStdString();
        socket_.reset();
        return Result<void, Error>::err(Error{ErrorKind::IOFailure, msg});
    }

    socket_->setSocketOption(QAbstractSocket::MulticastTtlOption, 255);
    connect(socket_.get(), &QUdpSocket::readyRead, this, &MdnsDiscoveryBackend::onReadyRead);
    return Result<void, Error>::ok();
}

void MdnsDiscoveryBackend::closeSocket() {
    if (!socket_) return;
    if (socket_->localPort() == kMdnsPort && !socket_->leaveMulticastGroup(kMulticastGroup)) {
        qCDebug(lmMdnsLog) << "mDNS: failed to leave multicast group:" << socket_->errorString();
    }
    socket_->close();
    socket_.reset();
}

Result<void, Error> MdnsDiscoveryBackend::start_browsing(const std::string& service_type) {
    auto socket = ensureSocket();
    if (socket.is_err()) return socket;

    const auto qualified = service_type + ".local";
    collector_.emplace(qualified);
    query_ = encode_query(qualified, RecordType::PTR);
    browsing_ = true;

    query_timer_->start();
    onQueryTick();
    return Result<void, Error>::ok();
}

void MdnsDiscoveryBackend::stop_browsing() {
    browsing_ = false;
    query_timer_->stop();
    closeSocket();
    collector_.reset();
}

void MdnsDiscoveryBackend::onQueryTick() {
    if (!socket_ || !browsing_) return;

    const auto sent = socket_->writeDatagram(query_, kMulticastGroup, kMdnsPort);
    if (sent != query_.size()) {
        qCWarning(lmMdnsLog) << "mDNS: failed to send query:" << socket_->errorString();
    }
}

void MdnsDiscoveryBackend::onReadyRead() {
    if (!socket_) return;

    while (socket_->hasPendingDatagrams()) {
        const QNetworkDatagram datagram = socket_->receiveDatagram();
        if (!browsing_ || !collector_) continue;

        auto decoded = decode_message(datagram.data());
        if (decoded.is_err()) {
            qCDebug(lmMdnsLog) << "mDNS: dropping datagram from" << datagram.senderAddress()
                               << decoded.unwrap_err().message.c_str();
            continue;
        }

        for (auto& update : collector_->ingest(decoded.unwrap())) {
            if (update.kind == ServiceCollector::Update::Kind::Resolved) {
                if (on_service_resolved) on_service_resolved(std::move(update.device));
            } else {
                if (on_service_removed) on_service_removed(update.device.name);
            }
        }
    }
}

} // namespace ledmark::network
