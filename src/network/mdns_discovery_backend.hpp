#pragma once

#include "network/discovery.hpp"
#include "network/mdns_message.hpp"

#include <QObject>
#include <memory>
#include <optional>

class QUdpSocket;
class QTimer;

namespace ledmark::network {

/**
 * Built-in multicast DNS querier.
 *
 * This backend doesn't require Avahi. It periodically multicasts a PTR query
 * for the service type and folds the responses into resolved instances.
 * Everything runs on the Qt event loop of the calling thread.
 */
class MdnsDiscoveryBackend final : public QObject, public DiscoveryBackend {
    Q_OBJECT

public:
    explicit MdnsDiscoveryBackend(QObject* parent = nullptr);
    ~MdnsDiscoveryBackend() override;

    Result<void, Error> start_browsing(const std::string& service_type) override;
    void stop_browsing() override;

private slots:
    void onReadyRead();
    void onQueryTick();

private:
    Result<void, Error> ensureSocket();
    void closeSocket();

    std::unique_ptr<QUdpSocket> socket_;
    std::unique_ptr<QTimer> query_timer_;
    std::optional<ServiceCollector> collector_;
    QByteArray query_;
    bool browsing_ = false;
};

} // namespace ledmark::network
