#include "network/device_export.hpp"

#include <QDir>
#include <QFileInfo>
#include <QJsonDocument>
#include <QJsonObject>
#include <QSaveFile>

namespace ledmark::network {

QByteArray devices_to_json(const std::vector<DeviceRecord>& devices) {
    QJsonObject services;
    for (const auto& device : devices) {
        QJsonObject entry;
        entry["host"] = QString::fromStdString(device.host);
        entry["port"] = static_cast<int>(device.port);
        entry["url"] = QString::fromStdString(device.url());
        services[QString::fromStdString(device.name)] = entry;
    }

    QJsonObject root;
    root["discovered_services"] = services;
    return QJsonDocument(root).toJson(QJsonDocument::Indented);
}

Result<void> export_devices(const std::vector<DeviceRecord>& devices, const QString& path) {
    const QFileInfo info(path);
    if (!QDir().mkpath(info.absolutePath())) {
        return Result<void>::err(Error{ErrorKind::IOFailure,
                                       "Cannot create directory " + info.absolutePath().toStdString()});
    }

    QSaveFile file(path);
    if (!file.open(QIODevice::WriteOnly)) {
        return Result<void>::err(Error{ErrorKind::IOFailure,
                                       "Cannot write " + path.toStdString() + ": " +
                                           file.errorString().toStdString()});
    }

    const auto json = devices_to_json(devices);
    if (file.write(json) != json.size()) {
        file.cancelWriting();
        return Result<void>::err(Error{ErrorKind::IOFailure,
                                       "Cannot write " + path.toStdString() + ": " +
                                           file.errorString().toStdString()});
    }
    if (!file.commit()) {
        return Result<void>::err(Error{ErrorKind::IOFailure,
                                       "Cannot commit " + path.toStdString() + ": " +
                                           file.errorString().toStdString()});
    }
    return Result<void>::ok();
}

} // namespace ledmark::network
