#pragma once

#include "core/device.hpp"
#include "core/result.hpp"

#include <QByteArray>
#include <QString>

#include <vector>

namespace ledmark::network {

/**
 * Render devices as {"discovered_services": {name: {host, port, url}}}.
 */
[[nodiscard]] QByteArray devices_to_json(const std::vector<DeviceRecord>& devices);

/**
 * Write devices_to_json() to `path`, replacing any previous file atomically.
 */
[[nodiscard]] Result<void> export_devices(const std::vector<DeviceRecord>& devices, const QString& path);

} // namespace ledmark::network
