#include "network/discovery_config.hpp"

#include "core/logging.hpp"

#include <QtGlobal>

namespace datlan::network {

DiscoveryConfig DiscoveryConfig::from_environment() {
    DiscoveryConfig config;

    const auto group = qEnvironmentVariable("DATLAN_MDNS_GROUP").trimmed();
    if (!group.isEmpty()) {
        const QHostAddress address(group);
        if (address.protocol() == QAbstractSocket::IPv4Protocol && address.isMulticast()) {
            config.group = address;
        } else {
            qCWarning(datlanApp) << "Ignoring DATLAN_MDNS_GROUP, not an IPv4 multicast address:" << group;
        }
    }

    if (qEnvironmentVariableIsSet("DATLAN_MDNS_PORT")) {
        bool ok = false;
        const int port = qEnvironmentVariableIntValue("DATLAN_MDNS_PORT", &ok);
        if (ok && port > 0 && port <= 65535) {
            config.port = static_cast<uint16_t>(port);
        } else {
            qCWarning(datlanApp) << "Ignoring invalid DATLAN_MDNS_PORT";
        }
    }

    if (qEnvironmentVariableIsSet("DATLAN_BROADCAST_INTERVAL_MS")) {
        bool ok = false;
        const int ms = qEnvironmentVariableIntValue("DATLAN_BROADCAST_INTERVAL_MS", &ok);
        if (ok && ms > 0) {
            config.broadcast_interval = std::chrono::milliseconds(ms);
        } else {
            qCWarning(datlanApp) << "Ignoring invalid DATLAN_BROADCAST_INTERVAL_MS";
        }
    }

    if (qEnvironmentVariableIsSet("DATLAN_PEER_BUFFER")) {
        bool ok = false;
        const int capacity = qEnvironmentVariableIntValue("DATLAN_PEER_BUFFER", &ok);
        if (ok && capacity > 0) {
            config.peer_buffer_capacity = static_cast<size_t>(capacity);
        } else {
            qCWarning(datlanApp) << "Ignoring invalid DATLAN_PEER_BUFFER";
        }
    }

    return config;
}

} // namespace datlan::network
