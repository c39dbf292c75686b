#pragma once

#include <QHostAddress>
#include <QString>

#include <chrono>
#include <cstddef>
#include <cstdint>

namespace datlan::network {

/**
 * DiscoveryConfig - Tunables for the mDNS rendezvous.
 *
 * Defaults are the mDNS well-known group and port and a one minute
 * broadcast period. from_environment() lets test rigs and operators
 * override them:
 *   DATLAN_MDNS_GROUP            IPv4 multicast group
 *   DATLAN_MDNS_PORT             UDP port
 *   DATLAN_BROADCAST_INTERVAL_MS query period in milliseconds
 *   DATLAN_PEER_BUFFER           capacity of the discovered-peer stream
 */
struct DiscoveryConfig {
    static constexpr uint16_t MDNS_PORT = 5353;
    static constexpr const char* MDNS_GROUP = "224.0.0.251";

    QHostAddress group{QString::fromLatin1(MDNS_GROUP)};
    uint16_t port = MDNS_PORT;
    std::chrono::milliseconds broadcast_interval{60000};
    size_t peer_buffer_capacity = 64;
    int multicast_ttl = 255;
    bool multicast_loopback = true;
    bool announce_on_start = true;

    /**
     * Defaults, overridden by any valid DATLAN_* variable. Invalid values are
     * logged and ignored.
     */
    [[nodiscard]] static DiscoveryConfig from_environment();
};

} // namespace datlan::network
