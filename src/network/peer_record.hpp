#pragma once

#include "core/result.hpp"

#include <QByteArray>
#include <QHostAddress>
#include <QMetaType>
#include <QString>

#include <cstdint>
#include <vector>

namespace datlan::network {

// Size of the decoded "peers" payload: IPv4 octets then a big-endian port.
constexpr size_t PEERS_PAYLOAD_SIZE = 6;

inline constexpr const char* TXT_KEY_TOKEN = "token";
inline constexpr const char* TXT_KEY_PEERS = "peers";

/**
 * PeerRecord - One discoverable peer: where to connect and who it is.
 *
 * The token identifies the announcing process and is never empty. The
 * address is always an IPv4 address; the local record uses 0.0.0.0 because
 * a process does not know how others see it.
 */
struct PeerRecord {
    QHostAddress address{QHostAddress::AnyIPv4};
    uint16_t port = 0;
    QString token;

    bool operator==(const PeerRecord& other) const {
        return address == other.address && port == other.port && token == other.token;
    }
};

/**
 * Base64 of the 6-byte address/port payload carried in "peers=".
 */
[[nodiscard]] QByteArray encode_peers_field(const PeerRecord& record);

/**
 * The two TXT strings announcing `record`: "token=..." and "peers=...".
 */
[[nodiscard]] std::vector<QByteArray> encode_txt_fields(const PeerRecord& record);

/**
 * Rebuild a PeerRecord from TXT strings. Entries other than "token" and
 * "peers" are ignored; each of those must appear exactly once and "peers"
 * must decode to exactly 6 bytes. Every failure is ErrorCode::MalformedPayload.
 */
[[nodiscard]] Result<PeerRecord, Error> decode_peer_record(const std::vector<QByteArray>& txt_fields);

} // namespace datlan::network

Q_DECLARE_METATYPE(datlan::network::PeerRecord)
