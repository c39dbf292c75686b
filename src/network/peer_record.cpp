#include "network/peer_record.hpp"

#include "crypto/keys.hpp"

#include <optional>

namespace datlan::network {
namespace {

Result<PeerRecord, Error> malformed(const char* why) {
    return Result<PeerRecord, Error>::err(Error{why, ErrorCode::MalformedPayload});
}

} // namespace

QByteArray encode_peers_field(const PeerRecord& record) {
    const quint32 ipv4 = record.address.toIPv4Address();

    std::vector<uint8_t> payload(PEERS_PAYLOAD_SIZE);
    payload[0] = static_cast<uint8_t>(ipv4 >> 24);
    payload[1] = static_cast<uint8_t>(ipv4 >> 16);
    payload[2] = static_cast<uint8_t>(ipv4 >> 8);
    payload[3] = static_cast<uint8_t>(ipv4);
    payload[4] = static_cast<uint8_t>(record.port >> 8);
    payload[5] = static_cast<uint8_t>(record.port);

    return QByteArray::fromStdString(crypto::to_base64(payload));
}

std::vector<QByteArray> encode_txt_fields(const PeerRecord& record) {
    return {
        QByteArray(TXT_KEY_TOKEN) + '=' + record.token.toUtf8(),
        QByteArray(TXT_KEY_PEERS) + '=' + encode_peers_field(record),
    };
}

Result<PeerRecord, Error> decode_peer_record(const std::vector<QByteArray>& txt_fields) {
    std::optional<QByteArray> token;
    std::optional<QByteArray> peers;
    int matched = 0;

    for (const auto& field : txt_fields) {
        const auto eq = field.indexOf('=');
        if (eq < 0) continue;

        const auto key = field.left(eq);
        if (key == TXT_KEY_TOKEN) {
            token = field.mid(eq + 1);
            ++matched;
        } else if (key == TXT_KEY_PEERS) {
            peers = field.mid(eq + 1);
            ++matched;
        }
    }

    if (matched != 2 || !token || !peers) {
        return malformed("TXT record needs exactly one token and one peers entry");
    }
    if (token->isEmpty()) {
        return malformed("empty token");
    }

    const auto payload = crypto::from_base64(peers->toStdString());
    if (payload.is_err()) {
        return malformed("peers entry is not valid Base64");
    }
    const auto& bytes = payload.unwrap();
    if (bytes.size() != PEERS_PAYLOAD_SIZE) {
        return malformed("peers payload must be 6 bytes");
    }

    const quint32 ipv4 = (static_cast<quint32>(bytes[0]) << 24)
                       | (static_cast<quint32>(bytes[1]) << 16)
                       | (static_cast<quint32>(bytes[2]) << 8)
                       | static_cast<quint32>(bytes[3]);

    PeerRecord record;
    record.address = QHostAddress(ipv4);
    record.port = static_cast<uint16_t>((bytes[4] << 8) | bytes[5]);
    record.token = QString::fromUtf8(*token);
    return Result<PeerRecord, Error>::ok(std::move(record));
}

} // namespace datlan::network
