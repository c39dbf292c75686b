#pragma once

#include "core/result.hpp"
#include "network/dns_message.hpp"
#include "network/peer_record.hpp"

#include <QByteArray>
#include <QString>

#include <cstdint>
#include <vector>

namespace datlan::network {

// TTL of our TXT answer, the usual mDNS value for host-bound records.
constexpr uint32_t ANSWER_TTL_SECONDS = 120;

/**
 * A TXT query for `name`.
 */
[[nodiscard]] DnsMessage build_question(const DnsName& name);

/**
 * An authoritative response to build_question(name) carrying one TXT answer
 * with the token and peers entries of `local`. The query section is kept so
 * that requesters can match it by name.
 */
[[nodiscard]] Result<DnsMessage, Error> build_answer(const DnsName& name, const PeerRecord& local);

/**
 * RendezvousSession - Everything derived once from (discovery key, port,
 * token) before discovery starts: the rendezvous name, the local record and
 * both serialized message templates. Immutable after create().
 */
class RendezvousSession {
public:
    [[nodiscard]] static Result<RendezvousSession, Error> create(
        const std::vector<uint8_t>& discovery_key,
        uint16_t port,
        const QString& token);

    [[nodiscard]] const DnsName& name() const noexcept { return name_; }
    [[nodiscard]] const PeerRecord& local() const noexcept { return local_; }
    [[nodiscard]] const QByteArray& question_bytes() const noexcept { return question_bytes_; }
    [[nodiscard]] const QByteArray& answer_bytes() const noexcept { return answer_bytes_; }

private:
    RendezvousSession() = default;

    DnsName name_;
    PeerRecord local_;
    QByteArray question_bytes_;
    QByteArray answer_bytes_;
};

} // namespace datlan::network
