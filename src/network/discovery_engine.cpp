#include "network/discovery_engine.hpp"

#include "core/logging.hpp"

#include <QTimer>

#include <algorithm>

namespace datlan::network {
namespace {

bool names_rendezvous(const DnsMessage& message, const DnsName& name) {
    return std::any_of(message.questions.begin(), message.questions.end(),
        [&](const DnsQuestion& q) { return q.name.equals_ignore_case(name); });
}

} // namespace

DiscoveryEngine::DiscoveryEngine(RendezvousSession session,
                                 DiscoveryConfig config,
                                 std::unique_ptr<MulticastTransport> transport,
                                 QObject* parent)
    : QObject(parent)
    , session_(std::move(session))
    , config_(std::move(config))
    , transport_(transport ? std::move(transport) : createMulticastTransport(config_))
    , stream_(std::make_unique<PeerStream>(config_.peer_buffer_capacity, this))
    , broadcast_timer_(std::make_unique<QTimer>(this))
{
    broadcast_timer_->setInterval(config_.broadcast_interval);
    connect(broadcast_timer_.get(), &QTimer::timeout, this, &DiscoveryEngine::broadcastQuestion);
}

DiscoveryEngine::~DiscoveryEngine() {
    stop();
}

Result<void, Error> DiscoveryEngine::start() {
    if (running_) {
        return Result<void, Error>::ok();
    }

    auto opened = transport_->open();
    if (opened.is_err()) {
        qCCritical(datlanDiscovery) << "cannot start discovery:"
                                    << QString::fromStdString(opened.unwrap_err().message);
        return opened;
    }

    transport_->on_ready_read = [this]() { drainTransport(); };
    running_ = true;
    broadcast_timer_->start();

    qCInfo(datlanDiscovery) << "discovering peers under"
                            << QString::fromStdString(session_.name().to_string())
                            << "every" << config_.broadcast_interval.count() << "ms";

    if (config_.announce_on_start) {
        broadcastQuestion();
    }
    emit started();

    // Datagrams may have queued up between the join and the callback hookup.
    drainTransport();
    return Result<void, Error>::ok();
}

void DiscoveryEngine::stop() {
    if (!running_) return;

    running_ = false;
    broadcast_timer_->stop();
    transport_->on_ready_read = nullptr;
    transport_->close();

    qCInfo(datlanDiscovery) << "discovery stopped";
    emit stopped();
}

void DiscoveryEngine::broadcastQuestion() {
    if (!running_) return;

    auto sent = transport_->send(session_.question_bytes(), config_.group, config_.port);
    if (sent.is_err()) {
        qCWarning(datlanDiscovery) << "query broadcast failed, retrying next tick:"
                                   << QString::fromStdString(sent.unwrap_err().message);
        return;
    }
    qCDebug(datlanDiscovery) << "query broadcast sent";
}

void DiscoveryEngine::drainTransport() {
    if (!running_ || draining_) return;

    // Queries are answered even while the peer stream is full; only the
    // sightings that do not fit are dropped.
    draining_ = true;
    while (transport_->has_pending()) {
        auto datagram = transport_->receive();
        if (!datagram) continue;
        classify(*datagram);
    }
    draining_ = false;
}

Disposition DiscoveryEngine::classify(const Datagram& datagram) {
    auto parsed = parse_message(datagram.data);
    if (parsed.is_err() || parsed.unwrap().opcode != 0) {
        qCDebug(datlanDiscovery) << "dropping non-DNS datagram from" << datagram.sender.toString();
        return Disposition::Unparseable;
    }

    const auto& message = parsed.unwrap();
    if (!names_rendezvous(message, session_.name())) {
        return Disposition::ForeignName;
    }

    if (message.type == MessageType::Query) {
        return handleQuery(datagram);
    }
    return handleResponse(message, datagram);
}

Disposition DiscoveryEngine::handleQuery(const Datagram& datagram) {
    // Legacy unicast queriers (source port other than ours) get a direct
    // reply; everyone else hears the answer on the group.
    const bool legacy_unicast = datagram.sender_port != config_.port;
    const auto& host = legacy_unicast ? datagram.sender : config_.group;
    const auto port = legacy_unicast ? datagram.sender_port : config_.port;

    auto sent = transport_->send(session_.answer_bytes(), host, port);
    if (sent.is_err()) {
        qCWarning(datlanDiscovery) << "answer to" << datagram.sender.toString() << "failed:"
                                   << QString::fromStdString(sent.unwrap_err().message);
        return Disposition::AnswerFailed;
    }

    qCDebug(datlanDiscovery) << "answered query from" << datagram.sender.toString();
    return Disposition::Answered;
}

Disposition DiscoveryEngine::handleResponse(const DnsMessage& message, const Datagram& datagram) {
    std::optional<PeerRecord> found;
    for (const auto& answer : message.answers) {
        if (answer.type != RecordType::TXT) continue;

        auto record = decode_peer_record(answer.txt);
        if (record.is_ok()) {
            found = std::move(record).unwrap();
            break;
        }
    }

    if (!found) {
        qCDebug(datlanDiscovery) << "response from" << datagram.sender.toString()
                                 << "has no usable TXT answer";
        return Disposition::UndecodableResponse;
    }

    if (found->token == session_.local().token) {
        return Disposition::SelfEcho;
    }

    // Peers announce 0.0.0.0; the address we saw the datagram come from is
    // the one that reaches them.
    if (found->address == QHostAddress(QHostAddress::AnyIPv4)
        && datagram.sender.protocol() == QAbstractSocket::IPv4Protocol) {
        found->address = datagram.sender;
    }

    qCDebug(datlanDiscovery) << "peer" << found->token << "at"
                             << found->address.toString() << found->port;

    if (!stream_->push(std::move(*found))) {
        qCWarning(datlanDiscovery) << "peer stream full, dropping sighting";
        return Disposition::StreamFull;
    }
    return Disposition::Emitted;
}

} // namespace datlan::network
