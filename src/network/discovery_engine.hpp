#pragma once

#include "core/result.hpp"
#include "network/discovery_config.hpp"
#include "network/discovery_messages.hpp"
#include "network/multicast_transport.hpp"
#include "network/peer_stream.hpp"

#include <QObject>

#include <memory>

class QTimer;

namespace datlan::network {

/**
 * What the classifier did with one inbound datagram.
 */
enum class Disposition {
    Unparseable,          // not a DNS message we handle
    ForeignName,          // query section does not name our rendezvous
    Answered,             // query for our name, answer sent
    AnswerFailed,         // query for our name, answer could not be sent
    UndecodableResponse,  // response without a usable token/peers TXT answer
    SelfEcho,             // our own answer coming back
    Emitted,              // remote peer pushed to the stream
    StreamFull,           // remote peer dropped, consumer is behind
};

/**
 * DiscoveryEngine - Finds peers sharing a discovery key over mDNS.
 *
 * Three activities share the Qt event loop: the broadcaster sends the TXT
 * question every broadcast_interval, the classifier answers matching queries
 * and turns matching responses into PeerRecords, and the consumer pulls
 * records from peers(). Datagrams are classified one at a time, each to
 * completion.
 *
 * Usage:
 *   auto session = RendezvousSession::create(key, port, token).unwrap();
 *   DiscoveryEngine engine(std::move(session), DiscoveryConfig::from_environment());
 *   if (auto started = engine.start(); started.is_err()) { ... }
 *   connect(&engine.peers(), &PeerStream::peerAvailable, ...);
 */
class DiscoveryEngine : public QObject {
    Q_OBJECT

public:
    /**
     * @param transport Datagram transport; the UDP mDNS transport when null.
     */
    DiscoveryEngine(RendezvousSession session,
                    DiscoveryConfig config,
                    std::unique_ptr<MulticastTransport> transport = nullptr,
                    QObject* parent = nullptr);
    ~DiscoveryEngine() override;

    /**
     * Join the multicast group and start broadcasting. Failing to join is a
     * startup error and is returned; nothing is retried.
     */
    Result<void, Error> start();

    /**
     * Stop the broadcaster and close the transport. Records already in the
     * stream stay readable.
     */
    void stop();

    [[nodiscard]] bool isRunning() const { return running_; }

    /**
     * The discovered-peer stream. Valid for the engine's lifetime.
     */
    [[nodiscard]] PeerStream& peers() { return *stream_; }

    [[nodiscard]] const RendezvousSession& session() const { return session_; }
    [[nodiscard]] const DiscoveryConfig& config() const { return config_; }

    /**
     * Send the TXT question to the group once. A failed send is logged and
     * left to the next tick.
     */
    void broadcastQuestion();

    /**
     * Run one datagram through the classification pipeline.
     */
    Disposition classify(const Datagram& datagram);

signals:
    void started();
    void stopped();

private slots:
    void drainTransport();

private:
    Disposition handleQuery(const Datagram& datagram);
    Disposition handleResponse(const DnsMessage& message, const Datagram& datagram);

    const RendezvousSession session_;
    const DiscoveryConfig config_;
    std::unique_ptr<MulticastTransport> transport_;
    std::unique_ptr<PeerStream> stream_;
    std::unique_ptr<QTimer> broadcast_timer_;
    bool running_ = false;
    bool draining_ = false;
};

} // namespace datlan::network
