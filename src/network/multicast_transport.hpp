#pragma once

#include "core/result.hpp"
#include "network/discovery_config.hpp"

#include <QByteArray>
#include <QHostAddress>
#include <QObject>

#include <functional>
#include <memory>
#include <optional>

class QUdpSocket;

namespace datlan::network {

/**
 * Datagram - One inbound UDP payload and where it came from.
 */
struct Datagram {
    QByteArray data;
    QHostAddress sender;
    uint16_t sender_port = 0;
};

/**
 * MulticastTransport - A joined multicast session: open once, then read and
 * write repeatedly until close().
 *
 * Reading is pull based: on_ready_read fires when datagrams are waiting and
 * the owner calls receive() as long as it wants more. Whatever it leaves
 * unread stays queued in the socket.
 */
class MulticastTransport {
public:
    virtual ~MulticastTransport() = default;

    virtual Result<void, Error> open() = 0;
    virtual void close() = 0;
    [[nodiscard]] virtual bool is_open() const = 0;

    virtual Result<void, Error> send(const QByteArray& bytes,
                                     const QHostAddress& host,
                                     uint16_t port) = 0;

    [[nodiscard]] virtual bool has_pending() const = 0;
    virtual std::optional<Datagram> receive() = 0;

    std::function<void()> on_ready_read;
};

/**
 * UdpMulticastTransport - QUdpSocket bound to the mDNS port with address
 * sharing, joined to the configured group.
 */
class UdpMulticastTransport final : public QObject, public MulticastTransport {
    Q_OBJECT

public:
    explicit UdpMulticastTransport(DiscoveryConfig config, QObject* parent = nullptr);
    ~UdpMulticastTransport() override;

    Result<void, Error> open() override;
    void close() override;
    [[nodiscard]] bool is_open() const override { return socket_ != nullptr; }

    Result<void, Error> send(const QByteArray& bytes,
                             const QHostAddress& host,
                             uint16_t port) override;

    [[nodiscard]] bool has_pending() const override;
    std::optional<Datagram> receive() override;

private slots:
    void onReadyRead();

private:
    DiscoveryConfig config_;
    std::unique_ptr<QUdpSocket> socket_;
};

/**
 * Create the transport used outside of tests.
 */
std::unique_ptr<MulticastTransport> createMulticastTransport(const DiscoveryConfig& config);

} // namespace datlan::network
