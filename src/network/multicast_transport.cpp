#include "network/multicast_transport.hpp"

#include "core/logging.hpp"

#include <QNetworkDatagram>
#include <QUdpSocket>

namespace datlan::network {

UdpMulticastTransport::UdpMulticastTransport(DiscoveryConfig config, QObject* parent)
    : QObject(parent)
    , config_(std::move(config))
{
}

UdpMulticastTransport::~UdpMulticastTransport() {
    close();
}

Result<void, Error> UdpMulticastTransport::open() {
    if (socket_) {
        return Result<void, Error>::ok();
    }

    auto socket = std::make_unique<QUdpSocket>(this);

    if (!socket->bind(QHostAddress::AnyIPv4,
                      config_.port,
                      QUdpSocket::ShareAddress | QUdpSocket::ReuseAddressHint)) {
        return Result<void, Error>::err(Error{
            "cannot bind UDP port " + std::to_string(config_.port) + ": "
                + socket->errorString().toStdString(),
            ErrorCode::TransportUnavailable});
    }

    socket->setSocketOption(QAbstractSocket::MulticastTtlOption, config_.multicast_ttl);
    socket->setSocketOption(QAbstractSocket::MulticastLoopbackOption,
                            config_.multicast_loopback ? 1 : 0);

    if (!socket->joinMulticastGroup(config_.group)) {
        return Result<void, Error>::err(Error{
            "cannot join multicast group " + config_.group.toString().toStdString() + ": "
                + socket->errorString().toStdString(),
            ErrorCode::TransportUnavailable});
    }

    connect(socket.get(), &QUdpSocket::readyRead, this, &UdpMulticastTransport::onReadyRead);
    socket_ = std::move(socket);

    qCDebug(datlanTransport) << "joined" << config_.group.toString() << "port" << config_.port;
    return Result<void, Error>::ok();
}

void UdpMulticastTransport::close() {
    if (!socket_) return;
    socket_->leaveMulticastGroup(config_.group);
    socket_->close();
    socket_.reset();
    qCDebug(datlanTransport) << "left" << config_.group.toString();
}

Result<void, Error> UdpMulticastTransport::send(const QByteArray& bytes,
                                                const QHostAddress& host,
                                                uint16_t port) {
    if (!socket_) {
        return Result<void, Error>::err(Error{"transport is closed", ErrorCode::SendFailed});
    }

    const auto written = socket_->writeDatagram(bytes, host, port);
    if (written != bytes.size()) {
        return Result<void, Error>::err(Error{
            "writeDatagram failed: " + socket_->errorString().toStdString(),
            ErrorCode::SendFailed});
    }
    return Result<void, Error>::ok();
}

bool UdpMulticastTransport::has_pending() const {
    return socket_ && socket_->hasPendingDatagrams();
}

std::optional<Datagram> UdpMulticastTransport::receive() {
    if (!has_pending()) {
        return std::nullopt;
    }

    const auto datagram = socket_->receiveDatagram();
    if (!datagram.isValid()) {
        return std::nullopt;
    }

    Datagram out;
    out.data = datagram.data();
    out.sender = datagram.senderAddress();
    out.sender_port = static_cast<uint16_t>(datagram.senderPort());

    // Sockets bound to AnyIPv4 may report v4-mapped v6 senders on some stacks.
    bool is_v4 = false;
    const quint32 v4 = out.sender.toIPv4Address(&is_v4);
    if (is_v4) {
        out.sender = QHostAddress(v4);
    }
    return out;
}

void UdpMulticastTransport::onReadyRead() {
    if (on_ready_read) {
        on_ready_read();
    }
}

std::unique_ptr<MulticastTransport> createMulticastTransport(const DiscoveryConfig& config) {
    return std::make_unique<UdpMulticastTransport>(config);
}

} // namespace datlan::network
