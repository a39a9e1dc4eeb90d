#include "network/udp_discovery_backend.hpp"

#include "network/discovery_record.hpp"
#include "core/logging.hpp"

#include <QByteArray>
#include <QUdpSocket>
#include <QTimer>

namespace dropline::network {

UdpDiscoveryBackend::UdpDiscoveryBackend(const DiscoveryConfig& config,
                                         quint16 port,
                                         QObject* parent)
    : QObject(parent)
    , port_(port)
    , group_(QString::fromLatin1(MULTICAST_GROUP))
    , advertise_timer_(std::make_unique<QTimer>(this))
{
    advertise_timer_->setInterval(static_cast<int>(config.advertise_interval.count()));
    connect(advertise_timer_.get(), &QTimer::timeout, this, &UdpDiscoveryBackend::onAdvertiseTick);
}

UdpDiscoveryBackend::~UdpDiscoveryBackend() {
    stop_advertising();
    stop_browsing();
}

Result<void, Error> UdpDiscoveryBackend::ensureSocket() {
    if (socket_) {
        return Result<void, Error>::ok();
    }

    socket_ = std::make_unique<QUdpSocket>(this);

    if (!socket_->bind(QHostAddress::AnyIPv4,
                       port_,
                       QUdpSocket::ShareAddress | QUdpSocket::ReuseAddressHint)) {
        auto msg = "UDP bind failed: " + socket_->errorString().toStdString();
        socket_.reset();
        return Result<void, Error>::err(Error{ErrorKind::DiscoveryFailed, msg});
    }

    socket_->setSocketOption(QAbstractSocket::MulticastTtlOption, 1);
    socket_->setSocketOption(QAbstractSocket::MulticastLoopbackOption, 1);
    if (!socket_->joinMulticastGroup(group_)) {
        // Multicast may be unavailable (no route); broadcast still works.
        qCWarning(droplineDiscoveryLog) << "joinMulticastGroup failed:" << socket_->errorString();
    }
    connect(socket_.get(), &QUdpSocket::readyRead, this, &UdpDiscoveryBackend::onReadyRead);

    return Result<void, Error>::ok();
}

void UdpDiscoveryBackend::closeSocket() {
    if (!socket_) return;
    socket_->leaveMulticastGroup(group_);
    socket_.reset();
}

Result<void, Error> UdpDiscoveryBackend::start_advertising(const AdvertisementInfo& info) {
    auto socket = ensureSocket();
    if (socket.is_err()) return socket;

    advertised_ = info;
    advertising_ = true;
    advertise_timer_->start();
    announceOnce();
    return Result<void, Error>::ok();
}

void UdpDiscoveryBackend::stop_advertising() {
    advertising_ = false;
    advertise_timer_->stop();
    if (!browsing_) {
        closeSocket();
    }
}

Result<void, Error> UdpDiscoveryBackend::start_browsing() {
    auto socket = ensureSocket();
    if (socket.is_err()) return socket;

    browsing_ = true;
    return Result<void, Error>::ok();
}

void UdpDiscoveryBackend::stop_browsing() {
    browsing_ = false;
    if (!advertising_) {
        closeSocket();
    }
}

void UdpDiscoveryBackend::onReadyRead() {
    if (!socket_) return;

    while (socket_->hasPendingDatagrams()) {
        QByteArray datagram;
        datagram.resize(static_cast<qsizetype>(socket_->pendingDatagramSize()));

        QHostAddress sender;
        quint16 sender_port = 0;
        const auto read = socket_->readDatagram(datagram.data(), datagram.size(), &sender, &sender_port);
        Q_UNUSED(sender_port)
        if (read < 0 || !browsing_) {
            continue;
        }
        datagram.resize(static_cast<qsizetype>(read));

        // IPv4-mapped senders compare unequal to plain IPv4 otherwise.
        bool is_v4 = false;
        const auto v4 = sender.toIPv4Address(&is_v4);
        if (is_v4) {
            sender = QHostAddress(v4);
        }

        auto endpoint = decode_discovery_datagram(datagram, sender);
        if (endpoint.is_err()) {
            qCDebug(droplineDiscoveryLog) << "ignored datagram from" << sender.toString() << ":"
                                          << QString::fromStdString(endpoint.unwrap_err().message);
            continue;
        }

        if (on_endpoint_seen) {
            on_endpoint_seen(std::move(endpoint).unwrap());
        }
    }
}

void UdpDiscoveryBackend::announceOnce() {
    if (!socket_ || !advertising_) return;

    const auto bytes = encode_discovery_datagram(advertised_);

    // Multicast (preferred)
    if (socket_->writeDatagram(bytes, group_, port_) < 0) {
        qCDebug(droplineDiscoveryLog) << "multicast send failed:" << socket_->errorString();
    }

    // Broadcast (helps on networks without multicast)
    if (socket_->writeDatagram(bytes, QHostAddress::Broadcast, port_) < 0) {
        qCDebug(droplineDiscoveryLog) << "broadcast send failed:" << socket_->errorString();
    }
}

void UdpDiscoveryBackend::onAdvertiseTick() {
    announceOnce();
}

} // namespace dropline::network
