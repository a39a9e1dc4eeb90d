#pragma once

#include "network/discovery.hpp"
#include <QObject>
#include <QHostAddress>
#include <memory>

class QUdpSocket;
class QTimer;

namespace dropline::network {

/**
 * UDP multicast discovery backend.
 *
 * Cross-platform and needs no daemon. Periodically multicasts the
 * advertisement datagram (see discovery_record.hpp) and reports every
 * datagram it hears; DiscoveryService turns those into Found/Lost.
 */
class UdpDiscoveryBackend final : public QObject, public DiscoveryBackend {
    Q_OBJECT

public:
    static constexpr quint16 DEFAULT_PORT = 47778;
    static constexpr const char* MULTICAST_GROUP = "239.255.77.78";

    explicit UdpDiscoveryBackend(const DiscoveryConfig& config,
                                 quint16 port = DEFAULT_PORT,
                                 QObject* parent = nullptr);
    ~UdpDiscoveryBackend() override;

    Result<void, Error> start_advertising(const AdvertisementInfo& info) override;
    void stop_advertising() override;

    Result<void, Error> start_browsing() override;
    void stop_browsing() override;

    [[nodiscard]] const char* name() const override { return "udp"; }

private slots:
    void onReadyRead();
    void onAdvertiseTick();

private:
    Result<void, Error> ensureSocket();
    void closeSocket();
    void announceOnce();

    quint16 port_;
    QHostAddress group_;
    std::unique_ptr<QUdpSocket> socket_;
    std::unique_ptr<QTimer> advertise_timer_;

    bool advertising_ = false;
    bool browsing_ = false;
    AdvertisementInfo advertised_{};
};

} // namespace dropline::network
