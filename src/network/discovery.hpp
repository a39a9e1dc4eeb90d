#pragma once

#include "core/config.hpp"
#include "core/types.hpp"
#include "core/result.hpp"
#include <QObject>
#include <QString>
#include <QHostAddress>
#include <QMetaType>
#include <functional>
#include <memory>
#include <optional>
#include <unordered_map>
#include <variant>
#include <vector>

class QTimer;

namespace dropline::network {

constexpr int DISCOVERY_PROTOCOL_VERSION = 1;

/**
 * Capability bits advertised in the `c` TXT key.
 */
enum Capability : uint32_t {
    CapabilityReceive = 1u << 0,
    CapabilitySend = 1u << 1,
    CapabilityPinConfirmation = 1u << 2,
    CapabilitySharedSecret = 1u << 3
};

/**
 * Endpoint - A peer seen on the local network.
 */
struct Endpoint {
    DeviceId id;
    QString name;
    QHostAddress host;
    uint16_t port = 0;
    uint32_t capabilities = 0;
    int protocol_version = DISCOVERY_PROTOCOL_VERSION;

    bool operator==(const Endpoint& other) const {
        return id == other.id && name == other.name && host == other.host &&
               port == other.port && capabilities == other.capabilities &&
               protocol_version == other.protocol_version;
    }
};

/**
 * AdvertisementInfo - What we announce about ourselves.
 */
struct AdvertisementInfo {
    DeviceId device_id;
    QString device_name;
    uint16_t port = 0;
    uint32_t capabilities = CapabilityReceive | CapabilitySend;
    int protocol_version = DISCOVERY_PROTOCOL_VERSION;

    bool operator==(const AdvertisementInfo& other) const {
        return device_id == other.device_id && device_name == other.device_name &&
               port == other.port && capabilities == other.capabilities &&
               protocol_version == other.protocol_version;
    }
};

struct EndpointFound {
    Endpoint endpoint;
};

struct EndpointLost {
    DeviceId id;
};

using DiscoveryEvent = std::variant<EndpointFound, EndpointLost>;

/**
 * DiscoveryBackend - Transport for advertisements (mDNS or UDP multicast).
 *
 * Backends only report what they see. Duplicate suppression and expiry
 * live in DiscoveryService, so a backend must report a live peer again at
 * least once per advertise interval.
 */
class DiscoveryBackend {
public:
    virtual ~DiscoveryBackend() = default;

    virtual Result<void, Error> start_advertising(const AdvertisementInfo& info) = 0;
    virtual void stop_advertising() = 0;

    virtual Result<void, Error> start_browsing() = 0;
    virtual void stop_browsing() = 0;

    [[nodiscard]] virtual const char* name() const = 0;

    // Callbacks (always invoked on the service's thread)
    std::function<void(Endpoint)> on_endpoint_seen;
    std::function<void(DeviceId)> on_endpoint_gone;
    std::function<void(Error)> on_failure;
};

/**
 * DiscoveryService - Advertises this device and browses for peers.
 *
 * Found is emitted the first time an endpoint is seen and again when its
 * address, port, name or capabilities change. Lost is emitted exactly once
 * per endpoint, when it has not been re-announced within the configured
 * TTL, when the backend reports its removal, or when browsing stops.
 *
 * DNS-SD service type: _dropline._tcp
 *
 * TXT records:
 * - v=<protocol_version>
 * - id=<device_uuid>
 * - n=<base64url device name>
 * - p=<transport port>
 * - c=<capability flags, hex>
 */
class DiscoveryService : public QObject {
    Q_OBJECT

    Q_PROPERTY(bool advertising READ isAdvertising NOTIFY advertisingChanged)
    Q_PROPERTY(bool browsing READ isBrowsing NOTIFY browsingChanged)
    Q_PROPERTY(int endpointCount READ endpointCount NOTIFY endpointsChanged)

public:
    static constexpr const char* SERVICE_TYPE = "_dropline._tcp";

    /**
     * Uses the backend selected by `config.backend`.
     */
    explicit DiscoveryService(DiscoveryConfig config, QObject* parent = nullptr);

    /**
     * Uses the given backend (tests inject fakes here).
     */
    DiscoveryService(std::unique_ptr<DiscoveryBackend> backend,
                     DiscoveryConfig config,
                     QObject* parent = nullptr);
    ~DiscoveryService() override;

    /**
     * Start (or refresh) the announcement. Same info while advertising is a
     * no-op; changed info re-announces. DiscoveryFailed on socket/daemon
     * failure.
     */
    Result<void, Error> startAdvertising(const AdvertisementInfo& info);

    /**
     * Safe to call when not advertising.
     */
    void stopAdvertising();

    /**
     * Begin delivering discoveryEvent. Restartable after stopBrowsing().
     */
    Result<void, Error> startBrowsing();

    /**
     * Stop browsing; Lost is reported for every endpoint still known.
     */
    void stopBrowsing();

    /**
     * Expire endpoints not seen since `now - ttl`. Called by the prune
     * timer; public so expiry can be driven deterministically.
     */
    void prune(Timestamp now);

    [[nodiscard]] std::vector<Endpoint> endpoints() const;
    [[nodiscard]] std::optional<Endpoint> endpoint(const DeviceId& id) const;

    /**
     * Find by device id string or by exact (case-insensitive) display name.
     */
    [[nodiscard]] std::optional<Endpoint> findEndpoint(const QString& id_or_name) const;

    [[nodiscard]] bool isAdvertising() const { return advertising_.has_value(); }
    [[nodiscard]] bool isBrowsing() const { return browsing_; }
    [[nodiscard]] int endpointCount() const { return static_cast<int>(endpoints_.size()); }
    [[nodiscard]] const char* backendName() const;

signals:
    void discoveryEvent(const dropline::network::DiscoveryEvent& event);
    void endpointFound(const dropline::network::Endpoint& endpoint);
    void endpointLost(const dropline::DeviceId& id);
    void advertisingChanged();
    void browsingChanged();
    void endpointsChanged();
    void error(const dropline::Error& error);

private:
    struct Tracked {
        Endpoint endpoint;
        Timestamp last_seen;
    };

    DiscoveryConfig config_;
    std::unique_ptr<DiscoveryBackend> backend_;
    std::unique_ptr<QTimer> prune_timer_;
    std::unordered_map<DeviceId, Tracked> endpoints_;
    std::optional<AdvertisementInfo> advertising_;
    bool browsing_ = false;
    bool fell_back_ = false;

    void attachBackend();
    bool fallBackToUdp(const Error& cause);
    void handleSeen(Endpoint endpoint, Timestamp now);
    void handleGone(const DeviceId& id);
    void handleFailure(const Error& error);
    void reportLost(const DeviceId& id);
};

/**
 * Create the backend for `kind`. Auto picks Avahi.
 */
std::unique_ptr<DiscoveryBackend> createDiscoveryBackend(DiscoveryBackendKind kind,
                                                         const DiscoveryConfig& config);

std::unique_ptr<DiscoveryBackend> createAvahiBackend(const DiscoveryConfig& config);

} // namespace dropline::network

Q_DECLARE_METATYPE(dropline::network::Endpoint)
Q_DECLARE_METATYPE(dropline::network::DiscoveryEvent)
