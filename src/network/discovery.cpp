#include "network/discovery.hpp"
#include "network/udp_discovery_backend.hpp"
#include "core/logging.hpp"

#include <QTimer>
#include <algorithm>

namespace dropline::network {

DiscoveryService::DiscoveryService(DiscoveryConfig config, QObject* parent)
    : DiscoveryService(createDiscoveryBackend(config.backend, config), config, parent)
{
}

DiscoveryService::DiscoveryService(std::unique_ptr<DiscoveryBackend> backend,
                                   DiscoveryConfig config,
                                   QObject* parent)
    : QObject(parent)
    , config_(config)
    , backend_(std::move(backend))
    , prune_timer_(std::make_unique<QTimer>(this))
{
    qRegisterMetaType<dropline::network::Endpoint>();
    qRegisterMetaType<dropline::network::DiscoveryEvent>();

    prune_timer_->setInterval(static_cast<int>(config_.prune_interval.count()));
    connect(prune_timer_.get(), &QTimer::timeout, this, [this]() {
        prune(Timestamp::now());
    });

    attachBackend();
}

DiscoveryService::~DiscoveryService() {
    if (backend_) {
        backend_->on_endpoint_seen = nullptr;
        backend_->on_endpoint_gone = nullptr;
        backend_->on_failure = nullptr;
        if (advertising_) backend_->stop_advertising();
        if (browsing_) backend_->stop_browsing();
    }
}

void DiscoveryService::attachBackend() {
    if (!backend_) return;
    backend_->on_endpoint_seen = [this](Endpoint endpoint) {
        handleSeen(std::move(endpoint), Timestamp::now());
    };
    backend_->on_endpoint_gone = [this](DeviceId id) {
        handleGone(id);
    };
    backend_->on_failure = [this](Error failure) {
        handleFailure(failure);
    };
}

const char* DiscoveryService::backendName() const {
    return backend_ ? backend_->name() : "none";
}

bool DiscoveryService::fallBackToUdp(const Error& cause) {
    if (fell_back_ || config_.backend != DiscoveryBackendKind::Auto) {
        return false;
    }
    qCWarning(droplineDiscoveryLog) << "backend" << backendName() << "unavailable:"
                                    << QString::fromStdString(cause.message)
                                    << "- falling back to UDP";
    fell_back_ = true;
    if (backend_) {
        if (advertising_) backend_->stop_advertising();
        if (browsing_) backend_->stop_browsing();
    }
    backend_ = std::make_unique<UdpDiscoveryBackend>(config_);
    attachBackend();
    if (advertising_) {
        auto result = backend_->start_advertising(*advertising_);
        if (result.is_err()) return false;
    }
    if (browsing_) {
        auto result = backend_->start_browsing();
        if (result.is_err()) return false;
    }
    return true;
}

Result<void, Error> DiscoveryService::startAdvertising(const AdvertisementInfo& info) {
    if (!backend_) {
        Error failure{ErrorKind::DiscoveryFailed, "Discovery backend not available"};
        emit error(failure);
        return Result<void, Error>::err(failure);
    }
    if (advertising_ && *advertising_ == info) {
        return Result<void, Error>::ok();
    }

    auto result = backend_->start_advertising(info);
    if (result.is_err()) {
        const auto cause = result.unwrap_err();
        if (fallBackToUdp(cause)) {
            result = backend_->start_advertising(info);
        }
    }
    if (result.is_err()) {
        Error failure{ErrorKind::DiscoveryFailed, result.unwrap_err().message};
        qCWarning(droplineDiscoveryLog) << "advertise failed:" << QString::fromStdString(failure.message);
        emit error(failure);
        return Result<void, Error>::err(failure);
    }

    const bool was_advertising = advertising_.has_value();
    advertising_ = info;
    qCInfo(droplineDiscoveryLog) << "advertising" << info.device_name << "port" << info.port
                                 << "via" << backendName();
    if (!was_advertising) {
        emit advertisingChanged();
    }
    return Result<void, Error>::ok();
}

void DiscoveryService::stopAdvertising() {
    if (backend_ && advertising_) {
        backend_->stop_advertising();
        advertising_.reset();
        emit advertisingChanged();
    }
}

Result<void, Error> DiscoveryService::startBrowsing() {
    if (!backend_) {
        Error failure{ErrorKind::DiscoveryFailed, "Discovery backend not available"};
        emit error(failure);
        return Result<void, Error>::err(failure);
    }
    if (browsing_) {
        return Result<void, Error>::ok();
    }

    auto result = backend_->start_browsing();
    if (result.is_err()) {
        const auto cause = result.unwrap_err();
        if (fallBackToUdp(cause)) {
            result = backend_->start_browsing();
        }
    }
    if (result.is_err()) {
        Error failure{ErrorKind::DiscoveryFailed, result.unwrap_err().message};
        qCWarning(droplineDiscoveryLog) << "browse failed:" << QString::fromStdString(failure.message);
        emit error(failure);
        return Result<void, Error>::err(failure);
    }

    browsing_ = true;
    prune_timer_->start();
    emit browsingChanged();
    return Result<void, Error>::ok();
}

void DiscoveryService::stopBrowsing() {
    if (!backend_ || !browsing_) return;

    backend_->stop_browsing();
    browsing_ = false;
    prune_timer_->stop();

    std::vector<DeviceId> known;
    known.reserve(endpoints_.size());
    for (const auto& [id, tracked] : endpoints_) {
        known.push_back(id);
    }
    for (const auto& id : known) {
        reportLost(id);
    }
    emit browsingChanged();
}

void DiscoveryService::prune(Timestamp now) {
    if (!backend_) return;

    std::vector<DeviceId> expired;
    for (const auto& [id, tracked] : endpoints_) {
        if (now - tracked.last_seen > config_.endpoint_ttl) {
            expired.push_back(id);
        }
    }
    for (const auto& id : expired) {
        qCDebug(droplineDiscoveryLog) << "expired" << QString::fromStdString(id.short_string());
        reportLost(id);
    }
}

std::vector<Endpoint> DiscoveryService::endpoints() const {
    std::vector<Endpoint> out;
    out.reserve(endpoints_.size());
    for (const auto& [id, tracked] : endpoints_) {
        out.push_back(tracked.endpoint);
    }
    std::sort(out.begin(), out.end(), [](const Endpoint& a, const Endpoint& b) {
        return a.name < b.name;
    });
    return out;
}

std::optional<Endpoint> DiscoveryService::endpoint(const DeviceId& id) const {
    auto it = endpoints_.find(id);
    if (it != endpoints_.end()) {
        return it->second.endpoint;
    }
    return std::nullopt;
}

std::optional<Endpoint> DiscoveryService::findEndpoint(const QString& id_or_name) const {
    if (auto id = Uuid::parse(id_or_name.trimmed().toStdString())) {
        if (auto found = endpoint(*id)) {
            return found;
        }
    }
    for (const auto& [id, tracked] : endpoints_) {
        if (tracked.endpoint.name.compare(id_or_name, Qt::CaseInsensitive) == 0) {
            return tracked.endpoint;
        }
    }
    return std::nullopt;
}

void DiscoveryService::handleSeen(Endpoint endpoint, Timestamp now) {
    if (!browsing_) return;
    if (advertising_ && endpoint.id == advertising_->device_id) return;

    auto it = endpoints_.find(endpoint.id);
    if (it == endpoints_.end()) {
        endpoints_.emplace(endpoint.id, Tracked{endpoint, now});
        qCInfo(droplineDiscoveryLog) << "found" << endpoint.name << endpoint.host.toString()
                                     << endpoint.port;
        emit discoveryEvent(DiscoveryEvent{EndpointFound{endpoint}});
        emit endpointFound(endpoint);
        emit endpointsChanged();
        return;
    }

    it->second.last_seen = now;
    if (it->second.endpoint == endpoint) {
        return;
    }

    it->second.endpoint = endpoint;
    qCInfo(droplineDiscoveryLog) << "updated" << endpoint.name << endpoint.host.toString()
                                 << endpoint.port;
    emit discoveryEvent(DiscoveryEvent{EndpointFound{endpoint}});
    emit endpointFound(endpoint);
    emit endpointsChanged();
}

void DiscoveryService::handleGone(const DeviceId& id) {
    reportLost(id);
}

void DiscoveryService::handleFailure(const Error& failure) {
    Error reported{ErrorKind::DiscoveryFailed, failure.message};
    qCWarning(droplineDiscoveryLog) << "backend failure:" << QString::fromStdString(reported.message);
    emit error(reported);
}

void DiscoveryService::reportLost(const DeviceId& id) {
    if (endpoints_.erase(id) == 0) return;
    qCInfo(droplineDiscoveryLog) << "lost" << QString::fromStdString(id.short_string());
    emit discoveryEvent(DiscoveryEvent{EndpointLost{id}});
    emit endpointLost(id);
    emit endpointsChanged();
}

std::unique_ptr<DiscoveryBackend> createDiscoveryBackend(DiscoveryBackendKind kind,
                                                         const DiscoveryConfig& config) {
    switch (kind) {
        case DiscoveryBackendKind::Udp:
            return std::make_unique<UdpDiscoveryBackend>(config);
        case DiscoveryBackendKind::Avahi:
        case DiscoveryBackendKind::Auto:
            return createAvahiBackend(config);
    }
    return std::make_unique<UdpDiscoveryBackend>(config);
}

} // namespace dropline::network
