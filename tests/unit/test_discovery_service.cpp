#include <catch2/catch_test_macros.hpp>
#include "network/discovery.hpp"

#include <QSignalSpy>
#include <QTest>

#include <string>

using namespace dropline;
using namespace dropline::network;

namespace {

class FakeBackend : public DiscoveryBackend {
public:
    Result<void, Error> start_advertising(const AdvertisementInfo& info) override {
        if (fail_advertising) {
            return Result<void, Error>::err(Error{ErrorKind::IOFailure, "daemon not running"});
        }
        advertised = info;
        ++advertise_calls;
        return Result<void, Error>::ok();
    }
    void stop_advertising() override { advertised.reset(); }
    Result<void, Error> start_browsing() override {
        browsing = true;
        return Result<void, Error>::ok();
    }
    void stop_browsing() override { browsing = false; }
    [[nodiscard]] const char* name() const override { return "fake"; }

    void see(const Endpoint& endpoint) { on_endpoint_seen(endpoint); }
    void gone(const DeviceId& id) { on_endpoint_gone(id); }

    std::optional<AdvertisementInfo> advertised;
    int advertise_calls = 0;
    bool browsing = false;
    bool fail_advertising = false;
};

Endpoint laptop() {
    Endpoint endpoint;
    endpoint.id = *DeviceId::parse("0b8e2f4c-3a1d-4e6f-9c2b-7d5a1e8f3b40");
    endpoint.name = QStringLiteral("laptop");
    endpoint.host = QHostAddress(QStringLiteral("192.168.1.20"));
    endpoint.port = 54321;
    return endpoint;
}

struct Fixture {
    Fixture() {
        auto owned = std::make_unique<FakeBackend>();
        backend = owned.get();
        DiscoveryConfig config;
        config.endpoint_ttl = std::chrono::milliseconds(6000);
        service = std::make_unique<DiscoveryService>(std::move(owned), config);
    }

    FakeBackend* backend = nullptr;
    std::unique_ptr<DiscoveryService> service;
};

} // namespace

TEST_CASE("DiscoveryService: found once, found again on change", "[discovery]") {
    Fixture f;
    QSignalSpy found(f.service.get(), &DiscoveryService::endpointFound);
    REQUIRE(f.service->startBrowsing().is_ok());

    f.backend->see(laptop());
    f.backend->see(laptop());
    REQUIRE(found.count() == 1);

    auto moved = laptop();
    moved.port = 54322;
    f.backend->see(moved);
    REQUIRE(found.count() == 2);
    REQUIRE(f.service->endpoint(moved.id)->port == 54322);
}

TEST_CASE("DiscoveryService: findEndpoint by id or name", "[discovery]") {
    Fixture f;
    REQUIRE(f.service->startBrowsing().is_ok());
    f.backend->see(laptop());

    REQUIRE(f.service->findEndpoint(QStringLiteral("LAPTOP")).has_value());
    REQUIRE(f.service->findEndpoint(QStringLiteral("0b8e2f4c-3a1d-4e6f-9c2b-7d5a1e8f3b40")).has_value());
    REQUIRE_FALSE(f.service->findEndpoint(QStringLiteral("phone")).has_value());
}

TEST_CASE("DiscoveryService: lost exactly once after the TTL", "[discovery]") {
    Fixture f;
    QSignalSpy lost(f.service.get(), &DiscoveryService::endpointLost);
    REQUIRE(f.service->startBrowsing().is_ok());
    f.backend->see(laptop());

    f.service->prune(Timestamp::now());
    REQUIRE(lost.count() == 0);

    const auto later = Timestamp::now() + std::chrono::milliseconds(10000);
    f.service->prune(later);
    f.service->prune(later);
    REQUIRE(lost.count() == 1);
    REQUIRE(f.service->endpointCount() == 0);

    f.backend->gone(laptop().id);
    REQUIRE(lost.count() == 1);
}

TEST_CASE("DiscoveryService: repeated sightings keep an endpoint alive", "[discovery]") {
    Fixture f;
    QSignalSpy found(f.service.get(), &DiscoveryService::endpointFound);
    QSignalSpy lost(f.service.get(), &DiscoveryService::endpointLost);
    REQUIRE(f.service->startBrowsing().is_ok());
    const auto first_seen = Timestamp::now();
    f.backend->see(laptop());

    // A heartbeat refreshes without a second Found.
    QTest::qWait(100);
    f.backend->see(laptop());
    REQUIRE(found.count() == 1);

    f.service->prune(first_seen + std::chrono::milliseconds(6050));
    REQUIRE(lost.count() == 0);

    f.service->prune(Timestamp::now() + std::chrono::milliseconds(60000));
    REQUIRE(lost.count() == 1);
}

TEST_CASE("DiscoveryService: mDNS backend is created without touching the daemon", "[discovery]") {
    DiscoveryConfig config;
    config.backend = DiscoveryBackendKind::Avahi;
    auto backend = createDiscoveryBackend(DiscoveryBackendKind::Avahi, config);
    REQUIRE(std::string(backend->name()) == "avahi");

    // No daemon is contacted until advertising or browsing starts.
    DiscoveryService service(std::move(backend), config);
    REQUIRE(std::string(service.backendName()) == "avahi");
    REQUIRE_FALSE(service.isBrowsing());
}

TEST_CASE("DiscoveryService: own advertisement and non-browsing sightings are ignored", "[discovery]") {
    Fixture f;
    QSignalSpy found(f.service.get(), &DiscoveryService::endpointFound);

    f.backend->see(laptop());
    REQUIRE(found.count() == 0);

    AdvertisementInfo self;
    self.device_id = DeviceId::generate();
    self.device_name = QStringLiteral("me");
    self.port = 9300;
    REQUIRE(f.service->startAdvertising(self).is_ok());
    REQUIRE(f.service->startBrowsing().is_ok());

    Endpoint echo;
    echo.id = self.device_id;
    echo.name = self.device_name;
    echo.host = QHostAddress(QHostAddress::LocalHost);
    echo.port = self.port;
    f.backend->see(echo);
    REQUIRE(found.count() == 0);
}

TEST_CASE("DiscoveryService: same advertisement is not re-announced", "[discovery]") {
    Fixture f;
    AdvertisementInfo info;
    info.device_id = DeviceId::generate();
    info.device_name = QStringLiteral("me");
    info.port = 9300;

    REQUIRE(f.service->startAdvertising(info).is_ok());
    REQUIRE(f.service->startAdvertising(info).is_ok());
    REQUIRE(f.backend->advertise_calls == 1);

    info.port = 9301;
    REQUIRE(f.service->startAdvertising(info).is_ok());
    REQUIRE(f.backend->advertise_calls == 2);
}

TEST_CASE("DiscoveryService: stopBrowsing reports every endpoint lost", "[discovery]") {
    Fixture f;
    QSignalSpy lost(f.service.get(), &DiscoveryService::endpointLost);
    REQUIRE(f.service->startBrowsing().is_ok());
    f.backend->see(laptop());

    f.service->stopBrowsing();
    REQUIRE(lost.count() == 1);
    REQUIRE_FALSE(f.backend->browsing);
}

TEST_CASE("DiscoveryService: advertise failure is DiscoveryFailed", "[discovery]") {
    auto owned = std::make_unique<FakeBackend>();
    owned->fail_advertising = true;
    DiscoveryConfig config;
    config.backend = DiscoveryBackendKind::Udp;  // no automatic fallback
    DiscoveryService service(std::move(owned), config);
    QSignalSpy errors(&service, &DiscoveryService::error);

    AdvertisementInfo info;
    info.device_id = DeviceId::generate();
    info.port = 9300;
    auto result = service.startAdvertising(info);
    REQUIRE(result.is_err());
    REQUIRE(result.unwrap_err().kind == ErrorKind::DiscoveryFailed);
    REQUIRE(errors.count() == 1);
}
