#include <catch2/catch_test_macros.hpp>
#include "core/config.hpp"

#include <QSettings>
#include <QTemporaryDir>

using namespace dropline;

namespace {

EngineConfig valid_config() {
    EngineConfig config;
    config.device.id = DeviceId::generate();
    config.device.name = QStringLiteral("desk");
    config.transfer.download_dir = QStringLiteral("/tmp/dropline");
    return config;
}

} // namespace

TEST_CASE("EngineConfig defaults validate once identity is set", "[config]") {
    REQUIRE(valid_config().validate().is_ok());
    REQUIRE(EngineConfig{}.validate().unwrap_err().kind == ErrorKind::InvalidArgument);
}

TEST_CASE("EngineConfig rejects inconsistent limits", "[config]") {
    auto config = valid_config();

    SECTION("frame too small for a chunk") {
        config.network.max_frame_size = config.transfer.max_chunk_payload;
        REQUIRE(config.validate().is_err());
    }

    SECTION("keep-alive not shorter than chunk timeout") {
        config.transfer.keep_alive_interval = config.transfer.chunk_timeout;
        REQUIRE(config.validate().is_err());
    }

    SECTION("ttl not above advertise interval") {
        config.discovery.endpoint_ttl = config.discovery.advertise_interval;
        REQUIRE(config.validate().is_err());
    }

    SECTION("blank name") {
        config.device.name = QStringLiteral("  ");
        REQUIRE(config.validate().is_err());
    }
}

TEST_CASE("load_config reads settings and persists the device id", "[config]") {
    QTemporaryDir dir;
    REQUIRE(dir.isValid());
    const auto path = dir.filePath(QStringLiteral("dropline.ini"));

    DeviceId first_id;
    {
        QSettings settings(path, QSettings::IniFormat);
        settings.setValue(QStringLiteral("device/name"), QStringLiteral("kitchen"));
        settings.setValue(QStringLiteral("network/port"), 9400);
        settings.setValue(QStringLiteral("network/trust_mode"), QStringLiteral("pin"));
        settings.setValue(QStringLiteral("transfer/chunk_timeout_ms"), 20000);
        settings.setValue(QStringLiteral("discovery/backend"), QStringLiteral("udp"));

        const auto config = load_config(settings);
        first_id = config.device.id;
        REQUIRE_FALSE(first_id.is_nil());
        REQUIRE(config.device.name == QStringLiteral("kitchen"));
        REQUIRE(config.network.port == 9400);
        REQUIRE(config.network.trust_mode == TrustMode::PinConfirmation);
        REQUIRE(config.transfer.chunk_timeout == std::chrono::milliseconds(20000));
        REQUIRE(config.discovery.backend == DiscoveryBackendKind::Udp);
    }

    QSettings again(path, QSettings::IniFormat);
    REQUIRE(load_config(again).device.id == first_id);
}

TEST_CASE("load_config ignores unusable values", "[config]") {
    QTemporaryDir dir;
    REQUIRE(dir.isValid());
    QSettings settings(dir.filePath(QStringLiteral("bad.ini")), QSettings::IniFormat);
    settings.setValue(QStringLiteral("device/id"), QStringLiteral("not-a-uuid"));
    settings.setValue(QStringLiteral("network/port"), QStringLiteral("seventy"));
    settings.setValue(QStringLiteral("network/trust_mode"), QStringLiteral("paranoid"));

    const auto config = load_config(settings);
    REQUIRE_FALSE(config.device.id.is_nil());
    REQUIRE(config.network.port == NetworkConfig::DEFAULT_PORT);
    REQUIRE(config.network.trust_mode == TrustMode::Implicit);
}

TEST_CASE("apply_environment overrides discovery and download dir", "[config]") {
    auto config = valid_config();
    qputenv("DROPLINE_DISCOVERY_BACKEND", "avahi");
    qputenv("DROPLINE_DISABLE_DISCOVERY", "1");
    qputenv("DROPLINE_DOWNLOAD_DIR", "/srv/incoming");

    apply_environment(config);

    qunsetenv("DROPLINE_DISCOVERY_BACKEND");
    qunsetenv("DROPLINE_DISABLE_DISCOVERY");
    qunsetenv("DROPLINE_DOWNLOAD_DIR");

    REQUIRE(config.discovery.backend == DiscoveryBackendKind::Avahi);
    REQUIRE_FALSE(config.discovery.enabled);
    REQUIRE(config.transfer.download_dir == QStringLiteral("/srv/incoming"));
}

TEST_CASE("Trust mode and backend names", "[config]") {
    REQUIRE(parse_trust_mode("shared-secret") == TrustMode::SharedSecret);
    REQUIRE_FALSE(parse_trust_mode("PIN").has_value());
    REQUIRE(to_string(TrustMode::PinConfirmation) == "pin");
    REQUIRE(parse_discovery_backend("") == DiscoveryBackendKind::Auto);
    REQUIRE_FALSE(parse_discovery_backend("bonjour").has_value());
}
