#include "core/config.hpp"

#include <QDir>
#include <QSettings>
#include <QStandardPaths>
#include <QSysInfo>

namespace dropline {

namespace {

constexpr const char* kSettingsDeviceId = "device/id";
constexpr const char* kSettingsDeviceName = "device/name";
constexpr const char* kSettingsPort = "network/port";
constexpr const char* kSettingsMaxFrame = "network/max_frame_size";
constexpr const char* kSettingsHandshakeTimeout = "network/handshake_timeout_ms";
constexpr const char* kSettingsTrustMode = "network/trust_mode";
constexpr const char* kSettingsDownloadDir = "transfer/download_dir";
constexpr const char* kSettingsAutoAccept = "transfer/auto_accept";
constexpr const char* kSettingsChunkPayload = "transfer/max_chunk_payload";
constexpr const char* kSettingsNegotiationTimeout = "transfer/negotiation_timeout_ms";
constexpr const char* kSettingsChunkTimeout = "transfer/chunk_timeout_ms";
constexpr const char* kSettingsDiscoveryEnabled = "discovery/enabled";
constexpr const char* kSettingsDiscoveryBackend = "discovery/backend";
constexpr const char* kSettingsDiscoveryTtl = "discovery/ttl_ms";

QString default_download_dir() {
    auto dir = QStandardPaths::writableLocation(QStandardPaths::DownloadLocation);
    if (dir.isEmpty()) {
        dir = QDir::homePath();
    }
    return dir;
}

QString default_device_name() {
    auto name = QSysInfo::machineHostName();
    if (name.isEmpty()) {
        name = QStringLiteral("dropline-device");
    }
    return name;
}

std::chrono::milliseconds read_millis(QSettings& settings, const char* key,
                                      std::chrono::milliseconds fallback) {
    bool ok = false;
    const auto value = settings.value(QString::fromLatin1(key)).toLongLong(&ok);
    if (!ok || value <= 0) {
        return fallback;
    }
    return std::chrono::milliseconds(value);
}

Result<void, Error> invalid(std::string message) {
    return Result<void, Error>::err(Error{ErrorKind::InvalidArgument, std::move(message)});
}

} // namespace

std::string_view to_string(TrustMode mode) {
    switch (mode) {
        case TrustMode::Implicit: return "implicit";
        case TrustMode::PinConfirmation: return "pin";
        case TrustMode::SharedSecret: return "shared-secret";
    }
    return "implicit";
}

std::optional<TrustMode> parse_trust_mode(std::string_view text) {
    if (text == "implicit") return TrustMode::Implicit;
    if (text == "pin") return TrustMode::PinConfirmation;
    if (text == "shared-secret") return TrustMode::SharedSecret;
    return std::nullopt;
}

std::string_view to_string(DiscoveryBackendKind kind) {
    switch (kind) {
        case DiscoveryBackendKind::Auto: return "auto";
        case DiscoveryBackendKind::Avahi: return "avahi";
        case DiscoveryBackendKind::Udp: return "udp";
    }
    return "auto";
}

std::optional<DiscoveryBackendKind> parse_discovery_backend(std::string_view text) {
    if (text == "auto" || text.empty()) return DiscoveryBackendKind::Auto;
    if (text == "avahi") return DiscoveryBackendKind::Avahi;
    if (text == "udp") return DiscoveryBackendKind::Udp;
    return std::nullopt;
}

Result<void, Error> EngineConfig::validate() const {
    if (device.id.is_nil()) {
        return invalid("device id is nil");
    }
    if (device.name.trimmed().isEmpty()) {
        return invalid("device name is empty");
    }
    if (transfer.max_chunk_payload == 0) {
        return invalid("max chunk payload must be positive");
    }
    if (network.max_frame_size < transfer.max_chunk_payload + FRAME_OVERHEAD_ALLOWANCE) {
        return invalid("max frame size leaves no room for a full chunk");
    }
    if (transfer.max_items == 0) {
        return invalid("max items must be positive");
    }
    if (network.handshake_timeout.count() <= 0 ||
        transfer.negotiation_timeout.count() <= 0 ||
        transfer.chunk_timeout.count() <= 0) {
        return invalid("timeouts must be positive");
    }
    if (transfer.keep_alive_interval.count() <= 0 ||
        transfer.keep_alive_interval >= transfer.chunk_timeout) {
        return invalid("keep-alive interval must be shorter than the chunk timeout");
    }
    if (discovery.advertise_interval.count() <= 0 ||
        discovery.endpoint_ttl <= discovery.advertise_interval) {
        return invalid("discovery ttl must exceed the advertise interval");
    }
    if (transfer.download_dir.isEmpty()) {
        return invalid("download directory is empty");
    }
    return Result<void, Error>::ok();
}

DeviceId get_or_create_device_id(QSettings& settings) {
    const QString device_id_key = QString::fromLatin1(kSettingsDeviceId);
    QString stored_id = settings.value(device_id_key).toString();
    if (!stored_id.isEmpty()) {
        auto parsed_id = Uuid::parse(stored_id.toStdString());
        if (parsed_id && !parsed_id->is_nil()) {
            return *parsed_id;
        }
    }
    const auto id = Uuid::generate();
    settings.setValue(device_id_key, QString::fromStdString(id.to_string()));
    return id;
}

EngineConfig load_config(QSettings& settings) {
    EngineConfig config;

    config.device.id = get_or_create_device_id(settings);
    config.device.name = settings.value(QString::fromLatin1(kSettingsDeviceName),
                                        default_device_name()).toString();

    bool ok = false;
    const auto port = settings.value(QString::fromLatin1(kSettingsPort)).toUInt(&ok);
    if (ok && port <= 0xFFFF) {
        config.network.port = static_cast<uint16_t>(port);
    }
    const auto max_frame = settings.value(QString::fromLatin1(kSettingsMaxFrame)).toUInt(&ok);
    if (ok && max_frame > 0) {
        config.network.max_frame_size = max_frame;
    }
    config.network.handshake_timeout = read_millis(
        settings, kSettingsHandshakeTimeout, config.network.handshake_timeout);
    if (auto mode = parse_trust_mode(
            settings.value(QString::fromLatin1(kSettingsTrustMode)).toString().toStdString())) {
        config.network.trust_mode = *mode;
    }

    config.transfer.download_dir = settings.value(QString::fromLatin1(kSettingsDownloadDir),
                                                  default_download_dir()).toString();
    config.transfer.auto_accept = settings.value(QString::fromLatin1(kSettingsAutoAccept),
                                                 false).toBool();
    const auto chunk = settings.value(QString::fromLatin1(kSettingsChunkPayload)).toUInt(&ok);
    if (ok && chunk > 0) {
        config.transfer.max_chunk_payload = chunk;
    }
    config.transfer.negotiation_timeout = read_millis(
        settings, kSettingsNegotiationTimeout, config.transfer.negotiation_timeout);
    config.transfer.chunk_timeout = read_millis(
        settings, kSettingsChunkTimeout, config.transfer.chunk_timeout);

    config.discovery.enabled = settings.value(QString::fromLatin1(kSettingsDiscoveryEnabled),
                                              true).toBool();
    if (auto backend = parse_discovery_backend(
            settings.value(QString::fromLatin1(kSettingsDiscoveryBackend)).toString().toStdString())) {
        config.discovery.backend = *backend;
    }
    config.discovery.endpoint_ttl = read_millis(
        settings, kSettingsDiscoveryTtl, config.discovery.endpoint_ttl);

    return config;
}

void apply_environment(EngineConfig& config) {
    const auto backend = qEnvironmentVariable("DROPLINE_DISCOVERY_BACKEND").trimmed().toLower();
    if (!backend.isEmpty()) {
        if (auto parsed = parse_discovery_backend(backend.toStdString())) {
            config.discovery.backend = *parsed;
        }
    }
    if (qEnvironmentVariableIntValue("DROPLINE_DISABLE_DISCOVERY") == 1) {
        config.discovery.enabled = false;
    }
    const auto download_dir = qEnvironmentVariable("DROPLINE_DOWNLOAD_DIR");
    if (!download_dir.isEmpty()) {
        config.transfer.download_dir = download_dir;
    }
}

} // namespace dropline
