#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <QString>
#include <chrono>
#include <cstdint>
#include <string_view>
#include <optional>

class QSettings;

namespace dropline {

/**
 * How a handshake decides that the peer on the other end is trusted.
 */
enum class TrustMode {
    Implicit,
    PinConfirmation,
    SharedSecret
};

enum class DiscoveryBackendKind {
    Auto,
    Avahi,
    Udp
};

[[nodiscard]] std::string_view to_string(TrustMode mode);
[[nodiscard]] std::optional<TrustMode> parse_trust_mode(std::string_view text);
[[nodiscard]] std::string_view to_string(DiscoveryBackendKind kind);
[[nodiscard]] std::optional<DiscoveryBackendKind> parse_discovery_backend(std::string_view text);

struct DeviceConfig {
    DeviceId id;
    QString name;
};

struct NetworkConfig {
    static constexpr uint16_t DEFAULT_PORT = 9300;

    uint16_t port = DEFAULT_PORT;
    uint32_t max_frame_size = 1024 * 1024;
    std::chrono::milliseconds handshake_timeout{30000};
    TrustMode trust_mode = TrustMode::Implicit;
};

struct TransferConfig {
    QString download_dir;
    bool auto_accept = false;
    uint32_t max_chunk_payload = 64 * 1024;
    uint32_t max_items = 4096;
    uint64_t max_item_size = uint64_t{1} << 40;
    std::chrono::milliseconds negotiation_timeout{60000};
    std::chrono::milliseconds chunk_timeout{15000};
    std::chrono::milliseconds keep_alive_interval{5000};
    std::chrono::milliseconds progress_interval{200};
    // Sender stops queueing chunks while this many bytes wait in the socket.
    uint64_t send_window = 4 * 1024 * 1024;
};

struct DiscoveryConfig {
    bool enabled = true;
    DiscoveryBackendKind backend = DiscoveryBackendKind::Auto;
    std::chrono::milliseconds endpoint_ttl{6000};
    std::chrono::milliseconds advertise_interval{1500};
    std::chrono::milliseconds prune_interval{1000};
};

/**
 * EngineConfig - Everything the engine needs to know before it starts.
 *
 * Sources, lowest precedence first: built-in defaults, QSettings, the
 * DROPLINE_* environment, command line options.
 */
struct EngineConfig {
    DeviceConfig device;
    NetworkConfig network;
    TransferConfig transfer;
    DiscoveryConfig discovery;

    /**
     * Check limits against each other. Returns InvalidArgument on the first
     * inconsistency.
     */
    [[nodiscard]] Result<void, Error> validate() const;
};

/**
 * Bytes a sealed chunk frame adds on top of its payload (framing, protobuf
 * tags, MAC). A frame limit must leave at least this much room.
 */
constexpr uint32_t FRAME_OVERHEAD_ALLOWANCE = 256;

/**
 * Read settings, creating and persisting a device id on first use.
 */
[[nodiscard]] EngineConfig load_config(QSettings& settings);

/**
 * Apply DROPLINE_DISCOVERY_BACKEND, DROPLINE_DISABLE_DISCOVERY and
 * DROPLINE_DOWNLOAD_DIR on top of `config`.
 */
void apply_environment(EngineConfig& config);

/**
 * Returns the stored device id, generating and storing one if absent or
 * unparsable.
 */
[[nodiscard]] DeviceId get_or_create_device_id(QSettings& settings);

} // namespace dropline
