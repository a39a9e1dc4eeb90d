#pragma once

#include "core/types.hpp"
#include "core/result.hpp"
#include "crypto/keys.hpp"
#include <QHostAddress>
#include <QString>

namespace dropline::network {

/**
 * PairingInvite - What a QR code carries so a scanner can connect with
 * shared-secret trust.
 *
 * JSON format:
 * {
 *   "v": 1,
 *   "id": "device-uuid",
 *   "name": "Device Name",
 *   "addr": "192.168.1.100",
 *   "port": 9300,
 *   "secret": "base64url-32-bytes"
 * }
 */
struct PairingInvite {
    static constexpr int VERSION = 1;

    DeviceId device_id;
    QString device_name;
    QHostAddress address;
    uint16_t port = 0;
    crypto::SharedSecret secret{};
};

/**
 * Build an invite for this device with a fresh random secret.
 */
[[nodiscard]] PairingInvite make_invite(const DeviceId& device_id,
                                        const QString& device_name,
                                        const QHostAddress& address,
                                        uint16_t port);

[[nodiscard]] QString generate_invite_json(const PairingInvite& invite);

/**
 * Parse a scanned payload. Errors have kind Malformed.
 */
[[nodiscard]] Result<PairingInvite, Error> parse_invite_json(const QString& json);

} // namespace dropline::network
