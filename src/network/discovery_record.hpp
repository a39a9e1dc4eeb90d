#pragma once

#include "core/result.hpp"
#include "network/discovery.hpp"

#include <QByteArray>
#include <QHostAddress>
#include <string>
#include <vector>

namespace dropline::network {

// Advertisement record helpers shared by the Avahi and UDP backends.
// Kept separate so the record format is testable without sockets.

/**
 * TXT strings ("key=value") for an advertisement, in a fixed order.
 */
[[nodiscard]] std::vector<std::string> encode_txt_record(const AdvertisementInfo& info);

/**
 * Parse TXT strings. Unknown keys are ignored; a missing or invalid
 * v/id/p is Malformed. `n` falls back to an empty name.
 */
[[nodiscard]] Result<AdvertisementInfo, Error> decode_txt_record(
    const std::vector<std::string>& entries);

/**
 * "DLD1" magic followed by the TXT strings in DNS TXT rdata layout
 * (one length byte, then the bytes).
 */
[[nodiscard]] QByteArray encode_discovery_datagram(const AdvertisementInfo& info);

/**
 * Decode a datagram into an Endpoint addressed at `sender`.
 */
[[nodiscard]] Result<Endpoint, Error> decode_discovery_datagram(const QByteArray& datagram,
                                                                const QHostAddress& sender);

[[nodiscard]] Endpoint endpoint_from(const AdvertisementInfo& info, const QHostAddress& host);

} // namespace dropline::network
