#pragma once

#include <QString>
#include <vector>

#include "network/discovery.hpp"
#include "transfer/session_events.hpp"

namespace dropline::cli {

/**
 * "512 B", "1.5 KiB", "10.0 MiB", ...
 */
[[nodiscard]] QString format_bytes(quint64 bytes);

/**
 * One progress line: "  42% 4.2 MiB/10.0 MiB  3.1 MiB/s".
 */
[[nodiscard]] QString format_progress(const transfer::ProgressUpdate& update);

/**
 * Table of endpoints sorted by name, one per line, with a header.
 * Returns "No devices found.\n" for an empty list.
 */
[[nodiscard]] QString format_endpoint_table(const std::vector<network::Endpoint>& endpoints);

/**
 * Endpoints in the order the table and the choice list show them.
 */
[[nodiscard]] std::vector<network::Endpoint> sorted_by_name(std::vector<network::Endpoint> endpoints);

/**
 * Numbered list for picking a receiver: "  1) laptop (10.0.0.3:54321)".
 * Numbers follow sorted_by_name().
 */
[[nodiscard]] QString format_endpoint_choices(const std::vector<network::Endpoint>& endpoints);

} // namespace dropline::cli
