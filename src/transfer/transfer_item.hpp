#pragma once

#include "core/types.hpp"
#include <QString>
#include <cstdint>
#include <string>
#include <vector>

namespace dropline::transfer {

enum class Direction {
    Outgoing,
    Incoming
};

/**
 * TransferItem - One file within a session.
 *
 * bytes_transferred never exceeds size; it reaches size only when the item
 * was fully sent (sender) or fully written and verified (receiver).
 */
struct TransferItem {
    uint32_t index = 0;
    std::string name;
    uint64_t size = 0;
    std::vector<uint8_t> content_hash;  // empty when not declared
    std::string mime_type;
    uint64_t bytes_transferred = 0;

    [[nodiscard]] uint64_t remaining() const { return size - bytes_transferred; }
    [[nodiscard]] bool is_complete() const { return bytes_transferred == size; }
};

/**
 * A local file queued for sending together with its manifest entry.
 */
struct OutgoingFile {
    QString path;
    TransferItem item;
};

[[nodiscard]] inline const char* to_string(Direction direction) {
    return direction == Direction::Outgoing ? "outgoing" : "incoming";
}

} // namespace dropline::transfer
