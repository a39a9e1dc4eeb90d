#pragma once

#include "core/result.hpp"
#include <QMetaType>
#include <cstdint>
#include <string>
#include <variant>

namespace dropline::transfer {

/**
 * Externally visible session states. Connecting and Handshaking are owned
 * by the session manager; the rest by TransferSession.
 */
enum class SessionState {
    Connecting,
    Handshaking,
    Negotiating,
    Transferring,
    Completed,
    Cancelled,
    Failed
};

[[nodiscard]] inline bool is_terminal(SessionState state) {
    return state == SessionState::Completed || state == SessionState::Cancelled ||
           state == SessionState::Failed;
}

[[nodiscard]] inline const char* to_string(SessionState state) {
    switch (state) {
        case SessionState::Connecting: return "connecting";
        case SessionState::Handshaking: return "handshaking";
        case SessionState::Negotiating: return "negotiating";
        case SessionState::Transferring: return "transferring";
        case SessionState::Completed: return "completed";
        case SessionState::Cancelled: return "cancelled";
        case SessionState::Failed: return "failed";
    }
    return "unknown";
}

struct ProgressUpdate {
    uint32_t item_index = 0;
    uint64_t item_bytes = 0;
    uint64_t item_total = 0;
    uint64_t session_bytes = 0;
    uint64_t session_total = 0;
    double bytes_per_second = 0.0;

    bool operator==(const ProgressUpdate&) const = default;
};

struct StateChanged {
    SessionState state = SessionState::Negotiating;

    bool operator==(const StateChanged&) const = default;
};

struct ErrorEvent {
    ErrorKind kind = ErrorKind::Other;
    std::string message;

    bool operator==(const ErrorEvent&) const = default;
};

using SessionEvent = std::variant<ProgressUpdate, StateChanged, ErrorEvent>;

} // namespace dropline::transfer

Q_DECLARE_METATYPE(dropline::transfer::SessionEvent)
