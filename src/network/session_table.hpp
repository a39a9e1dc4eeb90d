#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include "transfer/session_events.hpp"
#include "transfer/transfer_item.hpp"
#include <QMetaType>
#include <QString>
#include <cstddef>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <vector>

namespace dropline::network {

/**
 * SessionHandle - A snapshot of one session slot, safe to pass across
 * threads.
 */
struct SessionHandle {
    SessionId id;
    DeviceId endpoint;
    QString peer_name;
    transfer::Direction direction = transfer::Direction::Outgoing;
    transfer::SessionState state = transfer::SessionState::Connecting;

    bool operator==(const SessionHandle&) const = default;
};

/**
 * SessionTable - Arena of session slots with an endpoint index.
 *
 * At most one slot per endpoint. Every method is a single critical section,
 * so reserve() both checks for a conflict and claims the endpoint
 * atomically, whichever thread calls it.
 */
class SessionTable {
public:
    SessionTable() = default;

    SessionTable(const SessionTable&) = delete;
    SessionTable& operator=(const SessionTable&) = delete;

    /**
     * Claim `endpoint` for session `id`. SessionConflict when the endpoint
     * already has a slot (that slot is left untouched); InvalidArgument when
     * `id` is already in use.
     */
    [[nodiscard]] Result<SessionHandle, Error> reserve(const SessionId& id,
                                                       const DeviceId& endpoint,
                                                       transfer::Direction direction,
                                                       const QString& peer_name);

    /**
     * Record the session's current state and peer name once known. Returns
     * false when the slot is gone.
     */
    bool attach(const SessionId& id, transfer::SessionState state, const QString& peer_name = {});

    bool update_state(const SessionId& id, transfer::SessionState state);

    /**
     * Move session `id` to the endpoint the peer proved it is. SessionConflict
     * when another slot already holds `endpoint`; both slots stay as they were.
     */
    [[nodiscard]] Result<SessionHandle, Error> rekey(const SessionId& id, const DeviceId& endpoint);

    /**
     * Free the slot and its endpoint. Returns false when it was not held.
     */
    bool release(const SessionId& id);

    [[nodiscard]] std::optional<SessionHandle> find(const SessionId& id) const;
    [[nodiscard]] std::optional<SessionHandle> find_by_endpoint(const DeviceId& endpoint) const;
    [[nodiscard]] std::vector<SessionHandle> list() const;
    [[nodiscard]] size_t size() const;

private:
    mutable std::mutex mutex_;
    std::vector<std::optional<SessionHandle>> slots_;
    std::vector<size_t> free_slots_;
    std::unordered_map<SessionId, size_t> by_id_;
    std::unordered_map<DeviceId, size_t> by_endpoint_;
};

} // namespace dropline::network

Q_DECLARE_METATYPE(dropline::network::SessionHandle)
