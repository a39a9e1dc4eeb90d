#include "network/session_table.hpp"

namespace dropline::network {

Result<SessionHandle, Error> SessionTable::reserve(const SessionId& id,
                                                   const DeviceId& endpoint,
                                                   transfer::Direction direction,
                                                   const QString& peer_name) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (by_endpoint_.count(endpoint) > 0) {
        return Result<SessionHandle, Error>::err(Error{
            ErrorKind::SessionConflict,
            "a session with " + endpoint.short_string() + " is already active"});
    }
    if (by_id_.count(id) > 0) {
        return Result<SessionHandle, Error>::err(
            Error{ErrorKind::InvalidArgument, "session id " + id.short_string() + " in use"});
    }

    SessionHandle handle{id, endpoint, peer_name, direction, transfer::SessionState::Connecting};

    size_t slot;
    if (!free_slots_.empty()) {
        slot = free_slots_.back();
        free_slots_.pop_back();
        slots_[slot] = handle;
    } else {
        slot = slots_.size();
        slots_.emplace_back(handle);
    }

    by_id_.emplace(id, slot);
    by_endpoint_.emplace(endpoint, slot);
    return Result<SessionHandle, Error>::ok(std::move(handle));
}

bool SessionTable::attach(const SessionId& id, transfer::SessionState state, const QString& peer_name) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = by_id_.find(id);
    if (it == by_id_.end()) return false;
    auto& handle = *slots_[it->second];
    handle.state = state;
    if (!peer_name.isEmpty()) {
        handle.peer_name = peer_name;
    }
    return true;
}

bool SessionTable::update_state(const SessionId& id, transfer::SessionState state) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = by_id_.find(id);
    if (it == by_id_.end()) return false;
    slots_[it->second]->state = state;
    return true;
}

Result<SessionHandle, Error> SessionTable::rekey(const SessionId& id, const DeviceId& endpoint) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = by_id_.find(id);
    if (it == by_id_.end()) {
        return Result<SessionHandle, Error>::err(
            Error{ErrorKind::InvalidArgument, "no session " + id.short_string()});
    }
    auto& handle = *slots_[it->second];
    if (handle.endpoint == endpoint) {
        return Result<SessionHandle, Error>::ok(handle);
    }
    if (by_endpoint_.count(endpoint) > 0) {
        return Result<SessionHandle, Error>::err(Error{
            ErrorKind::SessionConflict,
            "a session with " + endpoint.short_string() + " is already active"});
    }

    by_endpoint_.erase(handle.endpoint);
    handle.endpoint = endpoint;
    by_endpoint_.emplace(endpoint, it->second);
    return Result<SessionHandle, Error>::ok(handle);
}

bool SessionTable::release(const SessionId& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = by_id_.find(id);
    if (it == by_id_.end()) return false;

    const size_t slot = it->second;
    by_endpoint_.erase(slots_[slot]->endpoint);
    by_id_.erase(it);
    slots_[slot].reset();
    free_slots_.push_back(slot);
    return true;
}

std::optional<SessionHandle> SessionTable::find(const SessionId& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = by_id_.find(id);
    if (it == by_id_.end()) return std::nullopt;
    return slots_[it->second];
}

std::optional<SessionHandle> SessionTable::find_by_endpoint(const DeviceId& endpoint) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = by_endpoint_.find(endpoint);
    if (it == by_endpoint_.end()) return std::nullopt;
    return slots_[it->second];
}

std::vector<SessionHandle> SessionTable::list() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<SessionHandle> out;
    out.reserve(by_id_.size());
    for (const auto& slot : slots_) {
        if (slot) out.push_back(*slot);
    }
    return out;
}

size_t SessionTable::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return by_id_.size();
}

} // namespace dropline::network
