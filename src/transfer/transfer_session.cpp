#include "transfer/transfer_session.hpp"
#include "transfer/manifest.hpp"
#include "core/logging.hpp"

#include <algorithm>

namespace dropline::transfer {

namespace {

template<class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template<class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

// Chunks sent per event loop turn before yielding to incoming frames.
constexpr int CHUNKS_PER_TURN = 16;

QString sid(const SessionId& id) {
    return QString::fromStdString(id.short_string());
}

} // namespace

std::unique_ptr<TransferSession> TransferSession::outgoing(SessionId id,
                                                           network::FrameLink& link,
                                                           TransferConfig config,
                                                           std::string local_name,
                                                           std::vector<OutgoingFile> files,
                                                           QObject* parent) {
    std::unique_ptr<TransferSession> session(
        new TransferSession(id, Direction::Outgoing, link, std::move(config), parent));
    session->local_name_ = std::move(local_name);
    for (const auto& file : files) {
        session->items_.push_back(file.item);
        session->items_.back().bytes_transferred = 0;
    }
    session->session_total_ = total_size(session->items_);
    session->outgoing_files_ = std::move(files);
    return session;
}

std::unique_ptr<TransferSession> TransferSession::incoming(SessionId id,
                                                           network::FrameLink& link,
                                                           TransferConfig config,
                                                           QObject* parent) {
    return std::unique_ptr<TransferSession>(
        new TransferSession(id, Direction::Incoming, link, std::move(config), parent));
}

TransferSession::TransferSession(SessionId id, Direction direction, network::FrameLink& link,
                                 TransferConfig config, QObject* parent)
    : QObject(parent)
    , id_(id)
    , direction_(direction)
    , link_(link)
    , config_(std::move(config))
{
    qRegisterMetaType<dropline::transfer::SessionEvent>();

    negotiation_timer_.setSingleShot(true);
    negotiation_timer_.setInterval(static_cast<int>(config_.negotiation_timeout.count()));
    connect(&negotiation_timer_, &QTimer::timeout, this, &TransferSession::onNegotiationTimeout);

    keep_alive_timer_.setInterval(static_cast<int>(config_.keep_alive_interval.count()));
    connect(&keep_alive_timer_, &QTimer::timeout, this, &TransferSession::sendKeepAlive);

    read_timer_.setSingleShot(true);
    read_timer_.setInterval(static_cast<int>(config_.chunk_timeout.count()));
    connect(&read_timer_, &QTimer::timeout, this, &TransferSession::onReadTimeout);

    stall_timer_.setSingleShot(true);
    stall_timer_.setInterval(static_cast<int>(config_.chunk_timeout.count()));
    connect(&stall_timer_, &QTimer::timeout, this, &TransferSession::onStallTimeout);
}

TransferSession::~TransferSession() {
    if (!isTerminal()) {
        detachLink();
    }
}

void TransferSession::attachLink() {
    link_.on_frame = [this](wire::Frame frame) { handleFrame(std::move(frame)); };
    link_.on_error = [this](Error error) { fail(std::move(error), false); };
    link_.on_closed = [this]() {
        fail(Error{ErrorKind::IOFailure, "connection lost"}, false);
    };
    link_.on_drained = [this]() {
        if (direction_ != Direction::Outgoing) return;
        if (link_.pending_bytes() < config_.send_window) {
            stall_timer_.stop();
            schedulePump();
        } else if (stall_timer_.isActive()) {
            stall_timer_.start();  // the peer is still reading
        }
    };
}

void TransferSession::detachLink() {
    link_.on_frame = nullptr;
    link_.on_error = nullptr;
    link_.on_closed = nullptr;
    link_.on_drained = nullptr;
}

SessionState TransferSession::stateKind() const {
    return std::visit(overloaded{
        [](const transfer_state::Negotiating&) { return SessionState::Negotiating; },
        [](const transfer_state::Transferring&) { return SessionState::Transferring; },
        [](const transfer_state::Completed&) { return SessionState::Completed; },
        [](const transfer_state::Cancelled&) { return SessionState::Cancelled; },
        [](const transfer_state::Failed&) { return SessionState::Failed; },
    }, state_);
}

bool TransferSession::isTerminal() const {
    return is_terminal(stateKind());
}

bool TransferSession::awaitingDecision() const {
    const auto* st = std::get_if<transfer_state::Negotiating>(&state_);
    return st && st->awaiting_decision;
}

std::optional<Error> TransferSession::error() const {
    if (const auto* st = std::get_if<transfer_state::Failed>(&state_)) return st->error;
    if (const auto* st = std::get_if<transfer_state::Cancelled>(&state_)) return st->reason;
    return std::nullopt;
}

// ============================================================================
// Lifecycle
// ============================================================================

void TransferSession::start() {
    attachLink();
    emitState(SessionState::Negotiating);

    negotiation_timer_.start();
    keep_alive_timer_.start();
    read_timer_.start();

    if (direction_ == Direction::Incoming) {
        qCDebug(droplineTransferLog) << sid(id_) << "waiting for introduction";
        return;
    }

    for (const auto& file : outgoing_files_) {
        auto source = std::make_unique<FileSource>(file);
        auto opened = source->open();
        if (opened.is_err()) {
            fail(opened.unwrap_err());
            return;
        }
        sources_.push_back(std::move(source));
    }

    auto sent = sendControl(make_introduction(local_name_, outgoing_files_));
    if (sent.is_err()) {
        fail(sent.unwrap_err(), false);
        return;
    }
    std::get<transfer_state::Negotiating>(state_).introduction_sent = true;
    qCInfo(droplineTransferLog) << sid(id_) << "offered" << items_.size() << "file(s),"
                                << session_total_ << "bytes";
}

Result<void, Error> TransferSession::accept() {
    if (!awaitingDecision()) {
        return Result<void, Error>::err(Error{ErrorKind::InvalidArgument, "no transfer awaiting a decision"});
    }

    for (const auto& item : items_) {
        auto sink = std::make_unique<FileSink>(config_.download_dir, item);
        auto opened = sink->open();
        if (opened.is_err()) {
            wire::ManifestResponse refusal{wire::ManifestResponse::Status::Reject,
                                           "receiver cannot store files"};
            auto sent = sendControl(refusal);
            if (sent.is_err()) {
                qCDebug(droplineTransferLog) << sid(id_) << "refusal not delivered";
            }
            fail(opened.unwrap_err(), false);
            return Result<void, Error>::ok();
        }
        sinks_.push_back(std::move(sink));
    }

    auto sent = sendControl(wire::ManifestResponse{wire::ManifestResponse::Status::Accept, {}});
    if (sent.is_err()) {
        fail(sent.unwrap_err(), false);
        return Result<void, Error>::ok();
    }

    qCInfo(droplineTransferLog) << sid(id_) << "accepted" << items_.size() << "file(s) from"
                                << QString::fromStdString(peer_name_);
    beginTransferring();

    // Empty files have no chunks; finish them now.
    for (size_t i = 0; i < items_.size() && !isTerminal(); ++i) {
        if (items_[i].size == 0) {
            finishItem(i);
        }
    }
    return Result<void, Error>::ok();
}

Result<void, Error> TransferSession::reject(const std::string& reason) {
    if (!awaitingDecision()) {
        return Result<void, Error>::err(Error{ErrorKind::InvalidArgument, "no transfer awaiting a decision"});
    }
    auto sent = sendControl(wire::ManifestResponse{wire::ManifestResponse::Status::Reject, reason});
    if (sent.is_err()) {
        qCDebug(droplineTransferLog) << sid(id_) << "rejection not delivered";
    }
    enterTerminal(transfer_state::Failed{Error{ErrorKind::Rejected, "rejected locally: " + reason}},
                  SessionState::Failed,
                  Error{ErrorKind::Rejected, "rejected locally: " + reason});
    return Result<void, Error>::ok();
}

void TransferSession::cancel() {
    if (isTerminal()) return;

    auto sent = sendControl(wire::Cancel{"cancelled by user"});
    if (sent.is_err()) {
        qCDebug(droplineTransferLog) << sid(id_) << "cancel not delivered";
    }
    Error reason{ErrorKind::Cancelled, "cancelled locally"};
    enterTerminal(transfer_state::Cancelled{reason}, SessionState::Cancelled, reason);
}

void TransferSession::beginTransferring() {
    negotiation_timer_.stop();
    keep_alive_timer_.stop();
    state_ = transfer_state::Transferring{Timestamp::now(), false};
    last_progress_ = Timestamp::now();
    emitState(SessionState::Transferring);

    if (direction_ == Direction::Incoming) {
        read_timer_.start();
    } else {
        read_timer_.stop();
        schedulePump();
    }
}

// ============================================================================
// Incoming frames
// ============================================================================

void TransferSession::handleFrame(wire::Frame frame) {
    if (isTerminal()) return;

    // Any frame proves the peer is alive.
    const bool sender_streaming = direction_ == Direction::Outgoing &&
        std::holds_alternative<transfer_state::Transferring>(state_) &&
        !std::get<transfer_state::Transferring>(state_).all_sent;
    if (!sender_streaming) {
        read_timer_.start();
    }

    std::visit(overloaded{
        [this](const wire::ControlFrame& control) {
            std::visit(overloaded{
                [this](const wire::Introduction& m) { handleIntroduction(m); },
                [this](const wire::ManifestResponse& m) { handleResponse(m); },
                [this](const wire::Cancel& m) { handleCancel(m); },
                [this](const wire::TransferResult& m) { handleResult(m); },
                [](const wire::KeepAlive&) {},
            }, control.message);
        },
        [this](const wire::ChunkFrame& chunk) { handleChunk(chunk); },
        [this](const auto& other) {
            fail(Error{ErrorKind::Malformed,
                       std::string("unexpected ") + wire::frame_name(wire::Frame{other})});
        },
    }, frame);
}

void TransferSession::handleIntroduction(const wire::Introduction& introduction) {
    auto* st = std::get_if<transfer_state::Negotiating>(&state_);
    if (direction_ != Direction::Incoming || !st || st->manifest_received) {
        fail(Error{ErrorKind::Malformed, "unexpected introduction"});
        return;
    }
    st->manifest_received = true;
    peer_name_ = introduction.sender_name;

    auto items = validate_manifest(introduction, config_);
    if (items.is_err()) {
        auto error = items.unwrap_err();
        auto sent = sendControl(wire::ManifestResponse{wire::ManifestResponse::Status::Reject, error.message});
        if (sent.is_err()) {
            qCDebug(droplineTransferLog) << sid(id_) << "rejection not delivered";
        }
        fail(error, false);
        return;
    }

    items_ = items.unwrap();
    session_total_ = total_size(items_);
    st->awaiting_decision = true;
    qCInfo(droplineTransferLog) << sid(id_) << QString::fromStdString(peer_name_) << "offers"
                                << items_.size() << "file(s)," << session_total_ << "bytes";

    if (config_.auto_accept) {
        auto accepted = accept();
        if (accepted.is_err()) {
            fail(accepted.unwrap_err());
        }
        return;
    }
    emit transferRequested(id_);
}

void TransferSession::handleResponse(const wire::ManifestResponse& response) {
    auto* st = std::get_if<transfer_state::Negotiating>(&state_);
    if (direction_ != Direction::Outgoing || !st || !st->introduction_sent) {
        fail(Error{ErrorKind::Malformed, "unexpected manifest response"});
        return;
    }

    if (response.status == wire::ManifestResponse::Status::Reject) {
        Error error{ErrorKind::Rejected,
                    "rejected by peer" + (response.reason.empty() ? std::string{} : ": " + response.reason)};
        enterTerminal(transfer_state::Failed{error}, SessionState::Failed, error);
        return;
    }

    qCInfo(droplineTransferLog) << sid(id_) << "peer accepted, sending";
    beginTransferring();
}

void TransferSession::handleCancel(const wire::Cancel& cancel) {
    if (cancel.reason == CONFLICT_REASON) {
        fail(Error{ErrorKind::SessionConflict, "peer already has a session with this device"}, false);
        return;
    }
    Error reason{ErrorKind::Cancelled,
                 "cancelled by peer" + (cancel.reason.empty() ? std::string{} : ": " + cancel.reason)};
    enterTerminal(transfer_state::Cancelled{reason}, SessionState::Cancelled, reason);
}

void TransferSession::handleResult(const wire::TransferResult& result) {
    auto* st = std::get_if<transfer_state::Transferring>(&state_);
    if (direction_ != Direction::Outgoing || !st) {
        fail(Error{ErrorKind::Malformed, "unexpected transfer result"});
        return;
    }

    switch (result.status) {
        case wire::TransferResult::Status::Completed:
            // Empty items are never pumped, and the result can arrive in the
            // same read as the acceptance; judge by what was actually sent.
            if (!std::all_of(items_.begin(), items_.end(),
                             [](const TransferItem& item) { return item.is_complete(); })) {
                fail(Error{ErrorKind::Malformed, "completion reported before all data was sent"});
                return;
            }
            complete();
            return;
        case wire::TransferResult::Status::IntegrityFailure:
            fail(Error{ErrorKind::IntegrityFailure,
                       "peer reports hash mismatch on item " + std::to_string(result.item_index)},
                 false);
            return;
        case wire::TransferResult::Status::Failed:
            fail(Error{ErrorKind::IOFailure, "peer failed: " + result.detail}, false);
            return;
    }
}

void TransferSession::handleChunk(const wire::ChunkFrame& chunk) {
    if (direction_ != Direction::Incoming ||
        !std::holds_alternative<transfer_state::Transferring>(state_)) {
        fail(Error{ErrorKind::Malformed, "chunk outside of transfer"});
        return;
    }
    if (chunk.item_index >= sinks_.size()) {
        fail(Error{ErrorKind::Malformed, "chunk for unknown item " + std::to_string(chunk.item_index)});
        return;
    }
    if (chunk.payload.empty() || chunk.payload.size() > config_.max_chunk_payload) {
        fail(Error{ErrorKind::Malformed, "chunk payload size " + std::to_string(chunk.payload.size())});
        return;
    }

    const size_t index = chunk.item_index;
    auto& sink = *sinks_[index];
    auto written = sink.write(chunk.offset, chunk.payload);
    if (written.is_err()) {
        failing_item_ = chunk.item_index;
        fail(written.unwrap_err());
        return;
    }

    items_[index].bytes_transferred = sink.written();
    session_bytes_ += chunk.payload.size();

    if (sink.is_complete()) {
        finishItem(index);
    } else {
        reportProgress(index, false);
    }
}

void TransferSession::finishItem(size_t index) {
    auto& sink = *sinks_[index];
    auto finished = sink.finish();
    if (finished.is_err()) {
        failing_item_ = items_[index].index;
        fail(finished.unwrap_err());
        return;
    }
    received_files_.append(finished.unwrap());
    ++finished_items_;
    reportProgress(index, true);

    if (finished_items_ == sinks_.size()) {
        auto sent = sendControl(wire::TransferResult{wire::TransferResult::Status::Completed,
                                                     static_cast<uint32_t>(index), {}});
        if (sent.is_err()) {
            qCWarning(droplineTransferLog) << sid(id_) << "completion not delivered";
        }
        complete();
    }
}

// ============================================================================
// Sending
// ============================================================================

void TransferSession::schedulePump() {
    if (pump_scheduled_) return;
    pump_scheduled_ = true;
    QMetaObject::invokeMethod(this, &TransferSession::pump, Qt::QueuedConnection);
}

void TransferSession::pump() {
    pump_scheduled_ = false;

    for (int sent = 0; sent < CHUNKS_PER_TURN; ++sent) {
        // Cancellation point: the state is re-checked before every chunk.
        auto* st = std::get_if<transfer_state::Transferring>(&state_);
        if (!st || direction_ != Direction::Outgoing || st->all_sent) return;

        if (link_.pending_bytes() >= config_.send_window) {
            if (!stall_timer_.isActive()) {
                stall_timer_.start();
            }
            return;  // resumed by on_drained
        }

        while (current_source_ < sources_.size() && sources_[current_source_]->is_done()) {
            if (items_[current_source_].size == 0) {
                reportProgress(current_source_, true);
            }
            sources_[current_source_]->close();
            ++current_source_;
        }

        if (current_source_ == sources_.size()) {
            st->all_sent = true;
            read_timer_.start();
            qCDebug(droplineTransferLog) << sid(id_) << "all data sent, awaiting result";
            return;
        }

        auto& source = *sources_[current_source_];
        auto chunk = source.next_chunk(config_.max_chunk_payload);
        if (chunk.is_err()) {
            fail(chunk.unwrap_err());
            return;
        }

        const size_t bytes = chunk.unwrap().payload.size();
        auto result = link_.send(wire::Frame{chunk.unwrap()});
        if (result.is_err()) {
            fail(result.unwrap_err(), false);
            return;
        }

        items_[current_source_].bytes_transferred = source.offset();
        session_bytes_ += bytes;
        reportProgress(current_source_, source.is_done());
    }

    schedulePump();
}

// ============================================================================
// Timers
// ============================================================================

void TransferSession::onNegotiationTimeout() {
    if (!std::holds_alternative<transfer_state::Negotiating>(state_)) return;

    auto sent = sendControl(wire::Cancel{"negotiation timed out"});
    if (sent.is_err()) {
        qCDebug(droplineTransferLog) << sid(id_) << "cancel not delivered";
    }
    Error reason{ErrorKind::Timeout, "no decision within the negotiation timeout"};
    enterTerminal(transfer_state::Cancelled{reason}, SessionState::Cancelled, reason);
}

void TransferSession::onReadTimeout() {
    if (isTerminal()) return;
    fail(Error{ErrorKind::Timeout, "peer sent nothing within the read timeout"});
}

void TransferSession::onStallTimeout() {
    if (isTerminal()) return;
    fail(Error{ErrorKind::Timeout, "peer stopped reading within the read timeout"});
}

void TransferSession::sendKeepAlive() {
    if (!std::holds_alternative<transfer_state::Negotiating>(state_)) return;
    auto sent = sendControl(wire::KeepAlive{false});
    if (sent.is_err()) {
        fail(sent.unwrap_err(), false);
    }
}

// ============================================================================
// Helpers
// ============================================================================

Result<void, Error> TransferSession::sendControl(wire::ControlMessage message) {
    return link_.send(wire::Frame{wire::ControlFrame{std::move(message)}});
}

void TransferSession::reportProgress(size_t index, bool force) {
    const auto now = Timestamp::now();
    if (!force && now - last_progress_ < config_.progress_interval) {
        return;
    }
    last_progress_ = now;

    ProgressUpdate update;
    update.item_index = items_[index].index;
    update.item_bytes = items_[index].bytes_transferred;
    update.item_total = items_[index].size;
    update.session_bytes = session_bytes_;
    update.session_total = session_total_;
    if (const auto* st = std::get_if<transfer_state::Transferring>(&state_)) {
        const auto elapsed = now - st->started;
        if (elapsed.count() > 0) {
            update.bytes_per_second = static_cast<double>(session_bytes_) * 1000.0 /
                                      static_cast<double>(elapsed.count());
        }
    }
    emit sessionEvent(id_, SessionEvent{update});
}

void TransferSession::emitState(SessionState state) {
    qCDebug(droplineTransferLog) << sid(id_) << "->" << to_string(state);
    emit sessionEvent(id_, SessionEvent{StateChanged{state}});
}

void TransferSession::fail(Error error, bool notify_peer) {
    if (isTerminal()) return;

    if (notify_peer) {
        Result<void, Error> sent = Result<void, Error>::ok();
        if (direction_ == Direction::Incoming &&
            std::holds_alternative<transfer_state::Transferring>(state_)) {
            const auto status = error.kind == ErrorKind::IntegrityFailure
                ? wire::TransferResult::Status::IntegrityFailure
                : wire::TransferResult::Status::Failed;
            const uint32_t item = failing_item_.value_or(0);
            sent = sendControl(wire::TransferResult{status, item, error.message});
        } else {
            sent = sendControl(wire::Cancel{error.describe()});
        }
        if (sent.is_err()) {
            qCDebug(droplineTransferLog) << sid(id_) << "failure not delivered to peer";
        }
    }

    qCWarning(droplineTransferLog) << sid(id_) << "failed:" << QString::fromStdString(error.describe());
    enterTerminal(transfer_state::Failed{error}, SessionState::Failed, error);
}

void TransferSession::complete() {
    qCInfo(droplineTransferLog) << sid(id_) << "completed," << session_bytes_ << "bytes";
    enterTerminal(transfer_state::Completed{}, SessionState::Completed, std::nullopt);
}

void TransferSession::enterTerminal(TransferState next, SessionState kind, std::optional<Error> error) {
    if (isTerminal()) return;

    negotiation_timer_.stop();
    keep_alive_timer_.stop();
    read_timer_.stop();
    stall_timer_.stop();

    state_ = std::move(next);

    for (auto& sink : sinks_) {
        sink->abandon();
    }
    for (auto& source : sources_) {
        source->close();
    }

    detachLink();
    link_.close();

    emitState(kind);
    if (error) {
        emit sessionEvent(id_, SessionEvent{ErrorEvent{error->kind, error->message}});
    }
    emit finished(id_);
}

} // namespace dropline::transfer
