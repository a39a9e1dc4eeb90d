#pragma once

#include "core/config.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "network/transport.hpp"
#include "transfer/file_sink.hpp"
#include "transfer/file_source.hpp"
#include "transfer/session_events.hpp"
#include "transfer/transfer_item.hpp"
#include <QObject>
#include <QStringList>
#include <QTimer>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace dropline::transfer {

namespace transfer_state {

struct Negotiating {
    bool introduction_sent = false;
    bool manifest_received = false;
    bool awaiting_decision = false;
};

struct Transferring {
    Timestamp started;
    bool all_sent = false;
};

struct Completed {};

struct Cancelled {
    Error reason;
};

struct Failed {
    Error error;
};

} // namespace transfer_state

using TransferState = std::variant<
    transfer_state::Negotiating,
    transfer_state::Transferring,
    transfer_state::Completed,
    transfer_state::Cancelled,
    transfer_state::Failed>;

/**
 * TransferSession - File exchange with one authenticated peer.
 *
 *   Negotiating -> Transferring -> Completed | Cancelled | Failed
 *
 * The sender introduces a manifest, the receiver accepts or rejects it,
 * then the sender streams chunks and the receiver reports the result. All
 * work happens on the owning thread's event loop; the session never blocks.
 *
 * Every terminal state is reported exactly once: a StateChanged event, an
 * ErrorEvent unless the session completed, then finished().
 */
class TransferSession : public QObject {
    Q_OBJECT

public:
    /**
     * Cancel reason sent to a peer that already has a live session with us.
     */
    static constexpr const char* CONFLICT_REASON = "session conflict";

    static std::unique_ptr<TransferSession> outgoing(SessionId id,
                                                     network::FrameLink& link,
                                                     TransferConfig config,
                                                     std::string local_name,
                                                     std::vector<OutgoingFile> files,
                                                     QObject* parent = nullptr);

    static std::unique_ptr<TransferSession> incoming(SessionId id,
                                                     network::FrameLink& link,
                                                     TransferConfig config,
                                                     QObject* parent = nullptr);

    ~TransferSession() override;

    /**
     * Begin negotiating. The sender sends its introduction right away.
     */
    void start();

    /**
     * Receiver: consent to the pending manifest. InvalidArgument when no
     * decision is pending.
     */
    Result<void, Error> accept();

    /**
     * Receiver: refuse the pending manifest. Ends in Failed(Rejected).
     */
    Result<void, Error> reject(const std::string& reason = "declined");

    /**
     * Stop the session, tell the peer, keep partial files. No-op once
     * terminal.
     */
    void cancel();

    [[nodiscard]] const SessionId& id() const { return id_; }
    [[nodiscard]] Direction direction() const { return direction_; }
    [[nodiscard]] const TransferState& state() const { return state_; }
    [[nodiscard]] SessionState stateKind() const;
    [[nodiscard]] bool isTerminal() const;
    [[nodiscard]] bool awaitingDecision() const;
    [[nodiscard]] std::optional<Error> error() const;
    [[nodiscard]] const std::vector<TransferItem>& items() const { return items_; }
    [[nodiscard]] const std::string& peerName() const { return peer_name_; }
    [[nodiscard]] uint64_t bytesTransferred() const { return session_bytes_; }
    [[nodiscard]] uint64_t totalBytes() const { return session_total_; }

    /**
     * Final paths of the items received so far.
     */
    [[nodiscard]] const QStringList& receivedFiles() const { return received_files_; }

signals:
    void sessionEvent(const dropline::SessionId& id, const dropline::transfer::SessionEvent& event);
    void transferRequested(const dropline::SessionId& id);
    void finished(const dropline::SessionId& id);

private:
    TransferSession(SessionId id, Direction direction, network::FrameLink& link,
                    TransferConfig config, QObject* parent);

    SessionId id_;
    Direction direction_;
    network::FrameLink& link_;
    TransferConfig config_;
    TransferState state_;

    std::string local_name_;
    std::string peer_name_;
    std::vector<TransferItem> items_;
    std::vector<OutgoingFile> outgoing_files_;
    std::vector<std::unique_ptr<FileSource>> sources_;
    std::vector<std::unique_ptr<FileSink>> sinks_;
    size_t current_source_ = 0;
    size_t finished_items_ = 0;
    std::optional<uint32_t> failing_item_;
    QStringList received_files_;

    uint64_t session_bytes_ = 0;
    uint64_t session_total_ = 0;
    Timestamp last_progress_;

    QTimer negotiation_timer_;
    QTimer keep_alive_timer_;
    QTimer read_timer_;
    QTimer stall_timer_;  // sender blocked on a full send window
    bool pump_scheduled_ = false;

    void attachLink();
    void detachLink();

    void handleFrame(wire::Frame frame);
    void handleIntroduction(const wire::Introduction& introduction);
    void handleResponse(const wire::ManifestResponse& response);
    void handleCancel(const wire::Cancel& cancel);
    void handleResult(const wire::TransferResult& result);
    void handleChunk(const wire::ChunkFrame& chunk);

    void beginTransferring();
    void finishItem(size_t index);
    void schedulePump();
    void pump();

    void onNegotiationTimeout();
    void onReadTimeout();
    void onStallTimeout();
    void sendKeepAlive();

    Result<void, Error> sendControl(wire::ControlMessage message);
    void reportProgress(size_t index, bool force);
    void emitState(SessionState state);

    /**
     * Fail the session. The peer is told unless `notify_peer` is false
     * (e.g. the failure came from the peer or the link).
     */
    void fail(Error error, bool notify_peer = true);
    void complete();
    void enterTerminal(TransferState next, SessionState kind, std::optional<Error> error);
};

} // namespace dropline::transfer
