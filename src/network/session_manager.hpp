#pragma once

#include "core/config.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "crypto/keys.hpp"
#include "network/discovery.hpp"
#include "network/pairing.hpp"
#include "network/session_table.hpp"
#include "network/transport.hpp"
#include "transfer/session_events.hpp"
#include "transfer/transfer_item.hpp"
#include <QObject>
#include <QStringList>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <vector>

namespace dropline::transfer {
class TransferSession;
}

namespace dropline::network {

/**
 * SessionManager - Owns every session of this device.
 *
 * Responsibilities:
 * - Listening for incoming connections and handshaking them as responder
 * - Outgoing connections to discovered or manually entered endpoints
 * - At most one live session per endpoint (SessionTable)
 * - Advertising and browsing through DiscoveryService
 * - Forwarding every session's events through sessionEvent()
 *
 * The connect*, cancel and consent calls may come from any thread; the
 * objects they create or touch live on the manager's thread.
 */
class SessionManager : public QObject {
    Q_OBJECT

    Q_PROPERTY(bool running READ isRunning NOTIFY runningChanged)
    Q_PROPERTY(int activeSessionCount READ activeSessionCount NOTIFY sessionsChanged)

public:
    explicit SessionManager(EngineConfig config, QObject* parent = nullptr);
    ~SessionManager() override;

    /**
     * Listen on `port` (the configured port when omitted, an ephemeral one
     * if that is taken) and start discovery unless disabled. Returns the
     * port. A discovery failure is reported as DiscoveryFailed after the
     * listener is already up.
     */
    Result<uint16_t, Error> start(std::optional<uint16_t> port = std::nullopt);

    /**
     * Cancel every session, stop listening and stop discovery.
     */
    void stop();

    /**
     * Send `files` to a discovered endpoint. SessionConflict when a session
     * with that endpoint is live; file problems are reported before any
     * connection is made.
     */
    Result<SessionHandle, Error> connectToEndpoint(const Endpoint& endpoint, const QStringList& files);

    /**
     * Send to an explicit address. A nil `endpoint_id` is keyed by the
     * address for conflict detection.
     */
    Result<SessionHandle, Error> connectToAddress(const DeviceId& endpoint_id,
                                                  const QHostAddress& host,
                                                  uint16_t port,
                                                  const QStringList& files);

    /**
     * Send to the device behind a scanned invite, with shared-secret trust.
     */
    Result<SessionHandle, Error> connectToInvite(const PairingInvite& invite, const QStringList& files);

    /**
     * Next incoming session that completed its handshake, if any.
     */
    std::optional<SessionHandle> acceptIncoming();

    Result<void, Error> cancel(const SessionId& id);

    [[nodiscard]] std::vector<SessionHandle> listActive() const;

    /**
     * Consent to (or refuse) the manifest of an incoming session.
     */
    Result<void, Error> acceptTransfer(const SessionId& id);
    Result<void, Error> rejectTransfer(const SessionId& id, const QString& reason = {});

    /**
     * PinConfirmation trust: the user's verdict on the displayed code.
     */
    Result<void, Error> confirmPin(const SessionId& id, bool accepted);

    /**
     * Create an invite for `address` and require its secret from incoming
     * peers from now on.
     */
    PairingInvite createInvite(const QHostAddress& address);

    /**
     * Items of a session (manager thread only).
     */
    [[nodiscard]] std::vector<transfer::TransferItem> sessionItems(const SessionId& id) const;

    [[nodiscard]] bool isRunning() const { return running_; }
    [[nodiscard]] uint16_t listeningPort() const;
    [[nodiscard]] int activeSessionCount() const { return static_cast<int>(table_.size()); }
    [[nodiscard]] DiscoveryService* discovery() const { return discovery_.get(); }
    [[nodiscard]] const EngineConfig& config() const { return config_; }

signals:
    void sessionEvent(const dropline::SessionId& id, const dropline::transfer::SessionEvent& event);
    void incomingSession(const dropline::network::SessionHandle& handle);
    void transferRequested(const dropline::SessionId& id,
                           const QString& peer_name,
                           const QStringList& file_names,
                           quint64 total_bytes);
    void authCodeRequired(const dropline::SessionId& id, const QString& code);
    void runningChanged();
    void sessionsChanged();

private slots:
    void onNewConnection(QTcpSocket* socket);

private:
    struct LiveSession {
        SessionId id;
        transfer::Direction direction = transfer::Direction::Outgoing;
        Connection* connection = nullptr;  // child of the manager
        std::unique_ptr<transfer::TransferSession> transfer;
        std::vector<transfer::OutgoingFile> files;
        bool reserved = false;
        bool announced = false;
        bool address_keyed = false;  // outgoing, peer id unknown until the handshake
    };

    EngineConfig config_;
    std::unique_ptr<TransportServer> server_;
    std::unique_ptr<DiscoveryService> discovery_;
    SessionTable table_;

    // Manager thread only.
    std::unordered_map<SessionId, std::unique_ptr<LiveSession>> live_;

    mutable std::mutex incoming_mutex_;
    std::deque<SessionId> incoming_queue_;

    std::optional<crypto::SharedSecret> shared_secret_;
    bool running_ = false;

    Result<SessionHandle, Error> beginOutgoing(const DeviceId& endpoint_id,
                                              const QString& peer_name,
                                              const QHostAddress& host,
                                              uint16_t port,
                                              const QStringList& files,
                                              std::optional<crypto::SharedSecret> secret,
                                              bool address_keyed = false);
    void startOutgoing(const SessionId& id,
                       QHostAddress host,
                       uint16_t port,
                       std::vector<transfer::OutgoingFile> files,
                       std::optional<crypto::SharedSecret> secret,
                       bool address_keyed);
    void cancelReserved(const SessionId& id);
    void wireConnection(LiveSession& live);
    void onEstablished(const SessionId& id);
    void onConnectionFailed(const SessionId& id, const Error& error);
    void attachTransfer(LiveSession& live, std::unique_ptr<transfer::TransferSession> session);
    void onTransferFinished(const SessionId& id);
    void endBeforeTransfer(const SessionId& id, transfer::SessionState state, const Error& error);
    void forget(const SessionId& id);

    [[nodiscard]] crypto::HandshakeOptions handshakeOptions(
        const std::optional<crypto::SharedSecret>& secret) const;
    [[nodiscard]] AdvertisementInfo advertisement(uint16_t port) const;
    void emitState(const SessionId& id, transfer::SessionState state);

    /**
     * Run `task` on the manager's thread: directly when already there,
     * otherwise queued.
     */
    void runOnManagerThread(std::function<void()> task);
    [[nodiscard]] bool onManagerThread() const;
};

/**
 * Stable key for an endpoint known only by address.
 */
[[nodiscard]] DeviceId address_key(const QHostAddress& host, uint16_t port);

} // namespace dropline::network
