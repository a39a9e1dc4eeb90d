#include "network/session_manager.hpp"
#include "transfer/manifest.hpp"
#include "transfer/transfer_session.hpp"
#include "core/logging.hpp"

#include <QThread>

namespace dropline::network {

namespace {

QString sid(const SessionId& id) {
    return QString::fromStdString(id.short_string());
}

} // namespace

DeviceId address_key(const QHostAddress& host, uint16_t port) {
    const std::string text = host.toString().toStdString() + ":" + std::to_string(port);
    const auto digest = crypto::hash(
        std::span<const uint8_t>(reinterpret_cast<const uint8_t*>(text.data()), text.size()),
        Uuid::BYTE_SIZE);
    return *Uuid::from_bytes(digest);
}

SessionManager::SessionManager(EngineConfig config, QObject* parent)
    : QObject(parent)
    , config_(std::move(config))
    , server_(std::make_unique<TransportServer>())
{
    qRegisterMetaType<dropline::network::SessionHandle>();
    qRegisterMetaType<dropline::transfer::SessionEvent>();

    connect(server_.get(), &TransportServer::newConnection,
            this, &SessionManager::onNewConnection);

    if (config_.discovery.enabled) {
        discovery_ = std::make_unique<DiscoveryService>(config_.discovery);
    }
}

SessionManager::~SessionManager() {
    stop();
}

// ============================================================================
// Lifecycle
// ============================================================================

Result<uint16_t, Error> SessionManager::start(std::optional<uint16_t> port) {
    if (running_) {
        return Result<uint16_t, Error>::ok(server_->port());
    }

    const uint16_t wanted = port.value_or(config_.network.port);
    auto listen_result = server_->listen(wanted);
    if (listen_result.is_err() && wanted != 0) {
        qCWarning(droplineSessionLog) << "port" << wanted << "unavailable:"
                                      << QString::fromStdString(listen_result.unwrap_err().message)
                                      << "- using an ephemeral port";
        listen_result = server_->listen(0);
    }
    if (listen_result.is_err()) {
        return listen_result;
    }

    const uint16_t actual_port = listen_result.unwrap();
    running_ = true;
    qCInfo(droplineSessionLog) << "listening on port" << actual_port << "as"
                               << config_.device.name;
    emit runningChanged();

    if (discovery_) {
        auto advertised = discovery_->startAdvertising(advertisement(actual_port));
        if (advertised.is_err()) {
            return Result<uint16_t, Error>::err(advertised.unwrap_err());
        }
        auto browsing = discovery_->startBrowsing();
        if (browsing.is_err()) {
            return Result<uint16_t, Error>::err(browsing.unwrap_err());
        }
    }

    return Result<uint16_t, Error>::ok(actual_port);
}

void SessionManager::stop() {
    std::vector<SessionId> ids;
    ids.reserve(live_.size());
    for (const auto& [id, live] : live_) {
        ids.push_back(id);
    }
    for (const auto& id : ids) {
        auto result = cancel(id);
        if (result.is_err()) {
            qCDebug(droplineSessionLog) << sid(id) << QString::fromStdString(result.unwrap_err().message);
        }
    }

    // Outgoing sessions reserved but not yet started.
    for (const auto& handle : table_.list()) {
        if (live_.count(handle.id) == 0) {
            cancelReserved(handle.id);
        }
    }

    if (discovery_) {
        discovery_->stopBrowsing();
        discovery_->stopAdvertising();
    }
    if (running_) {
        server_->close();
        running_ = false;
        emit runningChanged();
    }
}

uint16_t SessionManager::listeningPort() const {
    return server_->port();
}

// ============================================================================
// Outgoing
// ============================================================================

Result<SessionHandle, Error> SessionManager::connectToEndpoint(const Endpoint& endpoint,
                                                               const QStringList& files) {
    return beginOutgoing(endpoint.id, endpoint.name, endpoint.host, endpoint.port, files, std::nullopt);
}

Result<SessionHandle, Error> SessionManager::connectToAddress(const DeviceId& endpoint_id,
                                                              const QHostAddress& host,
                                                              uint16_t port,
                                                              const QStringList& files) {
    if (endpoint_id.is_nil()) {
        return beginOutgoing(address_key(host, port), host.toString(), host, port, files, std::nullopt, true);
    }
    return beginOutgoing(endpoint_id, host.toString(), host, port, files, std::nullopt);
}

Result<SessionHandle, Error> SessionManager::connectToInvite(const PairingInvite& invite,
                                                             const QStringList& files) {
    return beginOutgoing(invite.device_id, invite.device_name, invite.address, invite.port, files,
                         invite.secret);
}

Result<SessionHandle, Error> SessionManager::beginOutgoing(const DeviceId& endpoint_id,
                                                           const QString& peer_name,
                                                           const QHostAddress& host,
                                                           uint16_t port,
                                                           const QStringList& files,
                                                           std::optional<crypto::SharedSecret> secret,
                                                           bool address_keyed) {
    if (host.isNull() || port == 0) {
        return Result<SessionHandle, Error>::err(
            Error{ErrorKind::InvalidArgument, "endpoint has no usable address"});
    }
    if (endpoint_id == config_.device.id) {
        return Result<SessionHandle, Error>::err(
            Error{ErrorKind::InvalidArgument, "cannot send to this device"});
    }

    auto manifest = transfer::build_manifest(files, config_.transfer);
    if (manifest.is_err()) {
        return Result<SessionHandle, Error>::err(manifest.unwrap_err());
    }

    const SessionId id = SessionId::generate();
    auto reserved = table_.reserve(id, endpoint_id, transfer::Direction::Outgoing, peer_name);
    if (reserved.is_err()) {
        qCInfo(droplineSessionLog) << "refusing second session with" << peer_name;
        return reserved;
    }

    QMetaObject::invokeMethod(this, [this, id, host, port, files = manifest.unwrap(), secret,
                                     address_keyed]() mutable {
        startOutgoing(id, host, port, std::move(files), std::move(secret), address_keyed);
    }, Qt::QueuedConnection);

    emit sessionsChanged();
    return reserved;
}

void SessionManager::startOutgoing(const SessionId& id,
                                   QHostAddress host,
                                   uint16_t port,
                                   std::vector<transfer::OutgoingFile> files,
                                   std::optional<crypto::SharedSecret> secret,
                                   bool address_keyed) {
    if (!table_.find(id)) {
        return;  // cancelled before it started
    }

    auto live = std::make_unique<LiveSession>();
    live->id = id;
    live->direction = transfer::Direction::Outgoing;
    live->files = std::move(files);
    live->reserved = true;
    live->announced = true;
    live->address_keyed = address_keyed;
    live->connection = new Connection(crypto::Role::Initiator, handshakeOptions(secret),
                                      config_.network, this);

    auto& ref = *live;
    live_.emplace(id, std::move(live));
    wireConnection(ref);

    emitState(id, transfer::SessionState::Connecting);
    qCInfo(droplineSessionLog) << sid(id) << "connecting to" << host.toString() << port;
    ref.connection->connectToPeer(host, port);
}

// ============================================================================
// Incoming
// ============================================================================

void SessionManager::onNewConnection(QTcpSocket* socket) {
    if (!running_) {
        socket->abort();
        socket->deleteLater();
        return;
    }

    auto live = std::make_unique<LiveSession>();
    live->id = SessionId::generate();
    live->direction = transfer::Direction::Incoming;
    live->connection = new Connection(crypto::Role::Responder, handshakeOptions(std::nullopt),
                                      config_.network, this);

    auto& ref = *live;
    live_.emplace(ref.id, std::move(live));
    wireConnection(ref);
    ref.connection->acceptConnection(socket);
}

std::optional<SessionHandle> SessionManager::acceptIncoming() {
    std::lock_guard<std::mutex> lock(incoming_mutex_);
    while (!incoming_queue_.empty()) {
        const SessionId id = incoming_queue_.front();
        incoming_queue_.pop_front();
        if (auto handle = table_.find(id)) {
            return handle;
        }
    }
    return std::nullopt;
}

// ============================================================================
// Connection events
// ============================================================================

void SessionManager::wireConnection(LiveSession& live) {
    const SessionId id = live.id;
    Connection* connection = live.connection;

    connect(connection, &Connection::handshakeStarted, this, [this, id]() {
        auto it = live_.find(id);
        if (it != live_.end() && it->second->announced) {
            emitState(id, transfer::SessionState::Handshaking);
        }
    });
    connect(connection, &Connection::authCodeReady, this, [this, id, connection](const QString& code) {
        if (!connection->awaitingPin()) return;
        auto it = live_.find(id);
        if (it != live_.end()) {
            it->second->announced = true;
        }
        emit authCodeRequired(id, code);
    });
    connect(connection, &Connection::established, this, [this, id]() {
        onEstablished(id);
    });
    connect(connection, &Connection::failed, this, [this, id](const Error& error) {
        onConnectionFailed(id, error);
    });
}

void SessionManager::onEstablished(const SessionId& id) {
    auto it = live_.find(id);
    if (it == live_.end()) return;
    LiveSession& live = *it->second;
    const auto peer = *live.connection->peer();
    const QString peer_name = QString::fromStdString(peer.device_name);

    if (live.direction == transfer::Direction::Outgoing) {
        const auto handle = table_.find(id);
        if (!handle) {
            forget(id);
            return;
        }
        if (handle->endpoint != peer.device_id) {
            if (!live.address_keyed) {
                endBeforeTransfer(id, transfer::SessionState::Failed,
                                  Error{ErrorKind::HandshakeFailed, "peer is not the advertised device"});
                return;
            }
            // Known only by address until now; one session per device still holds.
            auto rekeyed = table_.rekey(id, peer.device_id);
            if (rekeyed.is_err()) {
                qCInfo(droplineSessionLog) << sid(id) << "already in a session with" << peer_name;
                live.connection->rejectAndClose(
                    wire::Frame{wire::ControlFrame{wire::Cancel{transfer::TransferSession::CONFLICT_REASON}}});
                endBeforeTransfer(id, transfer::SessionState::Failed, rekeyed.unwrap_err());
                return;
            }
        }
        table_.attach(id, transfer::SessionState::Negotiating, peer_name);
        attachTransfer(live, transfer::TransferSession::outgoing(
            id, *live.connection, config_.transfer, config_.device.name.toStdString(),
            std::move(live.files), nullptr));
        return;
    }

    auto reserved = table_.reserve(id, peer.device_id, transfer::Direction::Incoming, peer_name);
    if (reserved.is_err()) {
        qCInfo(droplineSessionLog) << "turning away" << peer_name << "-"
                                   << QString::fromStdString(reserved.unwrap_err().message);
        live.connection->rejectAndClose(
            wire::Frame{wire::ControlFrame{wire::Cancel{transfer::TransferSession::CONFLICT_REASON}}});
        if (live.announced) {
            endBeforeTransfer(id, transfer::SessionState::Failed, reserved.unwrap_err());
        } else {
            forget(id);
        }
        return;
    }

    live.reserved = true;
    live.announced = true;
    table_.attach(id, transfer::SessionState::Negotiating, peer_name);
    {
        std::lock_guard<std::mutex> lock(incoming_mutex_);
        incoming_queue_.push_back(id);
    }
    qCInfo(droplineSessionLog) << sid(id) << "incoming session from" << peer_name;
    emit sessionsChanged();
    emit incomingSession(reserved.unwrap());

    attachTransfer(live, transfer::TransferSession::incoming(
        id, *live.connection, config_.transfer, nullptr));
}

void SessionManager::onConnectionFailed(const SessionId& id, const Error& error) {
    auto it = live_.find(id);
    if (it == live_.end() || it->second->transfer) {
        return;  // the transfer session reports its own failure
    }

    if (!it->second->announced) {
        qCInfo(droplineSessionLog) << "incoming handshake failed:"
                                   << QString::fromStdString(error.describe());
        forget(id);
        return;
    }
    endBeforeTransfer(id, transfer::SessionState::Failed, error);
}

void SessionManager::attachTransfer(LiveSession& live, std::unique_ptr<transfer::TransferSession> session) {
    const SessionId id = live.id;

    connect(session.get(), &transfer::TransferSession::sessionEvent, this,
            [this](const SessionId& session_id, const transfer::SessionEvent& event) {
        if (const auto* changed = std::get_if<transfer::StateChanged>(&event)) {
            table_.update_state(session_id, changed->state);
        }
        emit sessionEvent(session_id, event);
    });
    connect(session.get(), &transfer::TransferSession::transferRequested, this,
            [this](const SessionId& session_id) {
        auto it = live_.find(session_id);
        if (it == live_.end() || !it->second->transfer) return;
        const auto& session = *it->second->transfer;
        QStringList names;
        for (const auto& item : session.items()) {
            names.append(QString::fromStdString(item.name));
        }
        emit transferRequested(session_id, QString::fromStdString(session.peerName()), names,
                               static_cast<quint64>(session.totalBytes()));
    });
    connect(session.get(), &transfer::TransferSession::finished, this,
            [this](const SessionId& session_id) {
        onTransferFinished(session_id);
    });

    live.transfer = std::move(session);
    live_.at(id)->transfer->start();
}

void SessionManager::onTransferFinished(const SessionId& id) {
    qCDebug(droplineSessionLog) << sid(id) << "finished";
    forget(id);
}

void SessionManager::endBeforeTransfer(const SessionId& id, transfer::SessionState state, const Error& error) {
    qCWarning(droplineSessionLog) << sid(id) << to_string(state) << "before transfer:"
                                  << QString::fromStdString(error.describe());
    forget(id);
    emitState(id, state);
    emit sessionEvent(id, transfer::SessionEvent{transfer::ErrorEvent{error.kind, error.message}});
}

void SessionManager::forget(const SessionId& id) {
    auto it = live_.find(id);
    if (it != live_.end()) {
        auto live = std::move(it->second);
        live_.erase(it);

        if (live->transfer) {
            // May be called from inside the session's own signal.
            live->transfer.release()->deleteLater();
        }
        if (live->connection) {
            live->connection->disconnect(this);
            live->connection->close();
            live->connection->deleteLater();
        }
    }
    if (table_.release(id)) {
        emit sessionsChanged();
    }
}

// ============================================================================
// Control
// ============================================================================

Result<void, Error> SessionManager::cancel(const SessionId& id) {
    if (!onManagerThread()) {
        if (!table_.find(id)) {
            return Result<void, Error>::err(
                Error{ErrorKind::InvalidArgument, "no session " + id.short_string()});
        }
        runOnManagerThread([this, id]() {
            auto result = cancel(id);
            if (result.is_err()) {
                qCDebug(droplineSessionLog) << sid(id) << QString::fromStdString(result.unwrap_err().message);
            }
        });
        return Result<void, Error>::ok();
    }

    auto it = live_.find(id);
    if (it == live_.end()) {
        if (table_.find(id)) {
            cancelReserved(id);
            return Result<void, Error>::ok();
        }
        return Result<void, Error>::err(
            Error{ErrorKind::InvalidArgument, "no session " + id.short_string()});
    }

    if (it->second->transfer) {
        it->second->transfer->cancel();
        return Result<void, Error>::ok();
    }

    if (it->second->announced) {
        endBeforeTransfer(id, transfer::SessionState::Cancelled,
                          Error{ErrorKind::Cancelled, "cancelled locally"});
    } else {
        forget(id);
    }
    return Result<void, Error>::ok();
}

// Reserved, connection not started yet.
void SessionManager::cancelReserved(const SessionId& id) {
    if (!table_.release(id)) return;
    emit sessionsChanged();
    emit sessionEvent(id, transfer::SessionEvent{transfer::StateChanged{transfer::SessionState::Cancelled}});
    emit sessionEvent(id, transfer::SessionEvent{
        transfer::ErrorEvent{ErrorKind::Cancelled, "cancelled locally"}});
}

std::vector<SessionHandle> SessionManager::listActive() const {
    return table_.list();
}

Result<void, Error> SessionManager::acceptTransfer(const SessionId& id) {
    if (!onManagerThread()) {
        runOnManagerThread([this, id]() {
            auto result = acceptTransfer(id);
            if (result.is_err()) {
                qCWarning(droplineSessionLog) << sid(id) << QString::fromStdString(result.unwrap_err().message);
            }
        });
        return Result<void, Error>::ok();
    }

    auto it = live_.find(id);
    if (it == live_.end() || !it->second->transfer) {
        return Result<void, Error>::err(
            Error{ErrorKind::InvalidArgument, "no session " + id.short_string() + " awaiting consent"});
    }
    return it->second->transfer->accept();
}

Result<void, Error> SessionManager::rejectTransfer(const SessionId& id, const QString& reason) {
    if (!onManagerThread()) {
        runOnManagerThread([this, id, reason]() {
            auto result = rejectTransfer(id, reason);
            if (result.is_err()) {
                qCWarning(droplineSessionLog) << sid(id) << QString::fromStdString(result.unwrap_err().message);
            }
        });
        return Result<void, Error>::ok();
    }

    auto it = live_.find(id);
    if (it == live_.end() || !it->second->transfer) {
        return Result<void, Error>::err(
            Error{ErrorKind::InvalidArgument, "no session " + id.short_string() + " awaiting consent"});
    }
    return it->second->transfer->reject(reason.isEmpty() ? std::string("declined") : reason.toStdString());
}

Result<void, Error> SessionManager::confirmPin(const SessionId& id, bool accepted) {
    if (!onManagerThread()) {
        runOnManagerThread([this, id, accepted]() {
            auto result = confirmPin(id, accepted);
            if (result.is_err()) {
                qCWarning(droplineSessionLog) << sid(id) << QString::fromStdString(result.unwrap_err().message);
            }
        });
        return Result<void, Error>::ok();
    }

    auto it = live_.find(id);
    if (it == live_.end() || !it->second->connection || !it->second->connection->awaitingPin()) {
        return Result<void, Error>::err(
            Error{ErrorKind::InvalidArgument, "no code awaiting confirmation for " + id.short_string()});
    }
    it->second->connection->confirmPin(accepted);
    return Result<void, Error>::ok();
}

PairingInvite SessionManager::createInvite(const QHostAddress& address) {
    auto invite = make_invite(config_.device.id, config_.device.name, address, listeningPort());
    shared_secret_ = invite.secret;
    config_.network.trust_mode = TrustMode::SharedSecret;
    qCInfo(droplineSessionLog) << "incoming peers now need the invite secret";
    if (discovery_ && discovery_->isAdvertising()) {
        auto refreshed = discovery_->startAdvertising(advertisement(listeningPort()));
        if (refreshed.is_err()) {
            qCWarning(droplineSessionLog) << "could not refresh advertisement:"
                                          << QString::fromStdString(refreshed.unwrap_err().message);
        }
    }
    return invite;
}

std::vector<transfer::TransferItem> SessionManager::sessionItems(const SessionId& id) const {
    auto it = live_.find(id);
    if (it == live_.end() || !it->second->transfer) {
        return {};
    }
    return it->second->transfer->items();
}

// ============================================================================
// Helpers
// ============================================================================

crypto::HandshakeOptions SessionManager::handshakeOptions(
    const std::optional<crypto::SharedSecret>& secret) const {
    crypto::HandshakeOptions options;
    options.local_id = config_.device.id;
    options.local_name = config_.device.name.toStdString();
    if (secret) {
        options.trust = TrustMode::SharedSecret;
        options.shared_secret = secret;
    } else {
        options.trust = config_.network.trust_mode;
        options.shared_secret = shared_secret_;
    }
    return options;
}

AdvertisementInfo SessionManager::advertisement(uint16_t port) const {
    AdvertisementInfo info;
    info.device_id = config_.device.id;
    info.device_name = config_.device.name;
    info.port = port;
    info.capabilities = CapabilityReceive | CapabilitySend;
    if (config_.network.trust_mode == TrustMode::PinConfirmation) {
        info.capabilities |= CapabilityPinConfirmation;
    } else if (config_.network.trust_mode == TrustMode::SharedSecret) {
        info.capabilities |= CapabilitySharedSecret;
    }
    return info;
}

void SessionManager::emitState(const SessionId& id, transfer::SessionState state) {
    table_.update_state(id, state);
    emit sessionEvent(id, transfer::SessionEvent{transfer::StateChanged{state}});
}

void SessionManager::runOnManagerThread(std::function<void()> task) {
    if (onManagerThread()) {
        task();
        return;
    }
    QMetaObject::invokeMethod(this, std::move(task), Qt::QueuedConnection);
}

bool SessionManager::onManagerThread() const {
    return QThread::currentThread() == thread();
}

} // namespace dropline::network
