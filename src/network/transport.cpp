#include "network/transport.hpp"
#include "core/logging.hpp"

#include <algorithm>

namespace dropline::network {

namespace {

wire::HandshakeFrame abort_frame(const std::string& reason) {
    wire::HandshakeFrame frame;
    frame.step = wire::HandshakeStep::Abort;
    frame.protocol_version = crypto::PROTOCOL_VERSION;
    frame.abort_reason = reason;
    return frame;
}

} // namespace

// ============================================================================
// Connection
// ============================================================================

Connection::Connection(crypto::Role role,
                       crypto::HandshakeOptions options,
                       NetworkConfig config,
                       QObject* parent)
    : QObject(parent)
    , config_(config)
    , handshake_(role, std::move(options))
    , reader_(wire::CodecLimits{config.max_frame_size})
{
    handshake_timer_.setSingleShot(true);
    handshake_timer_.setInterval(static_cast<int>(config_.handshake_timeout.count()));
    connect(&handshake_timer_, &QTimer::timeout, this, &Connection::onHandshakeTimeout);
}

Connection::~Connection() {
    on_frame = nullptr;
    on_error = nullptr;
    on_closed = nullptr;
    on_drained = nullptr;
    if (!socket_) return;
    socket_->disconnect(this);
    if (socket_->state() == QAbstractSocket::ClosingState) {
        // close() left bytes queued (the final Cancel or TransferResult).
        // Let them drain; the socket deletes itself once disconnected.
        socket_->setParent(nullptr);
        connect(socket_, &QAbstractSocket::disconnected, socket_, &QObject::deleteLater);
        socket_->flush();
        return;
    }
    socket_->abort();
}

void Connection::attachSocket(QTcpSocket* socket) {
    socket->setParent(this);
    socket_ = socket;
    socket_->setSocketOption(QAbstractSocket::LowDelayOption, 1);

    connect(socket_, &QTcpSocket::connected,
            this, &Connection::onSocketConnected);
    connect(socket_, &QTcpSocket::disconnected,
            this, &Connection::onSocketDisconnected);
    connect(socket_, &QTcpSocket::errorOccurred,
            this, &Connection::onSocketError);
    connect(socket_, &QTcpSocket::readyRead,
            this, &Connection::onReadyRead);
    connect(socket_, &QTcpSocket::bytesWritten,
            this, &Connection::onBytesWritten);
}

void Connection::connectToPeer(const QHostAddress& host, uint16_t port) {
    if (state_ != State::Idle) return;
    attachSocket(new QTcpSocket(this));
    state_ = State::Connecting;
    handshake_timer_.start();
    qCInfo(droplineHandshakeLog) << "connecting to" << host.toString() << port;
    socket_->connectToHost(host, port);
}

void Connection::acceptConnection(QTcpSocket* socket) {
    if (state_ != State::Idle) {
        socket->abort();
        socket->deleteLater();
        return;
    }
    attachSocket(socket);
    state_ = State::Handshaking;
    handshake_timer_.start();
    qCDebug(droplineHandshakeLog) << "accepted connection from" << peerAddress().toString();
    emit handshakeStarted();

    // Bytes may already be buffered before we connected to readyRead.
    if (socket_->bytesAvailable() > 0) {
        QMetaObject::invokeMethod(this, &Connection::onReadyRead, Qt::QueuedConnection);
    }
}

QHostAddress Connection::peerAddress() const {
    return socket_ ? socket_->peerAddress() : QHostAddress{};
}

void Connection::confirmPin(bool accepted) {
    if (state_ != State::Handshaking || !handshake_.awaiting_local_confirmation()) {
        return;
    }
    auto result = handshake_.confirm_local(accepted);
    if (result.is_err()) {
        failWith(result.unwrap_err(), true);
        return;
    }
    for (const auto& frame : result.unwrap()) {
        auto written = writeFrame(frame);
        if (written.is_err()) {
            failWith(written.unwrap_err(), false);
            return;
        }
    }
    if (!accepted) {
        failWith(handshake_.error().value_or(
                     Error{ErrorKind::HandshakeFailed, "authentication code rejected"}),
                 false);
        return;
    }
    afterHandshakeStep();
}

Result<void, Error> Connection::send(const wire::Frame& frame) {
    if (state_ != State::Established || !channel_) {
        return Result<void, Error>::err(Error{ErrorKind::IOFailure, "connection not established"});
    }
    auto sealed = channel_->seal(frame);
    if (sealed.is_err()) {
        return Result<void, Error>::err(sealed.unwrap_err());
    }
    return writeFrame(wire::Frame{sealed.unwrap()});
}

void Connection::close() {
    if (state_ == State::Closed || state_ == State::Failed) return;
    finish(State::Closed);
    if (socket_) {
        socket_->disconnectFromHost();
    }
}

size_t Connection::pending_bytes() const {
    return socket_ ? static_cast<size_t>(socket_->bytesToWrite()) : 0;
}

void Connection::rejectAndClose(const wire::Frame& frame) {
    if (state_ == State::Established && channel_) {
        auto sealed = channel_->seal(frame);
        if (sealed.is_ok()) {
            auto written = writeFrame(wire::Frame{sealed.unwrap()});
            if (written.is_err()) {
                qCWarning(droplineSessionLog) << "rejection not delivered:"
                                              << QString::fromStdString(written.unwrap_err().message);
            }
        }
    }
    close();
}

Result<void, Error> Connection::writeFrame(const wire::Frame& frame) {
    if (!socket_ || socket_->state() != QAbstractSocket::ConnectedState) {
        return Result<void, Error>::err(Error{ErrorKind::IOFailure, "socket not connected"});
    }
    const auto bytes = wire::encode(frame);
    const qint64 written = socket_->write(reinterpret_cast<const char*>(bytes.data()),
                                          static_cast<qint64>(bytes.size()));
    if (written != static_cast<qint64>(bytes.size())) {
        return Result<void, Error>::err(
            Error{ErrorKind::IOFailure, "write failed: " + socket_->errorString().toStdString()});
    }
    return Result<void, Error>::ok();
}

void Connection::onSocketConnected() {
    state_ = State::Handshaking;
    emit handshakeStarted();
    auto init = handshake_.start();
    if (init.is_err()) {
        failWith(init.unwrap_err(), false);
        return;
    }
    auto written = writeFrame(wire::Frame{init.unwrap()});
    if (written.is_err()) {
        failWith(written.unwrap_err(), false);
    }
}

void Connection::onSocketDisconnected() {
    if (state_ == State::Established) {
        // Drain whatever arrived with the FIN before reporting the close.
        onReadyRead();
        if (state_ == State::Established) {
            qCDebug(droplineSessionLog) << "peer closed connection";
            finish(State::Closed);
        }
        return;
    }
    if (state_ == State::Connecting || state_ == State::Handshaking) {
        failWith(Error{ErrorKind::HandshakeFailed, "connection closed during handshake"}, false);
    }
}

void Connection::onSocketError(QAbstractSocket::SocketError err) {
    if (err == QAbstractSocket::RemoteHostClosedError) {
        return;  // reported through disconnected()
    }
    const auto message = socket_->errorString().toStdString();
    if (state_ == State::Connecting) {
        failWith(Error{ErrorKind::IOFailure, "connect failed: " + message}, false);
    } else if (state_ == State::Handshaking || state_ == State::Established) {
        failWith(Error{ErrorKind::IOFailure, message}, false);
    }
}

void Connection::onReadyRead() {
    while (socket_ && socket_->bytesAvailable() > 0 &&
           (state_ == State::Handshaking || state_ == State::Established)) {
        const size_t space = reader_.space();
        if (space == 0) {
            failWith(Error{ErrorKind::Malformed, "frame buffer overrun"}, true);
            return;
        }

        const qint64 want = std::min<qint64>(socket_->bytesAvailable(),
                                             static_cast<qint64>(space));
        const QByteArray chunk = socket_->read(want);
        if (chunk.isEmpty()) break;
        reader_.feed(std::span<const uint8_t>(
            reinterpret_cast<const uint8_t*>(chunk.constData()),
            static_cast<size_t>(chunk.size())));

        for (;;) {
            if (state_ != State::Handshaking && state_ != State::Established) return;
            auto out = reader_.next();
            if (auto* decoded = std::get_if<wire::Decoded>(&out)) {
                handleFrame(std::move(decoded->frame));
                continue;
            }
            if (auto* malformed = std::get_if<wire::Malformed>(&out)) {
                failWith(Error{ErrorKind::Malformed, malformed->reason}, true);
                return;
            }
            break;
        }
    }
}

void Connection::onBytesWritten(qint64) {
    if (state_ != State::Established) return;
    // Callbacks may replace themselves; call a copy.
    if (auto callback = on_drained) {
        callback();
    }
}

void Connection::onHandshakeTimeout() {
    if (state_ == State::Connecting || state_ == State::Handshaking) {
        qCWarning(droplineHandshakeLog) << "handshake timed out";
        failWith(Error{ErrorKind::Timeout, "handshake timed out"}, true);
    }
}

void Connection::handleFrame(wire::Frame frame) {
    if (state_ == State::Handshaking) {
        if (auto* hs = std::get_if<wire::HandshakeFrame>(&frame)) {
            handleHandshakeFrame(*hs);
            return;
        }
        failWith(Error{ErrorKind::HandshakeFailed,
                       std::string("unexpected ") + wire::frame_name(frame) + " during handshake"},
                 true);
        return;
    }

    auto* sealed = std::get_if<wire::SealedFrame>(&frame);
    if (!sealed) {
        if (auto* hs = std::get_if<wire::HandshakeFrame>(&frame);
            hs && hs->step == wire::HandshakeStep::Abort) {
            failWith(Error{ErrorKind::HandshakeFailed, "peer aborted: " + hs->abort_reason}, false);
            return;
        }
        failWith(Error{ErrorKind::Malformed,
                       std::string("unsealed ") + wire::frame_name(frame) + " after handshake"},
                 false);
        return;
    }

    auto opened = channel_->open(*sealed);
    if (opened.is_err()) {
        failWith(opened.unwrap_err(), false);
        return;
    }
    if (auto callback = on_frame) {
        callback(std::move(opened).unwrap());
    }
}

void Connection::handleHandshakeFrame(const wire::HandshakeFrame& frame) {
    auto replies = handshake_.receive(frame);
    if (replies.is_err()) {
        const bool peer_aborted = frame.step == wire::HandshakeStep::Abort;
        failWith(replies.unwrap_err(), !peer_aborted);
        return;
    }
    for (const auto& reply : replies.unwrap()) {
        auto written = writeFrame(wire::Frame{reply});
        if (written.is_err()) {
            failWith(written.unwrap_err(), false);
            return;
        }
    }
    afterHandshakeStep();
}

void Connection::afterHandshakeStep() {
    if (!code_announced_) {
        if (auto code = handshake_.auth_code()) {
            code_announced_ = true;
            qCInfo(droplineHandshakeLog) << "authentication code" << QString::fromStdString(*code);
            emit authCodeReady(QString::fromStdString(*code));
        }
    }

    if (!handshake_.is_authenticated() || state_ != State::Handshaking) {
        return;
    }

    handshake_timer_.stop();
    channel_ = std::make_unique<crypto::SecureChannel>(*handshake_.keys());
    state_ = State::Established;
    const auto peer = *handshake_.peer();
    qCInfo(droplineHandshakeLog) << "authenticated" << crypto::to_string(handshake_.role())
                                 << "with" << QString::fromStdString(peer.device_name)
                                 << QString::fromStdString(peer.device_id.short_string());
    emit established();
}

void Connection::failWith(Error error, bool notify_peer) {
    if (state_ == State::Closed || state_ == State::Failed) return;

    handshake_timer_.stop();
    handshake_.fail(error);

    if (notify_peer && socket_ && socket_->state() == QAbstractSocket::ConnectedState &&
        state_ == State::Handshaking) {
        auto written = writeFrame(wire::Frame{abort_frame(error.message)});
        if (written.is_err()) {
            qCDebug(droplineHandshakeLog) << "abort not delivered:"
                                          << QString::fromStdString(written.unwrap_err().message);
        }
    }

    const bool was_established = state_ == State::Established;
    if (was_established) {
        qCWarning(droplineSessionLog) << "connection failed:" << QString::fromStdString(error.describe());
    } else {
        qCWarning(droplineHandshakeLog) << "handshake failed:" << QString::fromStdString(error.describe());
    }

    state_ = State::Failed;
    if (socket_) {
        socket_->disconnectFromHost();
    }
    emit failed(error);
    if (auto callback = on_error; was_established && callback) {
        callback(error);
    }
    if (auto callback = on_closed) {
        callback();
    }
}

void Connection::finish(State state) {
    handshake_timer_.stop();
    const bool was_live = state_ == State::Established;
    state_ = state;
    emit closed();
    if (auto callback = on_closed; was_live && callback) {
        callback();
    }
}

// ============================================================================
// TransportServer
// ============================================================================

TransportServer::TransportServer(QObject* parent)
    : QObject(parent)
    , server_(std::make_unique<QTcpServer>(this))
{
    connect(server_.get(), &QTcpServer::newConnection,
            this, &TransportServer::onNewConnection);
}

TransportServer::~TransportServer() {
    close();
}

Result<uint16_t, Error> TransportServer::listen(uint16_t port) {
    if (!server_->listen(QHostAddress::Any, port)) {
        return Result<uint16_t, Error>::err(
            Error{ErrorKind::IOFailure, server_->errorString().toStdString()});
    }

    return Result<uint16_t, Error>::ok(server_->serverPort());
}

void TransportServer::close() {
    server_->close();
}

uint16_t TransportServer::port() const {
    return server_->serverPort();
}

bool TransportServer::isListening() const {
    return server_->isListening();
}

void TransportServer::onNewConnection() {
    while (server_->hasPendingConnections()) {
        QTcpSocket* socket = server_->nextPendingConnection();
        emit newConnection(socket);
    }
}

const char* to_string(Connection::State state) {
    switch (state) {
        case Connection::State::Idle: return "idle";
        case Connection::State::Connecting: return "connecting";
        case Connection::State::Handshaking: return "handshaking";
        case Connection::State::Established: return "established";
        case Connection::State::Closed: return "closed";
        case Connection::State::Failed: return "failed";
    }
    return "unknown";
}

} // namespace dropline::network
