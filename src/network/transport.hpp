#pragma once

#include "core/config.hpp"
#include "core/types.hpp"
#include "core/result.hpp"
#include "crypto/handshake.hpp"
#include "crypto/secure_channel.hpp"
#include "wire/frame_codec.hpp"
#include <QObject>
#include <QTcpSocket>
#include <QTcpServer>
#include <QTimer>
#include <functional>
#include <memory>
#include <optional>

namespace dropline::network {

/**
 * FrameLink - An authenticated, encrypted frame pipe to one peer.
 *
 * Transfer sessions only see this interface; tests drive sessions over an
 * in-memory link instead of a socket.
 */
class FrameLink {
public:
    virtual ~FrameLink() = default;

    /**
     * Send a ControlFrame or ChunkFrame. Sealing happens inside the link.
     */
    virtual Result<void, Error> send(const wire::Frame& frame) = 0;

    /**
     * Close the link. Pending writes are flushed; on_closed fires once.
     */
    virtual void close() = 0;

    /**
     * Bytes accepted by send() but not yet handed to the OS.
     */
    [[nodiscard]] virtual size_t pending_bytes() const = 0;

    [[nodiscard]] virtual bool is_open() const = 0;

    std::function<void(wire::Frame)> on_frame;
    std::function<void(Error)> on_error;
    std::function<void()> on_closed;
    std::function<void()> on_drained;
};

/**
 * Connection - A TCP connection that runs the handshake and then carries
 * sealed frames.
 *
 * Handshake frames travel in the clear. Once both confirmations are in, all
 * Control and Chunk frames are sealed with the session keys; anything else
 * is a protocol violation and fails the connection.
 */
class Connection : public QObject, public FrameLink {
    Q_OBJECT

public:
    enum class State {
        Idle,
        Connecting,
        Handshaking,
        Established,
        Closed,
        Failed
    };

    Connection(crypto::Role role,
               crypto::HandshakeOptions options,
               NetworkConfig config,
               QObject* parent = nullptr);
    ~Connection() override;

    /**
     * Connect to a peer as initiator.
     */
    void connectToPeer(const QHostAddress& host, uint16_t port);

    /**
     * Take over an accepted socket as responder.
     */
    void acceptConnection(QTcpSocket* socket);

    /**
     * PinConfirmation mode: report whether the user accepted the code.
     */
    void confirmPin(bool accepted);

    // FrameLink
    Result<void, Error> send(const wire::Frame& frame) override;
    void close() override;
    [[nodiscard]] size_t pending_bytes() const override;
    [[nodiscard]] bool is_open() const override { return state_ == State::Established; }

    [[nodiscard]] State state() const { return state_; }
    [[nodiscard]] crypto::Role role() const { return handshake_.role(); }
    [[nodiscard]] std::optional<crypto::PeerIdentity> peer() const { return handshake_.peer(); }
    [[nodiscard]] std::optional<std::string> authCode() const { return handshake_.auth_code(); }
    [[nodiscard]] bool awaitingPin() const { return handshake_.awaiting_local_confirmation(); }
    [[nodiscard]] QHostAddress peerAddress() const;

    /**
     * Seal and send one frame, then close. Turns a peer away after the
     * handshake (e.g. session conflict) without building a session.
     */
    void rejectAndClose(const wire::Frame& frame);

signals:
    void handshakeStarted();
    void authCodeReady(const QString& code);
    void established();
    void failed(const dropline::Error& error);
    void closed();

private slots:
    void onSocketConnected();
    void onSocketDisconnected();
    void onSocketError(QAbstractSocket::SocketError error);
    void onReadyRead();
    void onBytesWritten(qint64 bytes);
    void onHandshakeTimeout();

private:
    NetworkConfig config_;
    State state_ = State::Idle;
    QTcpSocket* socket_ = nullptr;
    crypto::Handshake handshake_;
    std::unique_ptr<crypto::SecureChannel> channel_;
    wire::FrameReader reader_;
    QTimer handshake_timer_;
    bool code_announced_ = false;

    void attachSocket(QTcpSocket* socket);
    void handleFrame(wire::Frame frame);
    void handleHandshakeFrame(const wire::HandshakeFrame& frame);
    void afterHandshakeStep();
    Result<void, Error> writeFrame(const wire::Frame& frame);
    void failWith(Error error, bool notify_peer);
    void finish(State state);
};

/**
 * TransportServer - Listens for incoming connections.
 */
class TransportServer : public QObject {
    Q_OBJECT

public:
    explicit TransportServer(QObject* parent = nullptr);
    ~TransportServer() override;

    /**
     * Start listening on a port.
     * @param port Port to listen on (0 for auto-assign)
     * @return The actual port being listened on
     */
    Result<uint16_t, Error> listen(uint16_t port = 0);

    void close();

    [[nodiscard]] uint16_t port() const;
    [[nodiscard]] bool isListening() const;

signals:
    void newConnection(QTcpSocket* socket);

private slots:
    void onNewConnection();

private:
    std::unique_ptr<QTcpServer> server_;
};

[[nodiscard]] const char* to_string(Connection::State state);

} // namespace dropline::network
