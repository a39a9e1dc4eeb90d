#pragma once

#include "core/config.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "crypto/keys.hpp"
#include "wire/frame.hpp"

#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace dropline::crypto {

/**
 * Handshake - Ephemeral key agreement plus trust confirmation.
 *
 *   initiator                          responder
 *   INIT {v, pk_i, id_i, name_i}  ->
 *                                 <-   RESPONSE {v, pk_r, id_r, name_r}
 *   CONFIRM {tag_i}               <->  CONFIRM {tag_r}
 *
 * Keys come from crypto_kx (X25519 + BLAKE2b). Both sides hash the same
 * transcript, so both show the same 4-digit code. A confirmation tag is a
 * keyed BLAKE2b over the transcript and the sender's role; in SharedSecret
 * mode the key also mixes in the pre-shared secret, so a peer without the
 * secret cannot produce a matching tag.
 *
 * In PinConfirmation mode the local CONFIRM is held back until the user
 * calls confirm_local(). The peer's CONFIRM may arrive first; it is checked
 * immediately and remembered.
 */

constexpr uint32_t PROTOCOL_VERSION = 1;
constexpr size_t CONFIRMATION_TAG_SIZE = 32;

enum class Role {
    Initiator,
    Responder
};

struct SessionKeys {
    SessionKey tx{};
    SessionKey rx{};
};

struct PeerIdentity {
    DeviceId device_id;
    std::string device_name;
};

struct HandshakeOptions {
    TrustMode trust = TrustMode::Implicit;
    std::optional<SharedSecret> shared_secret;
    DeviceId local_id;
    std::string local_name;
};

namespace handshake_state {

struct Idle {};

struct KeyExchanged {
    PeerIdentity peer;
    SessionKeys keys;
    std::vector<uint8_t> transcript;
    std::string auth_code;
    bool local_confirmed = false;
    bool peer_confirmed = false;
};

struct Authenticated {
    PeerIdentity peer;
    SessionKeys keys;
    std::string auth_code;
};

struct Failed {
    Error error;
};

} // namespace handshake_state

using HandshakeState = std::variant<
    handshake_state::Idle,
    handshake_state::KeyExchanged,
    handshake_state::Authenticated,
    handshake_state::Failed>;

class Handshake {
public:
    Handshake(Role role, HandshakeOptions options, KeyPair ephemeral = generate_keypair());
    ~Handshake();

    Handshake(const Handshake&) = delete;
    Handshake& operator=(const Handshake&) = delete;

    /**
     * Initiator only: produce the INIT frame. The state stays Idle until the
     * RESPONSE arrives.
     */
    [[nodiscard]] Result<wire::HandshakeFrame, Error> start();

    /**
     * Process one peer frame and return the frames to send in reply (zero,
     * one or two). An error result from a live handshake means it is now
     * Failed with that error. Frames arriving after a terminal state are
     * refused and leave the state alone.
     */
    [[nodiscard]] Result<std::vector<wire::HandshakeFrame>, Error> receive(
        const wire::HandshakeFrame& frame);

    /**
     * PinConfirmation mode: the user's verdict on the displayed code.
     * Rejecting fails the handshake and yields an ABORT frame to send.
     */
    [[nodiscard]] Result<std::vector<wire::HandshakeFrame>, Error> confirm_local(bool accepted);

    /**
     * Force the Failed state (timeouts, transport errors). No-op once terminal.
     */
    void fail(Error error);

    [[nodiscard]] Role role() const { return role_; }
    [[nodiscard]] const HandshakeState& state() const { return state_; }
    [[nodiscard]] bool is_authenticated() const;
    [[nodiscard]] bool is_failed() const;
    [[nodiscard]] bool is_terminal() const { return is_authenticated() || is_failed(); }
    [[nodiscard]] bool awaiting_local_confirmation() const;

    /**
     * 4-digit code, available from KeyExchanged on.
     */
    [[nodiscard]] std::optional<std::string> auth_code() const;
    [[nodiscard]] std::optional<SessionKeys> keys() const;
    [[nodiscard]] std::optional<PeerIdentity> peer() const;
    [[nodiscard]] std::optional<Error> error() const;

private:
    using Frames = std::vector<wire::HandshakeFrame>;

    Role role_;
    HandshakeOptions options_;
    KeyPair ephemeral_;
    HandshakeState state_;
    bool init_sent_ = false;

    Result<Frames, Error> on_init(const wire::HandshakeFrame& frame);
    Result<Frames, Error> on_response(const wire::HandshakeFrame& frame);
    Result<Frames, Error> on_confirm(const wire::HandshakeFrame& frame);

    Result<PeerIdentity, Error> validate_peer_hello(const wire::HandshakeFrame& frame) const;
    void enter_key_exchanged(PeerIdentity peer, SessionKeys keys,
                             const PublicKey& initiator_pk, const PublicKey& responder_pk,
                             const DeviceId& initiator_id, const DeviceId& responder_id);
    [[nodiscard]] wire::HandshakeFrame hello_frame(wire::HandshakeStep step) const;
    [[nodiscard]] wire::HandshakeFrame confirm_frame(const handshake_state::KeyExchanged& st) const;
    [[nodiscard]] std::vector<uint8_t> confirmation_tag(
        const handshake_state::KeyExchanged& st, Role sender) const;
    void maybe_finish();
    Error fail_with(ErrorKind kind, std::string message);
};

/**
 * 4-digit authentication code for a transcript.
 */
[[nodiscard]] std::string derive_auth_code(std::span<const uint8_t> transcript);

[[nodiscard]] const char* to_string(Role role);

} // namespace dropline::crypto
