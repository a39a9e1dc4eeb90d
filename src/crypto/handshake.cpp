#include "crypto/handshake.hpp"

#include <cstdio>
#include <string_view>

namespace dropline::crypto {

namespace {

constexpr std::string_view kTranscriptLabel = "dropline-handshake-v1";

template<class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template<class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

void append(std::vector<uint8_t>& out, std::span<const uint8_t> bytes) {
    out.insert(out.end(), bytes.begin(), bytes.end());
}

void append(std::vector<uint8_t>& out, std::string_view text) {
    out.insert(out.end(), text.begin(), text.end());
}

} // namespace

const char* to_string(Role role) {
    return role == Role::Initiator ? "initiator" : "responder";
}

std::string derive_auth_code(std::span<const uint8_t> transcript) {
    const auto digest = hash(transcript, crypto_generichash_BYTES_MIN);
    const uint32_t value = static_cast<uint32_t>(digest[0]) |
                           (static_cast<uint32_t>(digest[1]) << 8) |
                           (static_cast<uint32_t>(digest[2]) << 16) |
                           (static_cast<uint32_t>(digest[3]) << 24);
    char buffer[5];
    std::snprintf(buffer, sizeof(buffer), "%04u", value % 10000);
    return buffer;
}

Handshake::Handshake(Role role, HandshakeOptions options, KeyPair ephemeral)
    : role_(role)
    , options_(std::move(options))
    , ephemeral_(ephemeral)
    , state_(handshake_state::Idle{})
{
}

Handshake::~Handshake() {
    secure_zero(ephemeral_.secret_key.data(), ephemeral_.secret_key.size());
    if (options_.shared_secret) {
        secure_zero(options_.shared_secret->data(), options_.shared_secret->size());
    }
}

bool Handshake::is_authenticated() const {
    return std::holds_alternative<handshake_state::Authenticated>(state_);
}

bool Handshake::is_failed() const {
    return std::holds_alternative<handshake_state::Failed>(state_);
}

bool Handshake::awaiting_local_confirmation() const {
    const auto* st = std::get_if<handshake_state::KeyExchanged>(&state_);
    return st && !st->local_confirmed;
}

std::optional<std::string> Handshake::auth_code() const {
    return std::visit(overloaded{
        [](const handshake_state::KeyExchanged& st) -> std::optional<std::string> { return st.auth_code; },
        [](const handshake_state::Authenticated& st) -> std::optional<std::string> { return st.auth_code; },
        [](const auto&) -> std::optional<std::string> { return std::nullopt; },
    }, state_);
}

std::optional<SessionKeys> Handshake::keys() const {
    if (const auto* st = std::get_if<handshake_state::Authenticated>(&state_)) {
        return st->keys;
    }
    return std::nullopt;
}

std::optional<PeerIdentity> Handshake::peer() const {
    return std::visit(overloaded{
        [](const handshake_state::KeyExchanged& st) -> std::optional<PeerIdentity> { return st.peer; },
        [](const handshake_state::Authenticated& st) -> std::optional<PeerIdentity> { return st.peer; },
        [](const auto&) -> std::optional<PeerIdentity> { return std::nullopt; },
    }, state_);
}

std::optional<Error> Handshake::error() const {
    if (const auto* st = std::get_if<handshake_state::Failed>(&state_)) {
        return st->error;
    }
    return std::nullopt;
}

void Handshake::fail(Error error) {
    if (is_terminal()) return;
    state_ = handshake_state::Failed{std::move(error)};
}

Error Handshake::fail_with(ErrorKind kind, std::string message) {
    Error error{kind, std::move(message)};
    fail(error);
    return error;
}

Result<wire::HandshakeFrame, Error> Handshake::start() {
    if (role_ != Role::Initiator) {
        return Result<wire::HandshakeFrame, Error>::err(
            Error{ErrorKind::InvalidArgument, "only the initiator starts a handshake"});
    }
    if (init_sent_ || !std::holds_alternative<handshake_state::Idle>(state_)) {
        return Result<wire::HandshakeFrame, Error>::err(
            Error{ErrorKind::InvalidArgument, "handshake already started"});
    }
    if (options_.trust == TrustMode::SharedSecret && !options_.shared_secret) {
        return Result<wire::HandshakeFrame, Error>::err(
            fail_with(ErrorKind::HandshakeFailed, "shared-secret trust without a secret"));
    }
    init_sent_ = true;
    return Result<wire::HandshakeFrame, Error>::ok(hello_frame(wire::HandshakeStep::Init));
}

Result<std::vector<wire::HandshakeFrame>, Error> Handshake::receive(
    const wire::HandshakeFrame& frame) {
    if (is_terminal()) {
        return Result<Frames, Error>::err(
            Error{ErrorKind::HandshakeFailed, "handshake already finished"});
    }

    switch (frame.step) {
        case wire::HandshakeStep::Init:
            return on_init(frame);
        case wire::HandshakeStep::Response:
            return on_response(frame);
        case wire::HandshakeStep::Confirm:
            return on_confirm(frame);
        case wire::HandshakeStep::Abort:
            return Result<Frames, Error>::err(fail_with(
                ErrorKind::HandshakeFailed,
                "peer aborted: " + (frame.abort_reason.empty() ? std::string("no reason")
                                                               : frame.abort_reason)));
    }
    return Result<Frames, Error>::err(fail_with(ErrorKind::HandshakeFailed, "unknown step"));
}

Result<std::vector<wire::HandshakeFrame>, Error> Handshake::confirm_local(bool accepted) {
    auto* st = std::get_if<handshake_state::KeyExchanged>(&state_);
    if (!st || st->local_confirmed) {
        return Result<Frames, Error>::err(
            Error{ErrorKind::InvalidArgument, "no confirmation pending"});
    }

    if (!accepted) {
        fail_with(ErrorKind::HandshakeFailed, "authentication code rejected locally");
        wire::HandshakeFrame abort;
        abort.step = wire::HandshakeStep::Abort;
        abort.protocol_version = PROTOCOL_VERSION;
        abort.abort_reason = "authentication code rejected";
        return Result<Frames, Error>::ok(Frames{std::move(abort)});
    }

    Frames out{confirm_frame(*st)};
    st->local_confirmed = true;
    maybe_finish();
    return Result<Frames, Error>::ok(std::move(out));
}

Result<PeerIdentity, Error> Handshake::validate_peer_hello(const wire::HandshakeFrame& frame) const {
    if (frame.protocol_version != PROTOCOL_VERSION) {
        return Result<PeerIdentity, Error>::err(Error{
            ErrorKind::HandshakeFailed,
            "unsupported protocol version " + std::to_string(frame.protocol_version)});
    }
    if (frame.public_key.size() != PUBLIC_KEY_SIZE || is_all_zero(frame.public_key)) {
        return Result<PeerIdentity, Error>::err(
            Error{ErrorKind::HandshakeFailed, "invalid peer public key"});
    }
    auto id = Uuid::from_bytes(frame.device_id);
    if (!id || id->is_nil()) {
        return Result<PeerIdentity, Error>::err(
            Error{ErrorKind::HandshakeFailed, "invalid peer device id"});
    }
    return Result<PeerIdentity, Error>::ok(PeerIdentity{*id, frame.device_name});
}

Result<std::vector<wire::HandshakeFrame>, Error> Handshake::on_init(const wire::HandshakeFrame& frame) {
    if (role_ != Role::Responder || !std::holds_alternative<handshake_state::Idle>(state_)) {
        return Result<Frames, Error>::err(fail_with(ErrorKind::HandshakeFailed, "unexpected INIT"));
    }
    if (options_.trust == TrustMode::SharedSecret && !options_.shared_secret) {
        return Result<Frames, Error>::err(
            fail_with(ErrorKind::HandshakeFailed, "shared-secret trust without a secret"));
    }
    auto peer = validate_peer_hello(frame);
    if (peer.is_err()) {
        auto error = peer.unwrap_err();
        fail(error);
        return Result<Frames, Error>::err(std::move(error));
    }

    PublicKey client_pk;
    std::copy(frame.public_key.begin(), frame.public_key.end(), client_pk.begin());

    SessionKeys keys;
    if (crypto_kx_server_session_keys(keys.rx.data(), keys.tx.data(),
                                      ephemeral_.public_key.data(),
                                      ephemeral_.secret_key.data(),
                                      client_pk.data()) != 0) {
        return Result<Frames, Error>::err(fail_with(ErrorKind::HandshakeFailed, "key agreement failed"));
    }

    const auto peer_id = peer.unwrap().device_id;
    enter_key_exchanged(std::move(peer).unwrap(), keys, client_pk, ephemeral_.public_key,
                        peer_id, options_.local_id);

    Frames out{hello_frame(wire::HandshakeStep::Response)};
    auto& st = std::get<handshake_state::KeyExchanged>(state_);
    if (options_.trust != TrustMode::PinConfirmation) {
        out.push_back(confirm_frame(st));
        st.local_confirmed = true;
    }
    return Result<Frames, Error>::ok(std::move(out));
}

Result<std::vector<wire::HandshakeFrame>, Error> Handshake::on_response(const wire::HandshakeFrame& frame) {
    if (role_ != Role::Initiator || !init_sent_ ||
        !std::holds_alternative<handshake_state::Idle>(state_)) {
        return Result<Frames, Error>::err(fail_with(ErrorKind::HandshakeFailed, "unexpected RESPONSE"));
    }
    auto peer = validate_peer_hello(frame);
    if (peer.is_err()) {
        auto error = peer.unwrap_err();
        fail(error);
        return Result<Frames, Error>::err(std::move(error));
    }

    PublicKey server_pk;
    std::copy(frame.public_key.begin(), frame.public_key.end(), server_pk.begin());

    SessionKeys keys;
    if (crypto_kx_client_session_keys(keys.rx.data(), keys.tx.data(),
                                      ephemeral_.public_key.data(),
                                      ephemeral_.secret_key.data(),
                                      server_pk.data()) != 0) {
        return Result<Frames, Error>::err(fail_with(ErrorKind::HandshakeFailed, "key agreement failed"));
    }

    const auto peer_id = peer.unwrap().device_id;
    enter_key_exchanged(std::move(peer).unwrap(), keys, ephemeral_.public_key, server_pk,
                        options_.local_id, peer_id);

    Frames out;
    auto& st = std::get<handshake_state::KeyExchanged>(state_);
    if (options_.trust != TrustMode::PinConfirmation) {
        out.push_back(confirm_frame(st));
        st.local_confirmed = true;
    }
    return Result<Frames, Error>::ok(std::move(out));
}

Result<std::vector<wire::HandshakeFrame>, Error> Handshake::on_confirm(const wire::HandshakeFrame& frame) {
    auto* st = std::get_if<handshake_state::KeyExchanged>(&state_);
    if (!st) {
        return Result<Frames, Error>::err(fail_with(ErrorKind::HandshakeFailed, "CONFIRM before key exchange"));
    }
    if (st->peer_confirmed) {
        return Result<Frames, Error>::err(fail_with(ErrorKind::HandshakeFailed, "duplicate CONFIRM"));
    }

    const Role peer_role = role_ == Role::Initiator ? Role::Responder : Role::Initiator;
    const auto expected = confirmation_tag(*st, peer_role);
    if (!secure_compare(expected, frame.confirmation)) {
        return Result<Frames, Error>::err(
            fail_with(ErrorKind::HandshakeFailed, "peer confirmation does not match"));
    }

    st->peer_confirmed = true;
    maybe_finish();
    return Result<Frames, Error>::ok(Frames{});
}

void Handshake::enter_key_exchanged(PeerIdentity peer, SessionKeys keys,
                                    const PublicKey& initiator_pk, const PublicKey& responder_pk,
                                    const DeviceId& initiator_id, const DeviceId& responder_id) {
    std::vector<uint8_t> data;
    append(data, kTranscriptLabel);
    append(data, initiator_pk);
    append(data, responder_pk);
    append(data, initiator_id.bytes());
    append(data, responder_id.bytes());

    handshake_state::KeyExchanged st;
    st.peer = std::move(peer);
    st.keys = keys;
    st.transcript = hash(data);
    st.auth_code = derive_auth_code(st.transcript);
    state_ = std::move(st);
}

wire::HandshakeFrame Handshake::hello_frame(wire::HandshakeStep step) const {
    wire::HandshakeFrame frame;
    frame.step = step;
    frame.protocol_version = PROTOCOL_VERSION;
    frame.public_key.assign(ephemeral_.public_key.begin(), ephemeral_.public_key.end());
    const auto& id = options_.local_id.bytes();
    frame.device_id.assign(id.begin(), id.end());
    frame.device_name = options_.local_name;
    return frame;
}

wire::HandshakeFrame Handshake::confirm_frame(const handshake_state::KeyExchanged& st) const {
    wire::HandshakeFrame frame;
    frame.step = wire::HandshakeStep::Confirm;
    frame.protocol_version = PROTOCOL_VERSION;
    frame.confirmation = confirmation_tag(st, role_);
    return frame;
}

std::vector<uint8_t> Handshake::confirmation_tag(const handshake_state::KeyExchanged& st,
                                                 Role sender) const {
    // Initiator tx equals responder rx, so both sides order the keys the same way.
    const auto& initiator_tx = role_ == Role::Initiator ? st.keys.tx : st.keys.rx;
    const auto& responder_tx = role_ == Role::Initiator ? st.keys.rx : st.keys.tx;

    std::vector<uint8_t> key_material;
    append(key_material, initiator_tx);
    append(key_material, responder_tx);

    std::span<const uint8_t> secret;
    if (options_.trust == TrustMode::SharedSecret && options_.shared_secret) {
        secret = *options_.shared_secret;
    }
    auto confirm_key = hash(key_material, CONFIRMATION_TAG_SIZE, secret);

    std::vector<uint8_t> data(st.transcript);
    append(data, std::string_view(to_string(sender)));
    auto tag = hash(data, CONFIRMATION_TAG_SIZE, confirm_key);

    secure_zero(confirm_key.data(), confirm_key.size());
    secure_zero(key_material.data(), key_material.size());
    return tag;
}

void Handshake::maybe_finish() {
    auto* st = std::get_if<handshake_state::KeyExchanged>(&state_);
    if (!st || !st->local_confirmed || !st->peer_confirmed) return;

    handshake_state::Authenticated done{std::move(st->peer), st->keys, std::move(st->auth_code)};
    state_ = std::move(done);
}

} // namespace dropline::crypto
