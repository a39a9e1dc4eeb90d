#include "crypto/secure_channel.hpp"

#include "wire/frame_codec.hpp"

#include <array>

namespace dropline::crypto {

namespace {

using Nonce = std::array<uint8_t, crypto_secretbox_NONCEBYTES>;

Nonce nonce_for(uint64_t sequence) {
    Nonce nonce{};
    for (size_t i = 0; i < 8; ++i) {
        nonce[i] = static_cast<uint8_t>(sequence >> (i * 8));
    }
    return nonce;
}

bool sealable(const wire::Frame& frame) {
    return std::holds_alternative<wire::ControlFrame>(frame) ||
           std::holds_alternative<wire::ChunkFrame>(frame);
}

} // namespace

SecureChannel::SecureChannel(const SessionKeys& keys)
    : keys_(keys)
{
}

SecureChannel::~SecureChannel() {
    secure_zero(keys_.tx.data(), keys_.tx.size());
    secure_zero(keys_.rx.data(), keys_.rx.size());
}

Result<wire::SealedFrame, Error> SecureChannel::seal(const wire::Frame& inner) {
    if (!sealable(inner)) {
        return Result<wire::SealedFrame, Error>::err(Error{
            ErrorKind::InvalidArgument,
            std::string("cannot seal a ") + wire::frame_name(inner) + " frame"});
    }

    const auto plaintext = wire::encode_body(inner);
    const uint64_t sequence = ++send_sequence_;
    const auto nonce = nonce_for(sequence);

    wire::SealedFrame sealed;
    sealed.sequence = sequence;
    sealed.ciphertext.resize(plaintext.size() + crypto_secretbox_MACBYTES);
    crypto_secretbox_easy(sealed.ciphertext.data(), plaintext.data(), plaintext.size(),
                          nonce.data(), keys_.tx.data());
    return Result<wire::SealedFrame, Error>::ok(std::move(sealed));
}

Result<wire::Frame, Error> SecureChannel::open(const wire::SealedFrame& sealed) {
    if (last_received_ && sealed.sequence <= *last_received_) {
        return Result<wire::Frame, Error>::err(Error{
            ErrorKind::Malformed,
            "sequence " + std::to_string(sealed.sequence) + " not after " +
                std::to_string(*last_received_)});
    }
    if (sealed.ciphertext.size() < crypto_secretbox_MACBYTES) {
        return Result<wire::Frame, Error>::err(
            Error{ErrorKind::Malformed, "sealed frame too short"});
    }

    const auto nonce = nonce_for(sealed.sequence);
    std::vector<uint8_t> plaintext(sealed.ciphertext.size() - crypto_secretbox_MACBYTES);
    if (crypto_secretbox_open_easy(plaintext.data(), sealed.ciphertext.data(),
                                   sealed.ciphertext.size(), nonce.data(),
                                   keys_.rx.data()) != 0) {
        return Result<wire::Frame, Error>::err(
            Error{ErrorKind::Malformed, "sealed frame failed authentication"});
    }
    last_received_ = sealed.sequence;

    auto inner = wire::decode_body(plaintext);
    if (inner.is_err()) {
        return inner;
    }
    if (!sealable(inner.unwrap())) {
        return Result<wire::Frame, Error>::err(Error{
            ErrorKind::Malformed,
            std::string("sealed frame carries a ") + wire::frame_name(inner.unwrap()) + " frame"});
    }
    return inner;
}

} // namespace dropline::crypto
