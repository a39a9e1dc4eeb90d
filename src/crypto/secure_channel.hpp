#pragma once

#include "core/result.hpp"
#include "crypto/handshake.hpp"
#include "wire/frame.hpp"

#include <optional>

namespace dropline::crypto {

/**
 * SecureChannel - Seals Control and Chunk frames after the handshake.
 *
 * XSalsa20-Poly1305 (crypto_secretbox) with one key per direction. The
 * nonce is the frame's sequence number, little-endian, zero padded; the
 * receiver only accepts sequence numbers above the last one it opened.
 */
class SecureChannel {
public:
    explicit SecureChannel(const SessionKeys& keys);
    ~SecureChannel();

    SecureChannel(const SecureChannel&) = delete;
    SecureChannel& operator=(const SecureChannel&) = delete;

    /**
     * Encrypt an inner ControlFrame or ChunkFrame. InvalidArgument for any
     * other frame type.
     */
    [[nodiscard]] Result<wire::SealedFrame, Error> seal(const wire::Frame& inner);

    /**
     * Decrypt and decode. Malformed on a failed MAC, a replayed or reordered
     * sequence, or an inner frame that is not Control or Chunk.
     */
    [[nodiscard]] Result<wire::Frame, Error> open(const wire::SealedFrame& sealed);

    [[nodiscard]] uint64_t frames_sealed() const { return send_sequence_; }

private:
    SessionKeys keys_;
    uint64_t send_sequence_ = 0;
    std::optional<uint64_t> last_received_;
};

} // namespace dropline::crypto
