#pragma once

#include "core/result.hpp"
#include "wire/frame.hpp"

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <variant>
#include <vector>

namespace dropline::wire {

constexpr size_t LENGTH_PREFIX_SIZE = 4;
constexpr uint32_t DEFAULT_MAX_FRAME_SIZE = 1024 * 1024;
constexpr uint32_t DEFAULT_MAX_CHUNK_PAYLOAD = 64 * 1024;

struct CodecLimits {
    uint32_t max_frame_size = DEFAULT_MAX_FRAME_SIZE;
};

/**
 * A complete frame was decoded; `consumed` bytes of the input belong to it.
 */
struct Decoded {
    Frame frame;
    size_t consumed = 0;
};

/**
 * The buffer holds a prefix of a frame. `needed` is the total number of
 * bytes the frame occupies once known (prefix included), or the prefix size
 * while the length itself is still incomplete.
 */
struct NeedMoreData {
    size_t needed = LENGTH_PREFIX_SIZE;
};

struct Malformed {
    std::string reason;
};

using DecodeOutcome = std::variant<Decoded, NeedMoreData, Malformed>;

/**
 * Encode a frame as length prefix + protobuf body. Total and deterministic.
 */
[[nodiscard]] std::vector<uint8_t> encode(const Frame& frame);

/**
 * Encode only the protobuf body. Used as the plaintext of a SealedFrame.
 */
[[nodiscard]] std::vector<uint8_t> encode_body(const Frame& frame);

/**
 * Decode one frame from the front of `buffer`. Never reads past the declared
 * length and never allocates for a length over `limits.max_frame_size`.
 */
[[nodiscard]] DecodeOutcome decode(std::span<const uint8_t> buffer,
                                   const CodecLimits& limits = {});

/**
 * Decode a body produced by encode_body. Errors have kind Malformed.
 */
[[nodiscard]] Result<Frame, Error> decode_body(std::span<const uint8_t> body);

/**
 * FrameReader - Owns the accumulation buffer for one byte stream.
 *
 * Usage:
 *   reader.feed(bytes);
 *   for (;;) {
 *       auto out = reader.next();
 *       if (auto* d = std::get_if<Decoded>(&out)) { handle(d->frame); continue; }
 *       if (std::holds_alternative<Malformed>(out)) { drop_connection(); }
 *       break;
 *   }
 */
class FrameReader {
public:
    explicit FrameReader(CodecLimits limits = {});

    void feed(std::span<const uint8_t> bytes);

    /**
     * Decoded consumes the frame from the buffer. Malformed is sticky: the
     * stream cannot be resynchronised after it.
     */
    [[nodiscard]] DecodeOutcome next();

    /**
     * Bytes the reader can accept before it holds a maximal frame. Callers
     * read at most this much from the socket between calls to next().
     */
    [[nodiscard]] size_t space() const;

    [[nodiscard]] size_t buffered() const { return buffer_.size() - offset_; }
    [[nodiscard]] bool failed() const { return !failure_.empty(); }
    [[nodiscard]] const CodecLimits& limits() const { return limits_; }

    void clear();

private:
    CodecLimits limits_;
    std::vector<uint8_t> buffer_;
    size_t offset_ = 0;
    std::string failure_;

    void compact();
};

} // namespace dropline::wire
