#pragma once

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace dropline::wire {

/**
 * Frame types carried on a Dropline connection.
 *
 * These mirror proto/dropline_wire.proto but are plain value types so that
 * the rest of the engine never touches generated protobuf classes.
 */

enum class HandshakeStep : uint8_t {
    Init,
    Response,
    Confirm,
    Abort
};

struct HandshakeFrame {
    HandshakeStep step = HandshakeStep::Init;
    uint32_t protocol_version = 0;
    std::vector<uint8_t> public_key;
    std::vector<uint8_t> device_id;
    std::string device_name;
    std::vector<uint8_t> confirmation;
    std::string abort_reason;

    bool operator==(const HandshakeFrame&) const = default;
};

struct FileMetadata {
    uint32_t index = 0;
    std::string name;
    uint64_t size = 0;
    std::vector<uint8_t> content_hash;  // empty when the sender did not hash
    std::string mime_type;

    bool operator==(const FileMetadata&) const = default;
};

struct Introduction {
    std::string sender_name;
    std::vector<FileMetadata> files;

    bool operator==(const Introduction&) const = default;
};

struct ManifestResponse {
    enum class Status : uint8_t { Accept, Reject };

    Status status = Status::Accept;
    std::string reason;

    bool operator==(const ManifestResponse&) const = default;
};

struct Cancel {
    std::string reason;

    bool operator==(const Cancel&) const = default;
};

struct TransferResult {
    enum class Status : uint8_t { Completed, IntegrityFailure, Failed };

    Status status = Status::Completed;
    uint32_t item_index = 0;
    std::string detail;

    bool operator==(const TransferResult&) const = default;
};

struct KeepAlive {
    bool ack = false;

    bool operator==(const KeepAlive&) const = default;
};

using ControlMessage = std::variant<Introduction, ManifestResponse, Cancel, TransferResult, KeepAlive>;

struct ControlFrame {
    ControlMessage message;

    bool operator==(const ControlFrame&) const = default;
};

struct ChunkFrame {
    uint32_t item_index = 0;
    uint64_t offset = 0;
    std::vector<uint8_t> payload;

    bool operator==(const ChunkFrame&) const = default;
};

/**
 * An encrypted ControlFrame or ChunkFrame. The ciphertext opens to the
 * encoded body (no length prefix) of the inner frame.
 */
struct SealedFrame {
    uint64_t sequence = 0;
    std::vector<uint8_t> ciphertext;

    bool operator==(const SealedFrame&) const = default;
};

using Frame = std::variant<HandshakeFrame, ControlFrame, ChunkFrame, SealedFrame>;

[[nodiscard]] const char* frame_name(const Frame& frame);

} // namespace dropline::wire
