#include "wire/frame_codec.hpp"

#include "dropline_wire.pb.h"

#include <algorithm>
#include <type_traits>

namespace dropline::wire {

namespace {

template<class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template<class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

std::string to_pb_bytes(const std::vector<uint8_t>& bytes) {
    return std::string(bytes.begin(), bytes.end());
}

std::vector<uint8_t> from_pb_bytes(const std::string& bytes) {
    return std::vector<uint8_t>(bytes.begin(), bytes.end());
}

Error malformed(std::string message) {
    return Error{ErrorKind::Malformed, std::move(message)};
}

// ---------------------------------------------------------------------------
// C++ -> protobuf
// ---------------------------------------------------------------------------

pb::HandshakeFrame::Step step_to_pb(HandshakeStep step) {
    switch (step) {
        case HandshakeStep::Init: return pb::HandshakeFrame::INIT;
        case HandshakeStep::Response: return pb::HandshakeFrame::RESPONSE;
        case HandshakeStep::Confirm: return pb::HandshakeFrame::CONFIRM;
        case HandshakeStep::Abort: return pb::HandshakeFrame::ABORT;
    }
    return pb::HandshakeFrame::STEP_UNSPECIFIED;
}

void fill(pb::HandshakeFrame& out, const HandshakeFrame& in) {
    out.set_step(step_to_pb(in.step));
    out.set_protocol_version(in.protocol_version);
    out.set_public_key(to_pb_bytes(in.public_key));
    out.set_device_id(to_pb_bytes(in.device_id));
    out.set_device_name(in.device_name);
    out.set_confirmation(to_pb_bytes(in.confirmation));
    out.set_abort_reason(in.abort_reason);
}

void fill(pb::ControlFrame& out, const ControlFrame& in) {
    std::visit(overloaded{
        [&](const Introduction& intro) {
            auto* pb_intro = out.mutable_introduction();
            pb_intro->set_sender_name(intro.sender_name);
            for (const auto& file : intro.files) {
                auto* meta = pb_intro->add_files();
                meta->set_index(file.index);
                meta->set_name(file.name);
                meta->set_size(file.size);
                meta->set_content_hash(to_pb_bytes(file.content_hash));
                meta->set_mime_type(file.mime_type);
            }
        },
        [&](const ManifestResponse& response) {
            auto* pb_response = out.mutable_response();
            pb_response->set_status(response.status == ManifestResponse::Status::Accept
                                        ? pb::ManifestResponse::ACCEPT
                                        : pb::ManifestResponse::REJECT);
            pb_response->set_reason(response.reason);
        },
        [&](const Cancel& cancel) {
            out.mutable_cancel()->set_reason(cancel.reason);
        },
        [&](const TransferResult& result) {
            auto* pb_result = out.mutable_result();
            switch (result.status) {
                case TransferResult::Status::Completed:
                    pb_result->set_status(pb::TransferResult::COMPLETED);
                    break;
                case TransferResult::Status::IntegrityFailure:
                    pb_result->set_status(pb::TransferResult::INTEGRITY_FAILURE);
                    break;
                case TransferResult::Status::Failed:
                    pb_result->set_status(pb::TransferResult::FAILED);
                    break;
            }
            pb_result->set_item_index(result.item_index);
            pb_result->set_detail(result.detail);
        },
        [&](const KeepAlive& keep_alive) {
            out.mutable_keep_alive()->set_ack(keep_alive.ack);
        },
    }, in.message);
}

pb::WireFrame to_pb(const Frame& frame) {
    pb::WireFrame out;
    std::visit(overloaded{
        [&](const HandshakeFrame& handshake) { fill(*out.mutable_handshake(), handshake); },
        [&](const ControlFrame& control) { fill(*out.mutable_control(), control); },
        [&](const ChunkFrame& chunk) {
            auto* pb_chunk = out.mutable_chunk();
            pb_chunk->set_item_index(chunk.item_index);
            pb_chunk->set_offset(chunk.offset);
            pb_chunk->set_payload(to_pb_bytes(chunk.payload));
        },
        [&](const SealedFrame& sealed) {
            auto* pb_sealed = out.mutable_sealed();
            pb_sealed->set_sequence(sealed.sequence);
            pb_sealed->set_ciphertext(to_pb_bytes(sealed.ciphertext));
        },
    }, frame);
    return out;
}

// ---------------------------------------------------------------------------
// protobuf -> C++ (with required-field checks)
// ---------------------------------------------------------------------------

Result<Frame, Error> from_pb(const pb::HandshakeFrame& in) {
    HandshakeFrame out;
    switch (in.step()) {
        case pb::HandshakeFrame::INIT: out.step = HandshakeStep::Init; break;
        case pb::HandshakeFrame::RESPONSE: out.step = HandshakeStep::Response; break;
        case pb::HandshakeFrame::CONFIRM: out.step = HandshakeStep::Confirm; break;
        case pb::HandshakeFrame::ABORT: out.step = HandshakeStep::Abort; break;
        default:
            return Result<Frame, Error>::err(malformed("handshake frame without step"));
    }
    if ((out.step == HandshakeStep::Init || out.step == HandshakeStep::Response) &&
        in.public_key().empty()) {
        return Result<Frame, Error>::err(malformed("key exchange frame without public key"));
    }
    out.protocol_version = in.protocol_version();
    out.public_key = from_pb_bytes(in.public_key());
    out.device_id = from_pb_bytes(in.device_id());
    out.device_name = in.device_name();
    out.confirmation = from_pb_bytes(in.confirmation());
    out.abort_reason = in.abort_reason();
    return Result<Frame, Error>::ok(Frame{std::move(out)});
}

Result<Frame, Error> from_pb(const pb::ControlFrame& in) {
    ControlFrame out;
    switch (in.kind_case()) {
        case pb::ControlFrame::kIntroduction: {
            Introduction intro;
            intro.sender_name = in.introduction().sender_name();
            intro.files.reserve(static_cast<size_t>(in.introduction().files_size()));
            for (const auto& meta : in.introduction().files()) {
                FileMetadata file;
                file.index = meta.index();
                file.name = meta.name();
                file.size = meta.size();
                file.content_hash = from_pb_bytes(meta.content_hash());
                file.mime_type = meta.mime_type();
                intro.files.push_back(std::move(file));
            }
            out.message = std::move(intro);
            break;
        }
        case pb::ControlFrame::kResponse: {
            ManifestResponse response;
            switch (in.response().status()) {
                case pb::ManifestResponse::ACCEPT:
                    response.status = ManifestResponse::Status::Accept;
                    break;
                case pb::ManifestResponse::REJECT:
                    response.status = ManifestResponse::Status::Reject;
                    break;
                default:
                    return Result<Frame, Error>::err(malformed("manifest response without status"));
            }
            response.reason = in.response().reason();
            out.message = std::move(response);
            break;
        }
        case pb::ControlFrame::kCancel:
            out.message = Cancel{in.cancel().reason()};
            break;
        case pb::ControlFrame::kResult: {
            TransferResult result;
            switch (in.result().status()) {
                case pb::TransferResult::COMPLETED:
                    result.status = TransferResult::Status::Completed;
                    break;
                case pb::TransferResult::INTEGRITY_FAILURE:
                    result.status = TransferResult::Status::IntegrityFailure;
                    break;
                case pb::TransferResult::FAILED:
                    result.status = TransferResult::Status::Failed;
                    break;
                default:
                    return Result<Frame, Error>::err(malformed("transfer result without status"));
            }
            result.item_index = in.result().item_index();
            result.detail = in.result().detail();
            out.message = std::move(result);
            break;
        }
        case pb::ControlFrame::kKeepAlive:
            out.message = KeepAlive{in.keep_alive().ack()};
            break;
        default:
            return Result<Frame, Error>::err(malformed("control frame without message"));
    }
    return Result<Frame, Error>::ok(Frame{std::move(out)});
}

Result<Frame, Error> from_pb(const pb::WireFrame& in) {
    switch (in.kind_case()) {
        case pb::WireFrame::kHandshake:
            return from_pb(in.handshake());
        case pb::WireFrame::kControl:
            return from_pb(in.control());
        case pb::WireFrame::kChunk: {
            if (!in.chunk().has_payload()) {
                return Result<Frame, Error>::err(malformed("chunk frame without payload"));
            }
            ChunkFrame chunk;
            chunk.item_index = in.chunk().item_index();
            chunk.offset = in.chunk().offset();
            chunk.payload = from_pb_bytes(in.chunk().payload());
            return Result<Frame, Error>::ok(Frame{std::move(chunk)});
        }
        case pb::WireFrame::kSealed: {
            if (in.sealed().ciphertext().empty()) {
                return Result<Frame, Error>::err(malformed("sealed frame without ciphertext"));
            }
            SealedFrame sealed;
            sealed.sequence = in.sealed().sequence();
            sealed.ciphertext = from_pb_bytes(in.sealed().ciphertext());
            return Result<Frame, Error>::ok(Frame{std::move(sealed)});
        }
        default:
            return Result<Frame, Error>::err(malformed("frame without kind"));
    }
}

uint32_t read_length(const uint8_t* data) {
    return (static_cast<uint32_t>(data[0]) << 24) |
           (static_cast<uint32_t>(data[1]) << 16) |
           (static_cast<uint32_t>(data[2]) << 8) |
           static_cast<uint32_t>(data[3]);
}

} // namespace

const char* frame_name(const Frame& frame) {
    return std::visit(overloaded{
        [](const HandshakeFrame&) { return "handshake"; },
        [](const ControlFrame&) { return "control"; },
        [](const ChunkFrame&) { return "chunk"; },
        [](const SealedFrame&) { return "sealed"; },
    }, frame);
}

std::vector<uint8_t> encode_body(const Frame& frame) {
    const auto message = to_pb(frame);
    std::vector<uint8_t> out(message.ByteSizeLong());
    if (!out.empty()) {
        message.SerializeWithCachedSizesToArray(out.data());
    }
    return out;
}

std::vector<uint8_t> encode(const Frame& frame) {
    const auto message = to_pb(frame);
    const auto body_size = message.ByteSizeLong();
    const auto length = static_cast<uint32_t>(body_size);

    std::vector<uint8_t> out(LENGTH_PREFIX_SIZE + body_size);
    out[0] = static_cast<uint8_t>((length >> 24) & 0xFF);
    out[1] = static_cast<uint8_t>((length >> 16) & 0xFF);
    out[2] = static_cast<uint8_t>((length >> 8) & 0xFF);
    out[3] = static_cast<uint8_t>(length & 0xFF);
    if (body_size > 0) {
        message.SerializeWithCachedSizesToArray(out.data() + LENGTH_PREFIX_SIZE);
    }
    return out;
}

Result<Frame, Error> decode_body(std::span<const uint8_t> body) {
    pb::WireFrame message;
    if (!message.ParseFromArray(body.data(), static_cast<int>(body.size()))) {
        return Result<Frame, Error>::err(malformed("frame body does not parse"));
    }
    return from_pb(message);
}

DecodeOutcome decode(std::span<const uint8_t> buffer, const CodecLimits& limits) {
    if (buffer.size() < LENGTH_PREFIX_SIZE) {
        return NeedMoreData{LENGTH_PREFIX_SIZE};
    }

    const uint32_t length = read_length(buffer.data());
    if (length > limits.max_frame_size) {
        return Malformed{"declared length " + std::to_string(length) +
                         " exceeds limit " + std::to_string(limits.max_frame_size)};
    }
    if (length == 0) {
        return Malformed{"empty frame"};
    }

    const size_t total = LENGTH_PREFIX_SIZE + length;
    if (buffer.size() < total) {
        return NeedMoreData{total};
    }

    auto frame = decode_body(buffer.subspan(LENGTH_PREFIX_SIZE, length));
    if (frame.is_err()) {
        return Malformed{frame.unwrap_err().message};
    }
    return Decoded{std::move(frame).unwrap(), total};
}

// ============================================================================
// FrameReader
// ============================================================================

FrameReader::FrameReader(CodecLimits limits)
    : limits_(limits)
{
}

void FrameReader::feed(std::span<const uint8_t> bytes) {
    if (failed() || bytes.empty()) {
        return;
    }
    compact();
    buffer_.insert(buffer_.end(), bytes.begin(), bytes.end());
}

DecodeOutcome FrameReader::next() {
    if (failed()) {
        return Malformed{failure_};
    }

    auto outcome = decode(std::span<const uint8_t>(buffer_).subspan(offset_), limits_);
    if (auto* decoded = std::get_if<Decoded>(&outcome)) {
        offset_ += decoded->consumed;
        if (offset_ == buffer_.size()) {
            buffer_.clear();
            offset_ = 0;
        }
    } else if (auto* bad = std::get_if<Malformed>(&outcome)) {
        failure_ = bad->reason;
        buffer_.clear();
        offset_ = 0;
    }
    return outcome;
}

size_t FrameReader::space() const {
    const size_t cap = LENGTH_PREFIX_SIZE + limits_.max_frame_size;
    const size_t held = buffered();
    return held >= cap ? 0 : cap - held;
}

void FrameReader::clear() {
    buffer_.clear();
    offset_ = 0;
    failure_.clear();
}

void FrameReader::compact() {
    if (offset_ == 0) return;
    buffer_.erase(buffer_.begin(), buffer_.begin() + static_cast<std::ptrdiff_t>(offset_));
    offset_ = 0;
}

} // namespace dropline::wire
