#include <catch2/catch_test_macros.hpp>
#include <rapidcheck.h>
#include "wire/frame_codec.hpp"

#include <algorithm>

using namespace dropline;
using namespace dropline::wire;

namespace {

rc::Gen<std::string> text() {
    return rc::gen::container<std::string>(rc::gen::arbitrary<char>());
}

rc::Gen<std::vector<uint8_t>> bytes() {
    return rc::gen::container<std::vector<uint8_t>>(rc::gen::arbitrary<uint8_t>());
}

rc::Gen<std::vector<uint8_t>> non_empty_bytes() {
    return rc::gen::nonEmpty(bytes());
}

} // namespace

namespace rc {

template<>
struct Arbitrary<FileMetadata> {
    static Gen<FileMetadata> arbitrary() {
        return gen::build<FileMetadata>(
            gen::set(&FileMetadata::index),
            gen::set(&FileMetadata::name, text()),
            gen::set(&FileMetadata::size),
            gen::set(&FileMetadata::content_hash,
                     gen::oneOf(gen::just(std::vector<uint8_t>{}),
                                gen::container<std::vector<uint8_t>>(32, gen::arbitrary<uint8_t>()))),
            gen::set(&FileMetadata::mime_type, text()));
    }
};

template<>
struct Arbitrary<Frame> {
    static Gen<Frame> arbitrary() {
        auto handshake = gen::build<HandshakeFrame>(
            gen::set(&HandshakeFrame::step,
                     gen::element(HandshakeStep::Init, HandshakeStep::Response,
                                  HandshakeStep::Confirm, HandshakeStep::Abort)),
            gen::set(&HandshakeFrame::protocol_version),
            gen::set(&HandshakeFrame::public_key, non_empty_bytes()),
            gen::set(&HandshakeFrame::device_id, bytes()),
            gen::set(&HandshakeFrame::device_name, text()),
            gen::set(&HandshakeFrame::confirmation, bytes()),
            gen::set(&HandshakeFrame::abort_reason, text()));

        auto introduction = gen::build<Introduction>(
            gen::set(&Introduction::sender_name, text()),
            gen::set(&Introduction::files,
                     gen::container<std::vector<FileMetadata>>(gen::arbitrary<FileMetadata>())));

        auto response = gen::build<ManifestResponse>(
            gen::set(&ManifestResponse::status,
                     gen::element(ManifestResponse::Status::Accept, ManifestResponse::Status::Reject)),
            gen::set(&ManifestResponse::reason, text()));

        auto result = gen::build<TransferResult>(
            gen::set(&TransferResult::status,
                     gen::element(TransferResult::Status::Completed,
                                  TransferResult::Status::IntegrityFailure,
                                  TransferResult::Status::Failed)),
            gen::set(&TransferResult::item_index),
            gen::set(&TransferResult::detail, text()));

        auto control = gen::oneOf(
            gen::map(introduction, [](Introduction m) { return ControlMessage{std::move(m)}; }),
            gen::map(response, [](ManifestResponse m) { return ControlMessage{std::move(m)}; }),
            gen::map(text(), [](std::string r) { return ControlMessage{Cancel{std::move(r)}}; }),
            gen::map(result, [](TransferResult m) { return ControlMessage{std::move(m)}; }),
            gen::map(gen::arbitrary<bool>(), [](bool ack) { return ControlMessage{KeepAlive{ack}}; }));

        auto chunk = gen::build<ChunkFrame>(
            gen::set(&ChunkFrame::item_index),
            gen::set(&ChunkFrame::offset),
            gen::set(&ChunkFrame::payload, bytes()));

        auto sealed = gen::build<SealedFrame>(
            gen::set(&SealedFrame::sequence),
            gen::set(&SealedFrame::ciphertext, non_empty_bytes()));

        return gen::oneOf(
            gen::map(handshake, [](HandshakeFrame f) { return Frame{std::move(f)}; }),
            gen::map(control, [](ControlMessage m) { return Frame{ControlFrame{std::move(m)}}; }),
            gen::map(chunk, [](ChunkFrame f) { return Frame{std::move(f)}; }),
            gen::map(sealed, [](SealedFrame f) { return Frame{std::move(f)}; }));
    }
};

} // namespace rc

TEST_CASE("Property: decode(encode(frame)) == frame", "[property][wire]") {
    rc::check("every encoded frame decodes to itself and consumes all bytes",
        [](const Frame& frame) {
            const auto encoded = encode(frame);
            auto outcome = decode(encoded, CodecLimits{64 * 1024 * 1024});
            const auto* decoded = std::get_if<Decoded>(&outcome);
            RC_ASSERT(decoded != nullptr);
            RC_ASSERT(decoded->consumed == encoded.size());
            RC_ASSERT(decoded->frame == frame);
        }
    );
}

TEST_CASE("Property: a frame split anywhere reassembles", "[property][wire]") {
    rc::check("feeding two halves yields the same frame exactly once",
        [](const Frame& frame) {
            const auto encoded = encode(frame);
            const auto split = *rc::gen::inRange<size_t>(0, encoded.size() + 1);

            FrameReader reader(CodecLimits{64 * 1024 * 1024});
            reader.feed(std::span<const uint8_t>(encoded.data(), split));
            auto first = reader.next();
            if (split < encoded.size()) {
                RC_ASSERT(std::holds_alternative<NeedMoreData>(first));
                reader.feed(std::span<const uint8_t>(encoded.data() + split, encoded.size() - split));
                first = reader.next();
            }

            const auto* decoded = std::get_if<Decoded>(&first);
            RC_ASSERT(decoded != nullptr);
            RC_ASSERT(decoded->frame == frame);
            RC_ASSERT(std::holds_alternative<NeedMoreData>(reader.next()));
        }
    );
}

TEST_CASE("Property: truncated input never decodes", "[property][wire]") {
    rc::check("every strict prefix needs more data",
        [](const Frame& frame) {
            const auto encoded = encode(frame);
            const auto cut = *rc::gen::inRange<size_t>(0, encoded.size());
            auto outcome = decode(std::span<const uint8_t>(encoded.data(), cut));
            RC_ASSERT(std::holds_alternative<NeedMoreData>(outcome));
        }
    );
}
