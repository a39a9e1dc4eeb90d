#include <catch2/catch_test_macros.hpp>
#include "crypto/secure_channel.hpp"

using namespace dropline;
using namespace dropline::crypto;

namespace {

std::pair<SessionKeys, SessionKeys> paired_keys() {
    SessionKeys a;
    SessionKeys b;
    randombytes_buf(a.tx.data(), a.tx.size());
    randombytes_buf(a.rx.data(), a.rx.size());
    b.tx = a.rx;
    b.rx = a.tx;
    return {a, b};
}

} // namespace

TEST_CASE("SecureChannel: sealed frames open on the other side", "[secure_channel]") {
    auto [ka, kb] = paired_keys();
    SecureChannel a(ka);
    SecureChannel b(kb);

    const wire::Frame chunk = wire::ChunkFrame{1, 4096, std::vector<uint8_t>(100, 0x42)};
    auto sealed = a.seal(chunk);
    REQUIRE(sealed.is_ok());
    REQUIRE(sealed.unwrap().sequence == 1);

    auto opened = b.open(sealed.unwrap());
    REQUIRE(opened.is_ok());
    REQUIRE(opened.unwrap() == chunk);
}

TEST_CASE("SecureChannel: tampering, replay and reordering are rejected", "[secure_channel]") {
    auto [ka, kb] = paired_keys();
    SecureChannel a(ka);
    SecureChannel b(kb);

    auto first = a.seal(wire::ControlFrame{wire::KeepAlive{}}).unwrap();
    auto second = a.seal(wire::ControlFrame{wire::Cancel{"bye"}}).unwrap();

    auto tampered = first;
    tampered.ciphertext.back() ^= 0x01;
    REQUIRE(b.open(tampered).unwrap_err().kind == ErrorKind::Malformed);

    REQUIRE(b.open(second).is_ok());
    REQUIRE(b.open(first).is_err());
    REQUIRE(b.open(second).is_err());
}

TEST_CASE("SecureChannel: wrong direction key cannot open", "[secure_channel]") {
    auto [ka, kb] = paired_keys();
    SecureChannel a(ka);
    SecureChannel also_a(ka);

    auto sealed = a.seal(wire::ControlFrame{wire::KeepAlive{}}).unwrap();
    REQUIRE(also_a.open(sealed).is_err());
}

TEST_CASE("SecureChannel: only control and chunk frames are sealed", "[secure_channel]") {
    auto [ka, kb] = paired_keys();
    SecureChannel a(ka);

    wire::HandshakeFrame hello;
    hello.step = wire::HandshakeStep::Abort;
    auto sealed = a.seal(hello);
    REQUIRE(sealed.is_err());
    REQUIRE(sealed.unwrap_err().kind == ErrorKind::InvalidArgument);
    REQUIRE(a.frames_sealed() == 0);
}
