#include <catch2/catch_test_macros.hpp>
#include "crypto/handshake.hpp"

#include <algorithm>
#include <utility>

using namespace dropline;
using namespace dropline::crypto;

namespace {

HandshakeOptions options_for(const char* name, TrustMode trust = TrustMode::Implicit,
                             std::optional<SharedSecret> secret = std::nullopt) {
    HandshakeOptions options;
    options.trust = trust;
    options.shared_secret = secret;
    options.local_id = DeviceId::generate();
    options.local_name = name;
    return options;
}

// Delivers every frame produced by one side to the other until both go quiet.
void exchange(Handshake& initiator, Handshake& responder) {
    auto init = initiator.start();
    REQUIRE(init.is_ok());

    std::vector<wire::HandshakeFrame> to_responder{init.unwrap()};
    std::vector<wire::HandshakeFrame> to_initiator;
    while (!to_responder.empty() || !to_initiator.empty()) {
        for (const auto& frame : std::exchange(to_responder, {})) {
            auto out = responder.receive(frame);
            if (out.is_err()) return;
            for (auto& f : out.unwrap()) to_initiator.push_back(std::move(f));
        }
        for (const auto& frame : std::exchange(to_initiator, {})) {
            auto out = initiator.receive(frame);
            if (out.is_err()) return;
            for (auto& f : out.unwrap()) to_responder.push_back(std::move(f));
        }
    }
}

} // namespace

TEST_CASE("Handshake: implicit trust authenticates both sides", "[handshake]") {
    auto a_options = options_for("laptop");
    auto b_options = options_for("phone");
    const auto a_id = a_options.local_id;
    const auto b_id = b_options.local_id;

    Handshake a(Role::Initiator, a_options);
    Handshake b(Role::Responder, b_options);
    exchange(a, b);

    REQUIRE(a.is_authenticated());
    REQUIRE(b.is_authenticated());
    REQUIRE(a.peer()->device_id == b_id);
    REQUIRE(a.peer()->device_name == "phone");
    REQUIRE(b.peer()->device_id == a_id);

    REQUIRE(a.auth_code() == b.auth_code());
    REQUIRE(a.auth_code()->size() == 4);

    REQUIRE(a.keys()->tx == b.keys()->rx);
    REQUIRE(a.keys()->rx == b.keys()->tx);
}

TEST_CASE("Handshake: every exchange derives fresh session keys", "[handshake]") {
    auto a_options = options_for("laptop");
    auto b_options = options_for("phone");

    Handshake a1(Role::Initiator, a_options);
    Handshake b1(Role::Responder, b_options);
    exchange(a1, b1);
    Handshake a2(Role::Initiator, a_options);
    Handshake b2(Role::Responder, b_options);
    exchange(a2, b2);

    REQUIRE(a1.is_authenticated());
    REQUIRE(a2.is_authenticated());
    REQUIRE(a1.keys()->tx != a2.keys()->tx);
    REQUIRE(a1.keys()->rx != a2.keys()->rx);
    REQUIRE(a1.keys()->tx != a1.keys()->rx);
}

TEST_CASE("Handshake: pin confirmation waits for both users", "[handshake]") {
    Handshake a(Role::Initiator, options_for("a", TrustMode::PinConfirmation));
    Handshake b(Role::Responder, options_for("b", TrustMode::PinConfirmation));
    exchange(a, b);

    REQUIRE(a.awaiting_local_confirmation());
    REQUIRE(b.awaiting_local_confirmation());
    REQUIRE(a.auth_code() == b.auth_code());

    auto a_confirm = a.confirm_local(true);
    REQUIRE(a_confirm.is_ok());
    REQUIRE(a_confirm.unwrap().size() == 1);
    REQUIRE(b.receive(a_confirm.unwrap()[0]).is_ok());
    REQUIRE_FALSE(b.is_authenticated());

    auto b_confirm = b.confirm_local(true);
    REQUIRE(b_confirm.is_ok());
    REQUIRE(b.is_authenticated());
    REQUIRE(a.receive(b_confirm.unwrap()[0]).is_ok());
    REQUIRE(a.is_authenticated());
}

TEST_CASE("Handshake: rejecting the code fails and yields an abort", "[handshake]") {
    Handshake a(Role::Initiator, options_for("a", TrustMode::PinConfirmation));
    Handshake b(Role::Responder, options_for("b", TrustMode::PinConfirmation));
    exchange(a, b);

    auto rejected = b.confirm_local(false);
    REQUIRE(rejected.is_ok());
    REQUIRE(rejected.unwrap()[0].step == wire::HandshakeStep::Abort);
    REQUIRE(b.is_failed());

    auto seen = a.receive(rejected.unwrap()[0]);
    REQUIRE(seen.is_err());
    REQUIRE(seen.unwrap_err().kind == ErrorKind::HandshakeFailed);
    REQUIRE(a.is_failed());
}

TEST_CASE("Handshake: shared secret must match", "[handshake]") {
    const auto secret = generate_shared_secret();

    SECTION("same secret") {
        Handshake a(Role::Initiator, options_for("a", TrustMode::SharedSecret, secret));
        Handshake b(Role::Responder, options_for("b", TrustMode::SharedSecret, secret));
        exchange(a, b);
        REQUIRE(a.is_authenticated());
        REQUIRE(b.is_authenticated());
    }

    SECTION("different secret") {
        Handshake a(Role::Initiator, options_for("a", TrustMode::SharedSecret, generate_shared_secret()));
        Handshake b(Role::Responder, options_for("b", TrustMode::SharedSecret, secret));
        exchange(a, b);
        REQUIRE_FALSE(a.is_authenticated());
        REQUIRE(a.is_failed());
        REQUIRE(a.error()->kind == ErrorKind::HandshakeFailed);
    }
}

TEST_CASE("Handshake: bad hello frames fail the handshake", "[handshake]") {
    Handshake a(Role::Initiator, options_for("a"));
    auto init = a.start().unwrap();

    SECTION("wrong protocol version") {
        init.protocol_version = 99;
        Handshake b(Role::Responder, options_for("b"));
        REQUIRE(b.receive(init).is_err());
        REQUIRE(b.is_failed());
    }

    SECTION("all-zero public key") {
        std::fill(init.public_key.begin(), init.public_key.end(), 0);
        Handshake b(Role::Responder, options_for("b"));
        REQUIRE(b.receive(init).is_err());
    }

    SECTION("nil device id") {
        std::fill(init.device_id.begin(), init.device_id.end(), 0);
        Handshake b(Role::Responder, options_for("b"));
        REQUIRE(b.receive(init).is_err());
    }
}

TEST_CASE("Handshake: misuse is refused", "[handshake]") {
    Handshake responder(Role::Responder, options_for("b"));
    REQUIRE(responder.start().is_err());

    Handshake initiator(Role::Initiator, options_for("a"));
    REQUIRE(initiator.start().is_ok());
    REQUIRE(initiator.start().is_err());
    REQUIRE(initiator.confirm_local(true).is_err());

    initiator.fail(Error{ErrorKind::Timeout, "handshake timed out"});
    REQUIRE(initiator.error()->kind == ErrorKind::Timeout);
    initiator.fail(Error{ErrorKind::IOFailure, "later"});
    REQUIRE(initiator.error()->kind == ErrorKind::Timeout);
}

TEST_CASE("derive_auth_code is four digits and deterministic", "[handshake]") {
    const std::vector<uint8_t> transcript(32, 7);
    const auto code = derive_auth_code(transcript);
    REQUIRE(code.size() == 4);
    REQUIRE(code == derive_auth_code(transcript));
}
