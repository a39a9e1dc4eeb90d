#include <catch2/catch_test_macros.hpp>
#include "network/session_table.hpp"

#include <atomic>
#include <thread>
#include <vector>

using namespace dropline;
using namespace dropline::network;
using transfer::Direction;
using transfer::SessionState;

TEST_CASE("SessionTable: one session per endpoint", "[session_table]") {
    SessionTable table;
    const auto endpoint = DeviceId::generate();
    const auto first = SessionId::generate();

    auto reserved = table.reserve(first, endpoint, Direction::Outgoing, QStringLiteral("phone"));
    REQUIRE(reserved.is_ok());
    REQUIRE(reserved.unwrap().state == SessionState::Connecting);

    auto conflict = table.reserve(SessionId::generate(), endpoint, Direction::Incoming, {});
    REQUIRE(conflict.is_err());
    REQUIRE(conflict.unwrap_err().kind == ErrorKind::SessionConflict);
    REQUIRE(table.find(first)->direction == Direction::Outgoing);

    REQUIRE(table.release(first));
    REQUIRE_FALSE(table.release(first));
    REQUIRE(table.reserve(SessionId::generate(), endpoint, Direction::Incoming, {}).is_ok());
}

TEST_CASE("SessionTable: duplicate session id is refused", "[session_table]") {
    SessionTable table;
    const auto id = SessionId::generate();
    REQUIRE(table.reserve(id, DeviceId::generate(), Direction::Outgoing, {}).is_ok());

    auto dup = table.reserve(id, DeviceId::generate(), Direction::Outgoing, {});
    REQUIRE(dup.unwrap_err().kind == ErrorKind::InvalidArgument);
    REQUIRE(table.size() == 1);
}

TEST_CASE("SessionTable: state and name updates", "[session_table]") {
    SessionTable table;
    const auto id = SessionId::generate();
    const auto endpoint = DeviceId::generate();
    REQUIRE(table.reserve(id, endpoint, Direction::Incoming, {}).is_ok());

    REQUIRE(table.attach(id, SessionState::Negotiating, QStringLiteral("laptop")));
    REQUIRE(table.update_state(id, SessionState::Transferring));

    auto handle = table.find_by_endpoint(endpoint);
    REQUIRE(handle.has_value());
    REQUIRE(handle->peer_name == QStringLiteral("laptop"));
    REQUIRE(handle->state == SessionState::Transferring);

    REQUIRE(table.release(id));
    REQUIRE_FALSE(table.update_state(id, SessionState::Completed));
    REQUIRE_FALSE(table.find_by_endpoint(endpoint).has_value());
}

TEST_CASE("SessionTable: slots are reused after release", "[session_table]") {
    SessionTable table;
    std::vector<SessionId> ids;
    for (int i = 0; i < 8; ++i) {
        ids.push_back(SessionId::generate());
        REQUIRE(table.reserve(ids.back(), DeviceId::generate(), Direction::Outgoing, {}).is_ok());
    }
    for (size_t i = 0; i < ids.size(); i += 2) {
        REQUIRE(table.release(ids[i]));
    }
    REQUIRE(table.size() == 4);
    REQUIRE(table.list().size() == 4);

    for (int i = 0; i < 4; ++i) {
        REQUIRE(table.reserve(SessionId::generate(), DeviceId::generate(), Direction::Incoming, {}).is_ok());
    }
    REQUIRE(table.size() == 8);
}

TEST_CASE("SessionTable: concurrent reservations for one endpoint admit one", "[session_table]") {
    SessionTable table;
    const auto endpoint = DeviceId::generate();
    std::atomic<int> winners{0};
    std::atomic<int> conflicts{0};

    std::vector<std::thread> threads;
    for (int i = 0; i < 16; ++i) {
        threads.emplace_back([&]() {
            auto result = table.reserve(SessionId::generate(), endpoint, Direction::Outgoing, {});
            if (result.is_ok()) {
                ++winners;
            } else if (result.unwrap_err().kind == ErrorKind::SessionConflict) {
                ++conflicts;
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    REQUIRE(winners == 1);
    REQUIRE(conflicts == 15);
    REQUIRE(table.size() == 1);
}

TEST_CASE("SessionTable: rekey moves a slot to the proven endpoint", "[session_table]") {
    SessionTable table;
    const auto id = SessionId::generate();
    const auto by_address = DeviceId::generate();
    const auto proven = DeviceId::generate();
    REQUIRE(table.reserve(id, by_address, Direction::Outgoing, {}).is_ok());

    auto moved = table.rekey(id, proven);
    REQUIRE(moved.is_ok());
    REQUIRE(moved.unwrap().endpoint == proven);
    REQUIRE(table.find_by_endpoint(proven)->id == id);
    REQUIRE_FALSE(table.find_by_endpoint(by_address).has_value());

    // Same endpoint again is a no-op.
    REQUIRE(table.rekey(id, proven).is_ok());
    REQUIRE(table.size() == 1);

    REQUIRE(table.rekey(SessionId::generate(), proven).unwrap_err().kind == ErrorKind::InvalidArgument);
}

TEST_CASE("SessionTable: rekey onto a held endpoint conflicts", "[session_table]") {
    SessionTable table;
    const auto incoming = SessionId::generate();
    const auto outgoing = SessionId::generate();
    const auto peer = DeviceId::generate();
    const auto by_address = DeviceId::generate();
    REQUIRE(table.reserve(incoming, peer, Direction::Incoming, QStringLiteral("phone")).is_ok());
    REQUIRE(table.reserve(outgoing, by_address, Direction::Outgoing, {}).is_ok());

    auto moved = table.rekey(outgoing, peer);
    REQUIRE(moved.is_err());
    REQUIRE(moved.unwrap_err().kind == ErrorKind::SessionConflict);

    REQUIRE(table.find_by_endpoint(peer)->id == incoming);
    REQUIRE(table.find(outgoing)->endpoint == by_address);
    REQUIRE(table.size() == 2);
}
