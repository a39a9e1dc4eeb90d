#include <catch2/catch_test_macros.hpp>
#include "network/session_manager.hpp"

#include <QFile>
#include <QFileInfo>
#include <QTemporaryDir>
#include <QTest>
#include <atomic>
#include <map>
#include <thread>

using namespace dropline;
using namespace dropline::network;
using transfer::SessionState;

namespace {

EngineConfig local_config(const QString& name, const QString& download_dir) {
    EngineConfig config;
    config.device.id = DeviceId::generate();
    config.device.name = name;
    config.network.port = 0;
    config.network.handshake_timeout = std::chrono::milliseconds(5000);
    config.discovery.enabled = false;
    config.transfer.download_dir = download_dir;
    config.transfer.progress_interval = std::chrono::milliseconds(0);
    return config;
}

/**
 * Collects the events a manager reports, per session.
 */
struct EventLog {
    std::map<SessionId, std::vector<SessionState>> states;
    std::map<SessionId, std::vector<transfer::ErrorEvent>> errors;

    explicit EventLog(SessionManager& manager) {
        QObject::connect(&manager, &SessionManager::sessionEvent, &manager,
                         [this](const SessionId& id, const transfer::SessionEvent& event) {
                             if (const auto* s = std::get_if<transfer::StateChanged>(&event)) {
                                 states[id].push_back(s->state);
                             }
                             if (const auto* e = std::get_if<transfer::ErrorEvent>(&event)) {
                                 errors[id].push_back(*e);
                             }
                         });
    }

    [[nodiscard]] std::optional<SessionState> terminal(const SessionId& id) const {
        auto it = states.find(id);
        if (it == states.end() || it->second.empty() || !transfer::is_terminal(it->second.back())) {
            return std::nullopt;
        }
        return it->second.back();
    }

    // Any session that ended; the receiver does not know the sender's id.
    [[nodiscard]] std::optional<SessionState> anyTerminal() const {
        for (const auto& [id, list] : states) {
            if (!list.empty() && transfer::is_terminal(list.back())) return list.back();
        }
        return std::nullopt;
    }
};

QString write_file(const QTemporaryDir& dir, const QString& name, const QByteArray& data) {
    const auto path = dir.filePath(name);
    QFile file(path);
    REQUIRE(file.open(QIODevice::WriteOnly));
    REQUIRE(file.write(data) == data.size());
    return path;
}

QByteArray sample(qsizetype size) {
    QByteArray out(size, Qt::Uninitialized);
    for (qsizetype i = 0; i < size; ++i) {
        out[i] = static_cast<char>((i * 31 + 7) & 0xFF);
    }
    return out;
}

} // namespace

TEST_CASE("SessionManager: transfer over localhost completes", "[integration][session]") {
    QTemporaryDir source_dir;
    QTemporaryDir download_dir;
    REQUIRE(source_dir.isValid());
    REQUIRE(download_dir.isValid());

    auto receiver_config = local_config(QStringLiteral("phone"), download_dir.path());
    receiver_config.transfer.auto_accept = true;
    SessionManager receiver(receiver_config);
    SessionManager sender(local_config(QStringLiteral("laptop"), QString()));
    EventLog receiver_log(receiver);
    EventLog sender_log(sender);

    auto port = receiver.start(uint16_t{0});
    if (port.is_err()) {
        SKIP("cannot listen on localhost: " << port.unwrap_err().message);
    }
    REQUIRE(sender.start(uint16_t{0}).is_ok());

    const auto data = sample(1024 * 1024 + 3);
    const auto path = write_file(source_dir, QStringLiteral("photo.jpg"), data);

    int incoming = 0;
    QObject::connect(&receiver, &SessionManager::incomingSession, &receiver,
                     [&](const SessionHandle&) { ++incoming; });

    auto handle = sender.connectToAddress(receiver_config.device.id, QHostAddress(QHostAddress::LocalHost),
                                          port.unwrap(), {path});
    REQUIRE(handle.is_ok());
    const SessionId id = handle.unwrap().id;
    REQUIRE(sender.listActive().size() == 1);
    REQUIRE(sender.listActive()[0].direction == transfer::Direction::Outgoing);

    REQUIRE(QTest::qWaitFor([&]() {
        return sender_log.terminal(id).has_value() && receiver_log.anyTerminal().has_value();
    }, 30000));

    REQUIRE(sender_log.terminal(id) == SessionState::Completed);
    REQUIRE(receiver_log.anyTerminal() == SessionState::Completed);
    REQUIRE(sender_log.states[id] ==
            std::vector<SessionState>{SessionState::Connecting, SessionState::Handshaking,
                                      SessionState::Negotiating, SessionState::Transferring,
                                      SessionState::Completed});
    REQUIRE(sender_log.errors[id].empty());
    REQUIRE(incoming == 1);

    QFile received(download_dir.filePath(QStringLiteral("photo.jpg")));
    REQUIRE(received.open(QIODevice::ReadOnly));
    REQUIRE(received.readAll() == data);

    REQUIRE(sender.listActive().empty());
    REQUIRE(receiver.listActive().empty());
}

TEST_CASE("SessionManager: second session to the same endpoint conflicts", "[integration][session]") {
    QTemporaryDir source_dir;
    REQUIRE(source_dir.isValid());
    const auto path = write_file(source_dir, QStringLiteral("a.txt"), sample(10));

    SessionManager sender(local_config(QStringLiteral("laptop"), QString()));
    EventLog log(sender);

    const DeviceId peer = DeviceId::generate();
    const QHostAddress host(QHostAddress::LocalHost);

    auto first = sender.connectToAddress(peer, host, 9, {path});
    REQUIRE(first.is_ok());

    auto second = sender.connectToAddress(peer, host, 9, {path});
    REQUIRE(second.is_err());
    REQUIRE(second.unwrap_err().kind == ErrorKind::SessionConflict);
    REQUIRE(sender.listActive().size() == 1);

    // Nil ids are keyed by address.
    auto by_address = sender.connectToAddress(DeviceId{}, host, 10, {path});
    REQUIRE(by_address.is_ok());
    auto again = sender.connectToAddress(DeviceId{}, host, 10, {path});
    REQUIRE(again.is_err());
    REQUIRE(again.unwrap_err().kind == ErrorKind::SessionConflict);

    // Cancelled before the connection started.
    const SessionId id = first.unwrap().id;
    REQUIRE(sender.cancel(id).is_ok());
    REQUIRE(log.terminal(id) == SessionState::Cancelled);
    REQUIRE(log.errors[id].size() == 1);
    REQUIRE(log.errors[id][0].kind == ErrorKind::Cancelled);
    REQUIRE(sender.listActive().size() == 1);

    REQUIRE(sender.cancel(id).is_err());
    REQUIRE(sender.connectToAddress(peer, host, 9, {path}).is_ok());
    sender.stop();
    REQUIRE(sender.listActive().empty());
}

TEST_CASE("SessionManager: stop reports sessions that never started", "[integration][session]") {
    QTemporaryDir source_dir;
    REQUIRE(source_dir.isValid());
    const auto path = write_file(source_dir, QStringLiteral("a.txt"), sample(10));

    SessionManager sender(local_config(QStringLiteral("laptop"), QString()));
    EventLog log(sender);

    auto handle = sender.connectToAddress(DeviceId::generate(), QHostAddress(QHostAddress::LocalHost), 9, {path});
    REQUIRE(handle.is_ok());
    const SessionId id = handle.unwrap().id;

    sender.stop();
    REQUIRE(sender.listActive().empty());
    REQUIRE(log.terminal(id) == SessionState::Cancelled);
    REQUIRE(log.errors[id].size() == 1);
    REQUIRE(log.errors[id][0].kind == ErrorKind::Cancelled);

    // The queued start finds nothing to do.
    QTest::qWait(50);
    REQUIRE(log.states[id] == std::vector<SessionState>{SessionState::Cancelled});
}

TEST_CASE("SessionManager: address-keyed session to a device already in a session conflicts",
          "[integration][session]") {
    QTemporaryDir source_dir;
    QTemporaryDir download_dir;
    REQUIRE(source_dir.isValid());
    REQUIRE(download_dir.isValid());

    auto phone_config = local_config(QStringLiteral("phone"), download_dir.path());
    auto laptop_config = local_config(QStringLiteral("laptop"), download_dir.path());
    SessionManager phone(phone_config);
    SessionManager laptop(laptop_config);
    EventLog phone_log(phone);
    EventLog laptop_log(laptop);

    auto phone_port = phone.start(uint16_t{0});
    if (phone_port.is_err()) {
        SKIP("cannot listen on localhost: " << phone_port.unwrap_err().message);
    }
    auto laptop_port = laptop.start(uint16_t{0});
    REQUIRE(laptop_port.is_ok());

    const auto path = write_file(source_dir, QStringLiteral("a.txt"), sample(500));
    const QHostAddress host(QHostAddress::LocalHost);

    std::optional<SessionId> offered;
    QObject::connect(&phone, &SessionManager::transferRequested, &phone,
                     [&](const SessionId& id, const QString&, const QStringList&, quint64) { offered = id; });

    // laptop -> phone, left waiting for the phone's decision.
    auto first = laptop.connectToAddress(phone_config.device.id, host, phone_port.unwrap(), {path});
    REQUIRE(first.is_ok());
    REQUIRE(QTest::qWaitFor([&]() { return offered.has_value(); }, 10000));

    // phone -> laptop by address only; the handshake reveals the laptop.
    auto second = phone.connectToAddress(DeviceId{}, host, laptop_port.unwrap(), {path});
    REQUIRE(second.is_ok());
    const SessionId second_id = second.unwrap().id;
    REQUIRE(QTest::qWaitFor([&]() { return phone_log.terminal(second_id).has_value(); }, 10000));

    REQUIRE(phone_log.terminal(second_id) == SessionState::Failed);
    REQUIRE(phone_log.errors[second_id].size() == 1);
    REQUIRE(phone_log.errors[second_id][0].kind == ErrorKind::SessionConflict);

    // The first session is untouched and still completes.
    const auto active = phone.listActive();
    REQUIRE(active.size() == 1);
    REQUIRE(active[0].id == *offered);
    REQUIRE(active[0].endpoint == laptop_config.device.id);

    REQUIRE(phone.acceptTransfer(*offered).is_ok());
    const SessionId first_id = first.unwrap().id;
    REQUIRE(QTest::qWaitFor([&]() { return laptop_log.terminal(first_id).has_value(); }, 10000));
    REQUIRE(laptop_log.terminal(first_id) == SessionState::Completed);
}

TEST_CASE("SessionManager: peer with a different id than advertised is refused", "[integration][session]") {
    QTemporaryDir source_dir;
    QTemporaryDir download_dir;
    REQUIRE(source_dir.isValid());
    REQUIRE(download_dir.isValid());

    auto receiver_config = local_config(QStringLiteral("phone"), download_dir.path());
    receiver_config.transfer.auto_accept = true;
    SessionManager receiver(receiver_config);
    SessionManager sender(local_config(QStringLiteral("laptop"), QString()));
    EventLog sender_log(sender);

    auto port = receiver.start(uint16_t{0});
    if (port.is_err()) {
        SKIP("cannot listen on localhost: " << port.unwrap_err().message);
    }
    const auto path = write_file(source_dir, QStringLiteral("a.txt"), sample(100));

    auto handle = sender.connectToAddress(DeviceId::generate(), QHostAddress(QHostAddress::LocalHost),
                                          port.unwrap(), {path});
    REQUIRE(handle.is_ok());
    const SessionId id = handle.unwrap().id;
    REQUIRE(QTest::qWaitFor([&]() { return sender_log.terminal(id).has_value(); }, 10000));

    REQUIRE(sender_log.terminal(id) == SessionState::Failed);
    REQUIRE(sender_log.errors[id][0].kind == ErrorKind::HandshakeFailed);
    REQUIRE_FALSE(QFile::exists(download_dir.filePath(QStringLiteral("a.txt"))));
}

TEST_CASE("SessionManager: racing connects to one endpoint admit exactly one", "[integration][session]") {
    QTemporaryDir source_dir;
    REQUIRE(source_dir.isValid());
    const auto path = write_file(source_dir, QStringLiteral("a.txt"), sample(10));

    SessionManager sender(local_config(QStringLiteral("laptop"), QString()));
    const DeviceId peer = DeviceId::generate();
    const QHostAddress host(QHostAddress::LocalHost);

    constexpr int THREADS = 8;
    std::atomic<int> admitted{0};
    std::atomic<int> conflicts{0};
    std::atomic<bool> go{false};
    std::vector<std::thread> threads;
    for (int i = 0; i < THREADS; ++i) {
        threads.emplace_back([&]() {
            while (!go.load()) {
                std::this_thread::yield();
            }
            auto result = sender.connectToAddress(peer, host, 9, {path});
            if (result.is_ok()) {
                ++admitted;
            } else if (result.unwrap_err().kind == ErrorKind::SessionConflict) {
                ++conflicts;
            }
        });
    }
    go = true;
    for (auto& thread : threads) {
        thread.join();
    }

    REQUIRE(admitted == 1);
    REQUIRE(conflicts == THREADS - 1);
    REQUIRE(sender.listActive().size() == 1);
    sender.stop();
}

TEST_CASE("SessionManager: bad requests fail before connecting", "[integration][session]") {
    QTemporaryDir source_dir;
    REQUIRE(source_dir.isValid());
    const auto path = write_file(source_dir, QStringLiteral("a.txt"), sample(10));

    auto config = local_config(QStringLiteral("laptop"), QString());
    SessionManager sender(config);
    const QHostAddress host(QHostAddress::LocalHost);

    SECTION("missing file") {
        auto result = sender.connectToAddress(DeviceId::generate(), host, 9,
                                              {source_dir.filePath(QStringLiteral("missing.txt"))});
        REQUIRE(result.is_err());
        REQUIRE(result.unwrap_err().kind == ErrorKind::IOFailure);
    }

    SECTION("no files") {
        auto result = sender.connectToAddress(DeviceId::generate(), host, 9, {});
        REQUIRE(result.is_err());
        REQUIRE(result.unwrap_err().kind == ErrorKind::InvalidArgument);
    }

    SECTION("no port") {
        auto result = sender.connectToAddress(DeviceId::generate(), host, 0, {path});
        REQUIRE(result.is_err());
        REQUIRE(result.unwrap_err().kind == ErrorKind::InvalidArgument);
    }

    SECTION("this device") {
        auto result = sender.connectToAddress(config.device.id, host, 9, {path});
        REQUIRE(result.is_err());
        REQUIRE(result.unwrap_err().kind == ErrorKind::InvalidArgument);
    }

    REQUIRE(sender.listActive().empty());
}

TEST_CASE("SessionManager: receiver decides on the offer", "[integration][session]") {
    QTemporaryDir source_dir;
    QTemporaryDir download_dir;
    REQUIRE(source_dir.isValid());
    REQUIRE(download_dir.isValid());

    auto receiver_config = local_config(QStringLiteral("phone"), download_dir.path());
    SessionManager receiver(receiver_config);
    SessionManager sender(local_config(QStringLiteral("laptop"), QString()));
    EventLog receiver_log(receiver);
    EventLog sender_log(sender);

    auto port = receiver.start(uint16_t{0});
    if (port.is_err()) {
        SKIP("cannot listen on localhost: " << port.unwrap_err().message);
    }

    const auto a = write_file(source_dir, QStringLiteral("a.txt"), sample(1000));
    const auto b = write_file(source_dir, QStringLiteral("b.txt"), sample(2000));

    std::optional<SessionId> requested;
    QString peer_name;
    QStringList names;
    quint64 total = 0;
    QObject::connect(&receiver, &SessionManager::transferRequested, &receiver,
                     [&](const SessionId& id, const QString& peer, const QStringList& files, quint64 bytes) {
                         requested = id;
                         peer_name = peer;
                         names = files;
                         total = bytes;
                     });

    auto handle = sender.connectToAddress(receiver_config.device.id, QHostAddress(QHostAddress::LocalHost),
                                          port.unwrap(), {a, b});
    REQUIRE(handle.is_ok());
    const SessionId id = handle.unwrap().id;

    REQUIRE(QTest::qWaitFor([&]() { return requested.has_value(); }, 10000));
    REQUIRE(peer_name == QStringLiteral("laptop"));
    REQUIRE(names == QStringList{QStringLiteral("a.txt"), QStringLiteral("b.txt")});
    REQUIRE(total == 3000);
    REQUIRE(receiver.sessionItems(*requested).size() == 2);
    REQUIRE(receiver.listActive().size() == 1);
    REQUIRE(receiver.listActive()[0].direction == transfer::Direction::Incoming);

    SECTION("accept") {
        REQUIRE(receiver.acceptTransfer(*requested).is_ok());
        REQUIRE(QTest::qWaitFor([&]() { return sender_log.terminal(id).has_value(); }, 10000));
        REQUIRE(sender_log.terminal(id) == SessionState::Completed);
        REQUIRE(QFileInfo(download_dir.filePath(QStringLiteral("b.txt"))).size() == 2000);
    }

    SECTION("reject") {
        REQUIRE(receiver.rejectTransfer(*requested, QStringLiteral("busy")).is_ok());
        REQUIRE(QTest::qWaitFor([&]() { return sender_log.terminal(id).has_value(); }, 10000));
        REQUIRE(sender_log.terminal(id) == SessionState::Failed);
        REQUIRE(sender_log.errors[id][0].kind == ErrorKind::Rejected);
        REQUIRE(receiver_log.terminal(*requested) == SessionState::Failed);
    }

    SECTION("sender cancels while the receiver decides") {
        REQUIRE(sender.cancel(id).is_ok());
        REQUIRE(sender_log.terminal(id) == SessionState::Cancelled);
        REQUIRE(QTest::qWaitFor([&]() { return receiver_log.terminal(*requested).has_value(); }, 10000));
        REQUIRE(receiver_log.terminal(*requested) == SessionState::Cancelled);
        REQUIRE(receiver.acceptTransfer(*requested).is_err());
    }
}

TEST_CASE("SessionManager: invite secret gates incoming sessions", "[integration][session]") {
    QTemporaryDir source_dir;
    QTemporaryDir download_dir;
    REQUIRE(source_dir.isValid());
    REQUIRE(download_dir.isValid());

    auto receiver_config = local_config(QStringLiteral("phone"), download_dir.path());
    receiver_config.transfer.auto_accept = true;
    SessionManager receiver(receiver_config);
    SessionManager sender(local_config(QStringLiteral("laptop"), QString()));
    EventLog sender_log(sender);

    auto port = receiver.start(uint16_t{0});
    if (port.is_err()) {
        SKIP("cannot listen on localhost: " << port.unwrap_err().message);
    }

    auto invite = receiver.createInvite(QHostAddress(QHostAddress::LocalHost));
    REQUIRE(invite.port == port.unwrap());
    REQUIRE(invite.device_id == receiver_config.device.id);

    const auto path = write_file(source_dir, QStringLiteral("a.txt"), sample(4096));

    SECTION("matching secret") {
        auto handle = sender.connectToInvite(invite, {path});
        REQUIRE(handle.is_ok());
        const SessionId id = handle.unwrap().id;
        REQUIRE(QTest::qWaitFor([&]() { return sender_log.terminal(id).has_value(); }, 10000));
        REQUIRE(sender_log.terminal(id) == SessionState::Completed);
    }

    SECTION("wrong secret") {
        invite.secret[0] ^= 0x01;
        auto handle = sender.connectToInvite(invite, {path});
        REQUIRE(handle.is_ok());
        const SessionId id = handle.unwrap().id;
        REQUIRE(QTest::qWaitFor([&]() { return sender_log.terminal(id).has_value(); }, 10000));
        REQUIRE(sender_log.terminal(id) == SessionState::Failed);
        REQUIRE_FALSE(QFile::exists(download_dir.filePath(QStringLiteral("a.txt"))));
    }
}
