#include <catch2/catch_test_macros.hpp>
#include "network/pairing.hpp"

#include <QJsonDocument>
#include <QJsonObject>

using namespace dropline;
using namespace dropline::network;

TEST_CASE("Pairing invite survives JSON", "[pairing]") {
    const auto invite = make_invite(DeviceId::generate(), QStringLiteral("Desk"),
                                    QHostAddress(QStringLiteral("192.168.1.100")), 9300);
    REQUIRE_FALSE(crypto::is_all_zero(invite.secret));

    auto parsed = parse_invite_json(generate_invite_json(invite));
    REQUIRE(parsed.is_ok());
    const auto& out = parsed.unwrap();
    REQUIRE(out.device_id == invite.device_id);
    REQUIRE(out.device_name == QStringLiteral("Desk"));
    REQUIRE(out.address == invite.address);
    REQUIRE(out.port == 9300);
    REQUIRE(out.secret == invite.secret);
}

TEST_CASE("Pairing invites are fresh each time", "[pairing]") {
    const auto id = DeviceId::generate();
    const QHostAddress address(QHostAddress::LocalHost);
    REQUIRE(make_invite(id, QStringLiteral("a"), address, 1).secret !=
            make_invite(id, QStringLiteral("a"), address, 1).secret);
}

TEST_CASE("Pairing invite: bad payloads are malformed", "[pairing]") {
    const auto good = generate_invite_json(make_invite(
        DeviceId::generate(), QStringLiteral("Desk"), QHostAddress(QHostAddress::LocalHost), 9300));
    auto object = QJsonDocument::fromJson(good.toUtf8()).object();

    auto with = [&](const QString& key, const QJsonValue& value) {
        auto copy = object;
        copy.insert(key, value);
        return QString::fromUtf8(QJsonDocument(copy).toJson(QJsonDocument::Compact));
    };

    REQUIRE(parse_invite_json(QStringLiteral("not json")).unwrap_err().kind == ErrorKind::Malformed);
    REQUIRE(parse_invite_json(with(QStringLiteral("v"), 2)).is_err());
    REQUIRE(parse_invite_json(with(QStringLiteral("secret"), QStringLiteral("c2hvcnQ"))).is_err());
    REQUIRE(parse_invite_json(with(QStringLiteral("port"), 0)).is_err());
    REQUIRE(parse_invite_json(with(QStringLiteral("addr"), QStringLiteral("nowhere"))).is_err());
}
