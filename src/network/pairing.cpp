#include "network/pairing.hpp"
#include <QJsonDocument>
#include <QJsonObject>

namespace dropline::network {

namespace {

Result<PairingInvite, Error> invalid(std::string message) {
    return Result<PairingInvite, Error>::err(Error{ErrorKind::Malformed, std::move(message)});
}

} // namespace

PairingInvite make_invite(const DeviceId& device_id,
                          const QString& device_name,
                          const QHostAddress& address,
                          uint16_t port) {
    PairingInvite invite;
    invite.device_id = device_id;
    invite.device_name = device_name;
    invite.address = address;
    invite.port = port;
    invite.secret = crypto::generate_shared_secret();
    return invite;
}

QString generate_invite_json(const PairingInvite& invite) {
    QJsonObject obj;
    obj["v"] = PairingInvite::VERSION;
    obj["id"] = QString::fromStdString(invite.device_id.to_string());
    obj["name"] = invite.device_name;
    obj["addr"] = invite.address.toString();
    obj["port"] = invite.port;
    obj["secret"] = QString::fromStdString(crypto::to_base64(invite.secret, true));

    return QString::fromUtf8(QJsonDocument(obj).toJson(QJsonDocument::Compact));
}

Result<PairingInvite, Error> parse_invite_json(const QString& json) {
    QJsonParseError error;
    auto doc = QJsonDocument::fromJson(json.toUtf8(), &error);

    if (error.error != QJsonParseError::NoError || !doc.isObject()) {
        return invalid("Invalid JSON: " + error.errorString().toStdString());
    }

    auto obj = doc.object();

    if (obj["v"].toInt() != PairingInvite::VERSION) {
        return invalid("Unsupported version");
    }

    PairingInvite invite;

    auto id = Uuid::parse(obj["id"].toString().toStdString());
    if (!id || id->is_nil()) {
        return invalid("Invalid device ID");
    }
    invite.device_id = *id;
    invite.device_name = obj["name"].toString();

    invite.address = QHostAddress(obj["addr"].toString());
    if (invite.address.isNull()) {
        return invalid("Invalid address");
    }

    const int port = obj["port"].toInt(-1);
    if (port <= 0 || port > 0xFFFF) {
        return invalid("Invalid port");
    }
    invite.port = static_cast<uint16_t>(port);

    auto secret = crypto::from_base64(obj["secret"].toString().toStdString(), true);
    if (secret.is_err() || secret.unwrap().size() != crypto::SHARED_SECRET_SIZE) {
        return invalid("Invalid secret");
    }
    const auto& bytes = secret.unwrap();
    std::copy(bytes.begin(), bytes.end(), invite.secret.begin());

    return Result<PairingInvite, Error>::ok(invite);
}

} // namespace dropline::network
