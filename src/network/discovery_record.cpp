#include "network/discovery_record.hpp"

#include "crypto/keys.hpp"

#include <charconv>
#include <optional>

namespace dropline::network {
namespace {

constexpr char kMagic[] = {'D', 'L', 'D', '1'};
constexpr size_t kMagicSize = sizeof(kMagic);
constexpr size_t kMaxTxtString = 255;

Result<AdvertisementInfo, Error> malformed(std::string message) {
    return Result<AdvertisementInfo, Error>::err(Error{ErrorKind::Malformed, std::move(message)});
}

template<typename T>
std::optional<T> parse_number(const std::string& text, int base = 10) {
    T value{};
    const auto* begin = text.data();
    const auto* end = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(begin, end, value, base);
    if (ec != std::errc{} || ptr != end || text.empty()) {
        return std::nullopt;
    }
    return value;
}

std::string to_hex_string(uint32_t value) {
    char buffer[9];
    auto [ptr, ec] = std::to_chars(buffer, buffer + sizeof(buffer), value, 16);
    (void)ec;
    return std::string(buffer, ptr);
}

} // namespace

std::vector<std::string> encode_txt_record(const AdvertisementInfo& info) {
    const auto name = info.device_name.toUtf8();
    auto encoded_name = crypto::to_base64(
        std::span<const uint8_t>(reinterpret_cast<const uint8_t*>(name.constData()),
                                 static_cast<size_t>(name.size())),
        true);
    // Keep "n=" within a single TXT string.
    if (encoded_name.size() > kMaxTxtString - 2) {
        encoded_name.resize((kMaxTxtString - 2) / 4 * 4);
    }

    return {
        "v=" + std::to_string(info.protocol_version),
        "id=" + info.device_id.to_string(),
        "n=" + encoded_name,
        "p=" + std::to_string(info.port),
        "c=" + to_hex_string(info.capabilities),
    };
}

Result<AdvertisementInfo, Error> decode_txt_record(const std::vector<std::string>& entries) {
    AdvertisementInfo info;
    bool has_version = false;
    bool has_id = false;
    bool has_port = false;

    for (const auto& entry : entries) {
        const auto eq = entry.find('=');
        if (eq == std::string::npos) continue;
        const auto key = entry.substr(0, eq);
        const auto value = entry.substr(eq + 1);

        if (key == "v") {
            auto v = parse_number<int>(value);
            if (!v) return malformed("invalid protocol version");
            info.protocol_version = *v;
            has_version = true;
        } else if (key == "id") {
            auto id = Uuid::parse(value);
            if (!id || id->is_nil()) return malformed("invalid device id");
            info.device_id = *id;
            has_id = true;
        } else if (key == "n") {
            auto decoded = crypto::from_base64(value, true);
            if (decoded.is_ok()) {
                const auto& bytes = decoded.unwrap();
                info.device_name = QString::fromUtf8(reinterpret_cast<const char*>(bytes.data()),
                                                     static_cast<qsizetype>(bytes.size()));
            }
        } else if (key == "p") {
            auto port = parse_number<uint32_t>(value);
            if (!port || *port == 0 || *port > 0xFFFF) return malformed("invalid port");
            info.port = static_cast<uint16_t>(*port);
            has_port = true;
        } else if (key == "c") {
            auto caps = parse_number<uint32_t>(value, 16);
            if (caps) info.capabilities = *caps;
        }
    }

    if (!has_version || !has_id || !has_port) {
        return malformed("missing fields");
    }
    return Result<AdvertisementInfo, Error>::ok(std::move(info));
}

QByteArray encode_discovery_datagram(const AdvertisementInfo& info) {
    QByteArray out(kMagic, static_cast<qsizetype>(kMagicSize));
    for (const auto& entry : encode_txt_record(info)) {
        const auto len = std::min(entry.size(), kMaxTxtString);
        out.append(static_cast<char>(len));
        out.append(entry.data(), static_cast<qsizetype>(len));
    }
    return out;
}

Result<Endpoint, Error> decode_discovery_datagram(const QByteArray& datagram,
                                                  const QHostAddress& sender) {
    if (datagram.size() < static_cast<qsizetype>(kMagicSize) ||
        !datagram.startsWith(QByteArray(kMagic, static_cast<qsizetype>(kMagicSize)))) {
        return Result<Endpoint, Error>::err(Error{ErrorKind::Malformed, "wrong magic"});
    }

    std::vector<std::string> entries;
    qsizetype pos = static_cast<qsizetype>(kMagicSize);
    while (pos < datagram.size()) {
        const auto len = static_cast<uint8_t>(datagram[pos]);
        ++pos;
        if (pos + len > datagram.size()) {
            return Result<Endpoint, Error>::err(Error{ErrorKind::Malformed, "truncated TXT string"});
        }
        entries.emplace_back(datagram.constData() + pos, len);
        pos += len;
    }

    auto info = decode_txt_record(entries);
    if (info.is_err()) {
        return Result<Endpoint, Error>::err(info.unwrap_err());
    }
    return Result<Endpoint, Error>::ok(endpoint_from(info.unwrap(), sender));
}

Endpoint endpoint_from(const AdvertisementInfo& info, const QHostAddress& host) {
    Endpoint endpoint;
    endpoint.id = info.device_id;
    endpoint.name = info.device_name;
    endpoint.host = host;
    endpoint.port = info.port;
    endpoint.capabilities = info.capabilities;
    endpoint.protocol_version = info.protocol_version;
    return endpoint;
}

} // namespace dropline::network
