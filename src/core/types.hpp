#pragma once

#include <string>
#include <string_view>
#include <chrono>
#include <array>
#include <cstdint>
#include <compare>
#include <optional>
#include <random>
#include <span>

namespace dropline {

/**
 * UUID - 128-bit identifier used for device ids and session ids.
 */
class Uuid {
public:
    static constexpr size_t BYTE_SIZE = 16;
    using Bytes = std::array<uint8_t, BYTE_SIZE>;

    constexpr Uuid() noexcept : bytes_{} {}
    explicit constexpr Uuid(Bytes bytes) noexcept : bytes_(bytes) {}

    /**
     * Generate a new random UUID (version 4).
     */
    [[nodiscard]] static Uuid generate() {
        static thread_local std::random_device rd;
        static thread_local std::mt19937_64 gen(rd());
        static thread_local std::uniform_int_distribution<uint64_t> dist;

        Bytes bytes;
        for (size_t i = 0; i < BYTE_SIZE; i += 8) {
            uint64_t word = dist(gen);
            for (size_t j = 0; j < 8; ++j) {
                bytes[i + j] = static_cast<uint8_t>(word >> (j * 8));
            }
        }

        bytes[6] = (bytes[6] & 0x0F) | 0x40;
        bytes[8] = (bytes[8] & 0x3F) | 0x80;
        return Uuid(bytes);
    }

    /**
     * Parse hyphenated or plain hex. Returns nullopt on anything else.
     */
    [[nodiscard]] static std::optional<Uuid> parse(std::string_view str) {
        Bytes bytes{};
        size_t nibble = 0;
        for (char c : str) {
            if (c == '-') continue;
            int v = hex_value(c);
            if (v < 0 || nibble >= BYTE_SIZE * 2) return std::nullopt;
            bytes[nibble / 2] = static_cast<uint8_t>((bytes[nibble / 2] << 4) | v);
            ++nibble;
        }
        if (nibble != BYTE_SIZE * 2) return std::nullopt;
        return Uuid(bytes);
    }

    /**
     * Build from raw wire bytes; nullopt unless exactly 16 bytes.
     */
    [[nodiscard]] static std::optional<Uuid> from_bytes(std::span<const uint8_t> data) {
        if (data.size() != BYTE_SIZE) return std::nullopt;
        Bytes bytes;
        std::copy(data.begin(), data.end(), bytes.begin());
        return Uuid(bytes);
    }

    /**
     * xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx, lowercase.
     */
    [[nodiscard]] std::string to_string() const {
        static constexpr char digits[] = "0123456789abcdef";
        std::string out;
        out.reserve(36);
        for (size_t i = 0; i < BYTE_SIZE; ++i) {
            if (i == 4 || i == 6 || i == 8 || i == 10) {
                out += '-';
            }
            out += digits[bytes_[i] >> 4];
            out += digits[bytes_[i] & 0x0F];
        }
        return out;
    }

    /**
     * First 8 hex digits; enough to tell sessions apart in logs.
     */
    [[nodiscard]] std::string short_string() const {
        return to_string().substr(0, 8);
    }

    [[nodiscard]] constexpr bool is_nil() const noexcept {
        for (auto b : bytes_) {
            if (b != 0) return false;
        }
        return true;
    }

    [[nodiscard]] constexpr const Bytes& bytes() const noexcept {
        return bytes_;
    }

    auto operator<=>(const Uuid&) const = default;
    bool operator==(const Uuid&) const = default;

private:
    static constexpr int hex_value(char c) noexcept {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    }

    Bytes bytes_;
};

using DeviceId = Uuid;
using SessionId = Uuid;

/**
 * Timestamp - milliseconds on the steady clock.
 *
 * Only used for expiry and rate computations, never shown to users, so it
 * does not follow wall-clock adjustments.
 */
class Timestamp {
public:
    using Duration = std::chrono::milliseconds;
    using Clock = std::chrono::steady_clock;

    constexpr Timestamp() noexcept : millis_(0) {}
    explicit constexpr Timestamp(int64_t millis) noexcept : millis_(millis) {}

    [[nodiscard]] static Timestamp now() {
        return Timestamp(std::chrono::duration_cast<Duration>(
            Clock::now().time_since_epoch()).count());
    }

    [[nodiscard]] constexpr int64_t millis() const noexcept {
        return millis_;
    }

    auto operator<=>(const Timestamp&) const = default;
    bool operator==(const Timestamp&) const = default;

    Timestamp operator+(Duration d) const {
        return Timestamp(millis_ + d.count());
    }

    Duration operator-(const Timestamp& other) const {
        return Duration(millis_ - other.millis_);
    }

private:
    int64_t millis_;
};

} // namespace dropline

namespace std {
    template<>
    struct hash<dropline::Uuid> {
        size_t operator()(const dropline::Uuid& uuid) const noexcept {
            const auto& bytes = uuid.bytes();
            size_t h = 0;
            for (size_t i = 0; i < bytes.size(); i += sizeof(size_t)) {
                size_t chunk = 0;
                for (size_t j = 0; j < sizeof(size_t) && i + j < bytes.size(); ++j) {
                    chunk |= static_cast<size_t>(bytes[i + j]) << (j * 8);
                }
                h ^= chunk + 0x9e3779b9 + (h << 6) + (h >> 2);
            }
            return h;
        }
    };
}
