#pragma once

#include "core/result.hpp"
#include <sodium.h>

#include <array>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace dropline::crypto {

constexpr size_t PUBLIC_KEY_SIZE = crypto_kx_PUBLICKEYBYTES;
constexpr size_t SECRET_KEY_SIZE = crypto_kx_SECRETKEYBYTES;
constexpr size_t SESSION_KEY_SIZE = crypto_kx_SESSIONKEYBYTES;
constexpr size_t CONTENT_HASH_SIZE = 32;
constexpr size_t SHARED_SECRET_SIZE = 32;

using PublicKey = std::array<uint8_t, PUBLIC_KEY_SIZE>;
using SecretKey = std::array<uint8_t, SECRET_KEY_SIZE>;
using SessionKey = std::array<uint8_t, SESSION_KEY_SIZE>;
using SharedSecret = std::array<uint8_t, SHARED_SECRET_SIZE>;

/**
 * KeyPair - An ephemeral X25519 key pair for crypto_kx.
 */
struct KeyPair {
    PublicKey public_key{};
    SecretKey secret_key{};
};

/**
 * Initialize libsodium. Safe to call more than once.
 */
[[nodiscard]] inline Result<void, Error> init() {
    if (sodium_init() < 0) {
        return Result<void, Error>::err(Error{"Failed to initialize libsodium"});
    }
    return Result<void, Error>::ok();
}

/**
 * Generate a new random key exchange key pair.
 */
[[nodiscard]] inline KeyPair generate_keypair() {
    KeyPair kp;
    crypto_kx_keypair(kp.public_key.data(), kp.secret_key.data());
    return kp;
}

/**
 * Generate random bytes.
 */
[[nodiscard]] inline std::vector<uint8_t> random_bytes(size_t count) {
    std::vector<uint8_t> bytes(count);
    randombytes_buf(bytes.data(), count);
    return bytes;
}

[[nodiscard]] inline SharedSecret generate_shared_secret() {
    SharedSecret secret;
    randombytes_buf(secret.data(), secret.size());
    return secret;
}

/**
 * BLAKE2b of `data`, optionally keyed.
 */
[[nodiscard]] inline std::vector<uint8_t> hash(
    std::span<const uint8_t> data,
    size_t hash_size = CONTENT_HASH_SIZE,
    std::span<const uint8_t> key = {}
) {
    std::vector<uint8_t> out(hash_size);
    crypto_generichash(out.data(), hash_size, data.data(), data.size(),
                       key.empty() ? nullptr : key.data(), key.size());
    return out;
}

/**
 * Encode bytes as Base64. `url_safe` selects the unpadded URL alphabet.
 */
[[nodiscard]] inline std::string to_base64(std::span<const uint8_t> data, bool url_safe = false) {
    const int variant = url_safe ? sodium_base64_VARIANT_URLSAFE_NO_PADDING
                                 : sodium_base64_VARIANT_ORIGINAL;
    std::string out(sodium_base64_ENCODED_LEN(data.size(), variant), '\0');
    sodium_bin2base64(out.data(), out.size(), data.data(), data.size(), variant);
    out.resize(std::char_traits<char>::length(out.c_str()));
    return out;
}

/**
 * Decode Base64 to bytes.
 */
[[nodiscard]] inline Result<std::vector<uint8_t>, Error> from_base64(
    std::string_view b64, bool url_safe = false
) {
    const int variant = url_safe ? sodium_base64_VARIANT_URLSAFE_NO_PADDING
                                 : sodium_base64_VARIANT_ORIGINAL;
    std::vector<uint8_t> out(b64.size() * 3 / 4 + 1);
    size_t len = 0;
    const char* end = nullptr;
    if (sodium_base642bin(out.data(), out.size(), b64.data(), b64.size(),
                          nullptr, &len, &end, variant) != 0 ||
        end != b64.data() + b64.size()) {
        return Result<std::vector<uint8_t>, Error>::err(
            Error{ErrorKind::Malformed, "Invalid Base64"});
    }
    out.resize(len);
    return Result<std::vector<uint8_t>, Error>::ok(std::move(out));
}

[[nodiscard]] inline std::string to_hex(std::span<const uint8_t> data) {
    std::string out(data.size() * 2 + 1, '\0');
    sodium_bin2hex(out.data(), out.size(), data.data(), data.size());
    out.pop_back();
    return out;
}

[[nodiscard]] inline Result<std::vector<uint8_t>, Error> from_hex(std::string_view hex) {
    std::vector<uint8_t> out(hex.size() / 2 + 1);
    size_t len = 0;
    const char* end = nullptr;
    if (sodium_hex2bin(out.data(), out.size(), hex.data(), hex.size(),
                       nullptr, &len, &end) != 0 ||
        end != hex.data() + hex.size()) {
        return Result<std::vector<uint8_t>, Error>::err(
            Error{ErrorKind::Malformed, "Invalid hex"});
    }
    out.resize(len);
    return Result<std::vector<uint8_t>, Error>::ok(std::move(out));
}

/**
 * Securely zero memory.
 */
inline void secure_zero(void* ptr, size_t len) {
    sodium_memzero(ptr, len);
}

/**
 * Constant-time comparison.
 */
[[nodiscard]] inline bool secure_compare(
    std::span<const uint8_t> a,
    std::span<const uint8_t> b
) {
    if (a.size() != b.size()) return false;
    return sodium_memcmp(a.data(), b.data(), a.size()) == 0;
}

[[nodiscard]] inline bool is_all_zero(std::span<const uint8_t> data) {
    return sodium_is_zero(data.data(), data.size()) == 1;
}

} // namespace dropline::crypto
