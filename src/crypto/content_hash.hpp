#pragma once

#include "core/result.hpp"
#include "crypto/keys.hpp"

#include <QString>
#include <span>
#include <vector>

namespace dropline::crypto {

/**
 * ContentHasher - Streaming BLAKE2b-256 over a file's bytes.
 */
class ContentHasher {
public:
    ContentHasher();

    void update(std::span<const uint8_t> data);

    /**
     * Returns the digest. The hasher must not be updated afterwards.
     */
    [[nodiscard]] std::vector<uint8_t> finalize();

    [[nodiscard]] uint64_t bytes_hashed() const { return bytes_; }

private:
    crypto_generichash_state state_;
    uint64_t bytes_ = 0;
    bool finalized_ = false;
};

/**
 * Hash a whole file from disk. IOFailure when it cannot be read.
 */
[[nodiscard]] Result<std::vector<uint8_t>, Error> hash_file(const QString& path);

} // namespace dropline::crypto
