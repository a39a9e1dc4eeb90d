#include "crypto/content_hash.hpp"

#include <QFile>

namespace dropline::crypto {

ContentHasher::ContentHasher() {
    crypto_generichash_init(&state_, nullptr, 0, CONTENT_HASH_SIZE);
}

void ContentHasher::update(std::span<const uint8_t> data) {
    if (finalized_ || data.empty()) return;
    crypto_generichash_update(&state_, data.data(), data.size());
    bytes_ += data.size();
}

std::vector<uint8_t> ContentHasher::finalize() {
    std::vector<uint8_t> out(CONTENT_HASH_SIZE);
    if (!finalized_) {
        crypto_generichash_final(&state_, out.data(), out.size());
        finalized_ = true;
    }
    return out;
}

Result<std::vector<uint8_t>, Error> hash_file(const QString& path) {
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        return Result<std::vector<uint8_t>, Error>::err(
            Error{ErrorKind::IOFailure, "cannot open " + path.toStdString() + ": " +
                                            file.errorString().toStdString()});
    }

    ContentHasher hasher;
    std::vector<uint8_t> buffer(256 * 1024);
    for (;;) {
        const auto n = file.read(reinterpret_cast<char*>(buffer.data()),
                                 static_cast<qint64>(buffer.size()));
        if (n < 0) {
            return Result<std::vector<uint8_t>, Error>::err(
                Error{ErrorKind::IOFailure, "read failed on " + path.toStdString() + ": " +
                                                file.errorString().toStdString()});
        }
        if (n == 0) break;
        hasher.update(std::span<const uint8_t>(buffer.data(), static_cast<size_t>(n)));
    }
    return Result<std::vector<uint8_t>, Error>::ok(hasher.finalize());
}

} // namespace dropline::crypto
