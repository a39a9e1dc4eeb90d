#pragma once

#include "core/result.hpp"
#include "crypto/content_hash.hpp"
#include "transfer/transfer_item.hpp"
#include <QDir>
#include <QFile>
#include <QString>
#include <memory>
#include <span>

namespace dropline::transfer {

constexpr const char* PART_SUFFIX = ".dropline-part";

/**
 * FileSink - Receives one item into `<dest>/<name>.dropline-part`.
 *
 * Chunks must arrive in order for the item: each write has to start at the
 * current end of the data. When the declared size is reached, finish()
 * checks the hash and renames the part file into place. On any failure the
 * part file is left on disk with exactly the bytes written so far.
 */
class FileSink {
public:
    FileSink(QString dest_dir, TransferItem item);
    ~FileSink();

    FileSink(const FileSink&) = delete;
    FileSink& operator=(const FileSink&) = delete;

    /**
     * Create (truncate) the part file. IOFailure when it cannot be opened.
     */
    [[nodiscard]] Result<void, Error> open();

    /**
     * Append a chunk at `offset`. Malformed for a gap, an overlap or data
     * past the declared size; IOFailure when the disk write fails.
     */
    [[nodiscard]] Result<void, Error> write(uint64_t offset, std::span<const uint8_t> data);

    /**
     * Verify and move into place. Returns the final path. IntegrityFailure
     * on a hash mismatch (the part file is kept).
     */
    [[nodiscard]] Result<QString, Error> finish();

    /**
     * Close the handle and keep whatever was written.
     */
    void abandon();

    [[nodiscard]] const TransferItem& item() const { return item_; }
    [[nodiscard]] uint64_t written() const { return item_.bytes_transferred; }
    [[nodiscard]] bool is_complete() const { return item_.is_complete(); }
    [[nodiscard]] bool is_finished() const { return finished_; }
    [[nodiscard]] QString partPath() const;

private:
    QDir dest_dir_;
    TransferItem item_;
    QFile file_;
    crypto::ContentHasher hasher_;
    bool finished_ = false;
};

/**
 * First free path for `name` in `dir`: name, then "name (1).ext", ...
 */
[[nodiscard]] QString unique_destination(const QDir& dir, const QString& name, int start = 0);

} // namespace dropline::transfer
