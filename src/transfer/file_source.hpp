#pragma once

#include "core/result.hpp"
#include "transfer/transfer_item.hpp"
#include "wire/frame.hpp"
#include <QFile>
#include <QString>

namespace dropline::transfer {

/**
 * FileSource - Reads one outgoing item as a sequence of chunk frames.
 */
class FileSource {
public:
    explicit FileSource(OutgoingFile file);

    FileSource(const FileSource&) = delete;
    FileSource& operator=(const FileSource&) = delete;

    [[nodiscard]] Result<void, Error> open();

    /**
     * Next chunk of at most `max_payload` bytes. IOFailure when the file
     * shrank or cannot be read.
     */
    [[nodiscard]] Result<wire::ChunkFrame, Error> next_chunk(uint32_t max_payload);

    void close();

    [[nodiscard]] const TransferItem& item() const { return file_.item; }
    [[nodiscard]] uint64_t offset() const { return file_.item.bytes_transferred; }
    [[nodiscard]] bool is_done() const { return file_.item.is_complete(); }

private:
    OutgoingFile file_;
    QFile handle_;
};

} // namespace dropline::transfer
