#include "transfer/file_source.hpp"

#include <algorithm>

namespace dropline::transfer {

FileSource::FileSource(OutgoingFile file)
    : file_(std::move(file))
    , handle_(file_.path)
{
    file_.item.bytes_transferred = 0;
}

Result<void, Error> FileSource::open() {
    if (!handle_.open(QIODevice::ReadOnly)) {
        return Result<void, Error>::err(Error{
            ErrorKind::IOFailure,
            "cannot open " + file_.path.toStdString() + ": " + handle_.errorString().toStdString()});
    }
    return Result<void, Error>::ok();
}

Result<wire::ChunkFrame, Error> FileSource::next_chunk(uint32_t max_payload) {
    const uint64_t want = std::min<uint64_t>(max_payload, file_.item.remaining());

    wire::ChunkFrame chunk;
    chunk.item_index = file_.item.index;
    chunk.offset = file_.item.bytes_transferred;
    chunk.payload.resize(static_cast<size_t>(want));

    const qint64 got = handle_.read(reinterpret_cast<char*>(chunk.payload.data()),
                                    static_cast<qint64>(want));
    if (got != static_cast<qint64>(want)) {
        return Result<wire::ChunkFrame, Error>::err(Error{
            ErrorKind::IOFailure,
            got < 0 ? "read failed: " + handle_.errorString().toStdString()
                    : file_.path.toStdString() + " changed while sending"});
    }

    file_.item.bytes_transferred += want;
    return Result<wire::ChunkFrame, Error>::ok(std::move(chunk));
}

void FileSource::close() {
    handle_.close();
}

} // namespace dropline::transfer
