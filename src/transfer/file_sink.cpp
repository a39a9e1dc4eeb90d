#include "transfer/file_sink.hpp"
#include "crypto/keys.hpp"
#include "core/logging.hpp"

#include <QFileInfo>

namespace dropline::transfer {

namespace {

// Renames fail instead of overwriting; retry with the next suffix.
constexpr int MAX_RENAME_ATTEMPTS = 1000;

QString candidate_name(const QString& name, int n) {
    if (n == 0) return name;
    const int dot = name.lastIndexOf(QLatin1Char('.'));
    const QString suffix = QStringLiteral(" (%1)").arg(n);
    if (dot <= 0) {
        return name + suffix;
    }
    return name.left(dot) + suffix + name.mid(dot);
}

} // namespace

QString unique_destination(const QDir& dir, const QString& name, int start) {
    for (int n = start;; ++n) {
        const QString path = dir.filePath(candidate_name(name, n));
        if (!QFileInfo::exists(path)) {
            return path;
        }
    }
}

FileSink::FileSink(QString dest_dir, TransferItem item)
    : dest_dir_(dest_dir)
    , item_(std::move(item))
{
    item_.bytes_transferred = 0;
}

FileSink::~FileSink() {
    abandon();
}

QString FileSink::partPath() const {
    return dest_dir_.filePath(QString::fromStdString(item_.name) + QLatin1String(PART_SUFFIX));
}

Result<void, Error> FileSink::open() {
    if (!dest_dir_.exists() && !dest_dir_.mkpath(QStringLiteral("."))) {
        return Result<void, Error>::err(Error{
            ErrorKind::IOFailure, "cannot create " + dest_dir_.absolutePath().toStdString()});
    }
    file_.setFileName(partPath());
    if (!file_.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        return Result<void, Error>::err(Error{
            ErrorKind::IOFailure,
            "cannot open " + partPath().toStdString() + ": " + file_.errorString().toStdString()});
    }
    return Result<void, Error>::ok();
}

Result<void, Error> FileSink::write(uint64_t offset, std::span<const uint8_t> data) {
    if (finished_ || !file_.isOpen()) {
        return Result<void, Error>::err(
            Error{ErrorKind::Malformed, "chunk for closed item " + std::to_string(item_.index)});
    }
    if (offset != item_.bytes_transferred) {
        return Result<void, Error>::err(Error{
            ErrorKind::Malformed,
            "item " + std::to_string(item_.index) + ": chunk at offset " + std::to_string(offset) +
                ", expected " + std::to_string(item_.bytes_transferred)});
    }
    if (data.size() > item_.remaining()) {
        return Result<void, Error>::err(Error{
            ErrorKind::Malformed,
            "item " + std::to_string(item_.index) + ": chunk runs past declared size"});
    }

    const qint64 written = file_.write(reinterpret_cast<const char*>(data.data()),
                                       static_cast<qint64>(data.size()));
    if (written != static_cast<qint64>(data.size())) {
        return Result<void, Error>::err(Error{
            ErrorKind::IOFailure,
            "write to " + partPath().toStdString() + " failed: " + file_.errorString().toStdString()});
    }

    hasher_.update(data);
    item_.bytes_transferred += data.size();
    return Result<void, Error>::ok();
}

Result<QString, Error> FileSink::finish() {
    if (!item_.is_complete()) {
        return Result<QString, Error>::err(Error{
            ErrorKind::Malformed, "item " + std::to_string(item_.index) + " is incomplete"});
    }
    if (finished_) {
        return Result<QString, Error>::err(
            Error{ErrorKind::InvalidArgument, "item already finished"});
    }

    if (!file_.flush()) {
        return Result<QString, Error>::err(
            Error{ErrorKind::IOFailure, "flush failed: " + file_.errorString().toStdString()});
    }
    file_.close();
    finished_ = true;

    const auto digest = hasher_.finalize();
    if (!item_.content_hash.empty() && !crypto::secure_compare(digest, item_.content_hash)) {
        qCWarning(droplineTransferLog) << "hash mismatch for" << QString::fromStdString(item_.name);
        return Result<QString, Error>::err(Error{
            ErrorKind::IntegrityFailure,
            "content hash mismatch for " + item_.name});
    }

    const QString name = QString::fromStdString(item_.name);
    for (int attempt = 0; attempt < MAX_RENAME_ATTEMPTS; ++attempt) {
        const QString target = unique_destination(dest_dir_, name);
        if (QFile::rename(partPath(), target)) {
            qCInfo(droplineTransferLog) << "received" << target;
            return Result<QString, Error>::ok(target);
        }
        if (!QFileInfo::exists(target)) {
            break;
        }
    }

    return Result<QString, Error>::err(
        Error{ErrorKind::IOFailure, "cannot move " + partPath().toStdString() + " into place"});
}

void FileSink::abandon() {
    if (file_.isOpen()) {
        if (!file_.flush()) {
            qCWarning(droplineTransferLog) << "flush failed for" << partPath() << file_.errorString();
        }
        file_.close();
    }
}

} // namespace dropline::transfer
