#include <catch2/catch_test_macros.hpp>
#include "crypto/keys.hpp"
#include "transfer/file_sink.hpp"
#include "transfer/file_source.hpp"

#include <QFile>
#include <QTemporaryDir>

using namespace dropline;
using namespace dropline::transfer;

namespace {

std::vector<uint8_t> pattern(size_t size) {
    std::vector<uint8_t> out(size);
    for (size_t i = 0; i < size; ++i) {
        out[i] = static_cast<uint8_t>(i * 7);
    }
    return out;
}

TransferItem item_for(const std::string& name, const std::vector<uint8_t>& data, bool with_hash = true) {
    TransferItem item;
    item.index = 0;
    item.name = name;
    item.size = data.size();
    if (with_hash) {
        item.content_hash = crypto::hash(data);
    }
    return item;
}

QByteArray read_all(const QString& path) {
    QFile file(path);
    REQUIRE(file.open(QIODevice::ReadOnly));
    return file.readAll();
}

} // namespace

TEST_CASE("FileSink writes in order and moves into place", "[file_sink]") {
    QTemporaryDir dir;
    REQUIRE(dir.isValid());
    const auto data = pattern(1000);

    FileSink sink(dir.path(), item_for("photo.jpg", data));
    REQUIRE(sink.open().is_ok());
    REQUIRE(QFile::exists(sink.partPath()));
    REQUIRE(sink.partPath().endsWith(QStringLiteral("photo.jpg.dropline-part")));

    REQUIRE(sink.write(0, std::span(data).first(400)).is_ok());
    REQUIRE(sink.write(400, std::span(data).subspan(400)).is_ok());
    REQUIRE(sink.is_complete());

    auto path = sink.finish();
    REQUIRE(path.is_ok());
    REQUIRE(path.unwrap() == dir.filePath(QStringLiteral("photo.jpg")));
    REQUIRE_FALSE(QFile::exists(sink.partPath()));
    REQUIRE(read_all(path.unwrap()).size() == 1000);
}

TEST_CASE("FileSink refuses gaps, overlaps and overflow", "[file_sink]") {
    QTemporaryDir dir;
    REQUIRE(dir.isValid());
    const auto data = pattern(100);
    FileSink sink(dir.path(), item_for("a.bin", data));
    REQUIRE(sink.open().is_ok());
    REQUIRE(sink.write(0, std::span(data).first(50)).is_ok());

    REQUIRE(sink.write(60, std::span(data).subspan(60)).unwrap_err().kind == ErrorKind::Malformed);
    REQUIRE(sink.write(40, std::span(data).subspan(40)).unwrap_err().kind == ErrorKind::Malformed);

    const auto extra = pattern(51);
    REQUIRE(sink.write(50, extra).unwrap_err().kind == ErrorKind::Malformed);
    REQUIRE(sink.written() == 50);
}

TEST_CASE("FileSink keeps the part file on hash mismatch", "[file_sink]") {
    QTemporaryDir dir;
    REQUIRE(dir.isValid());
    const auto data = pattern(64);
    auto item = item_for("doc.txt", data);
    item.content_hash[0] ^= 0xff;

    FileSink sink(dir.path(), item);
    REQUIRE(sink.open().is_ok());
    REQUIRE(sink.write(0, data).is_ok());

    auto result = sink.finish();
    REQUIRE(result.is_err());
    REQUIRE(result.unwrap_err().kind == ErrorKind::IntegrityFailure);
    REQUIRE(QFile::exists(sink.partPath()));
    REQUIRE(read_all(sink.partPath()).size() == 64);
    REQUIRE_FALSE(QFile::exists(dir.filePath(QStringLiteral("doc.txt"))));
}

TEST_CASE("FileSink never overwrites an existing file", "[file_sink]") {
    QTemporaryDir dir;
    REQUIRE(dir.isValid());
    {
        QFile existing(dir.filePath(QStringLiteral("notes.txt")));
        REQUIRE(existing.open(QIODevice::WriteOnly));
        existing.write("old");
    }

    const auto data = pattern(10);
    FileSink sink(dir.path(), item_for("notes.txt", data, false));
    REQUIRE(sink.open().is_ok());
    REQUIRE(sink.write(0, data).is_ok());
    auto path = sink.finish();
    REQUIRE(path.is_ok());
    REQUIRE(path.unwrap() == dir.filePath(QStringLiteral("notes (1).txt")));
    REQUIRE(read_all(dir.filePath(QStringLiteral("notes.txt"))) == QByteArray("old"));
}

TEST_CASE("FileSink finishes empty items without writes", "[file_sink]") {
    QTemporaryDir dir;
    REQUIRE(dir.isValid());
    FileSink sink(dir.path(), item_for("empty", {}));
    REQUIRE(sink.open().is_ok());
    REQUIRE(sink.is_complete());
    auto path = sink.finish();
    REQUIRE(path.is_ok());
    REQUIRE(QFile::exists(path.unwrap()));
    REQUIRE(sink.finish().is_err());
}

TEST_CASE("unique_destination appends a counter before the extension", "[file_sink]") {
    QTemporaryDir dir;
    REQUIRE(dir.isValid());
    const QDir qdir(dir.path());

    REQUIRE(unique_destination(qdir, QStringLiteral("a.tar")) == qdir.filePath(QStringLiteral("a.tar")));
    QFile taken(qdir.filePath(QStringLiteral("a.tar")));
    REQUIRE(taken.open(QIODevice::WriteOnly));
    taken.close();
    REQUIRE(unique_destination(qdir, QStringLiteral("a.tar")) == qdir.filePath(QStringLiteral("a (1).tar")));
    REQUIRE(unique_destination(qdir, QStringLiteral("README")) == qdir.filePath(QStringLiteral("README")));
}

TEST_CASE("FileSource reads a file as sequential chunks", "[file_sink]") {
    QTemporaryDir dir;
    REQUIRE(dir.isValid());
    const auto data = pattern(250);
    const auto path = dir.filePath(QStringLiteral("src.bin"));
    {
        QFile file(path);
        REQUIRE(file.open(QIODevice::WriteOnly));
        file.write(reinterpret_cast<const char*>(data.data()), static_cast<qint64>(data.size()));
    }

    OutgoingFile outgoing;
    outgoing.path = path;
    outgoing.item = item_for("src.bin", data);
    outgoing.item.index = 3;

    FileSource source(outgoing);
    REQUIRE(source.open().is_ok());

    std::vector<uint8_t> collected;
    uint64_t expected_offset = 0;
    while (!source.is_done()) {
        auto chunk = source.next_chunk(100);
        REQUIRE(chunk.is_ok());
        REQUIRE(chunk.unwrap().item_index == 3);
        REQUIRE(chunk.unwrap().offset == expected_offset);
        REQUIRE(chunk.unwrap().payload.size() <= 100);
        expected_offset += chunk.unwrap().payload.size();
        collected.insert(collected.end(), chunk.unwrap().payload.begin(), chunk.unwrap().payload.end());
    }
    REQUIRE(collected == data);
}
