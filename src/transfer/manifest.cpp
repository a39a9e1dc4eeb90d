#include "transfer/manifest.hpp"
#include "crypto/content_hash.hpp"
#include "crypto/keys.hpp"

#include <QFileInfo>
#include <QMimeDatabase>
#include <set>

namespace dropline::transfer {

namespace {

std::string with_suffix(const std::string& name, int n) {
    const auto dot = name.find_last_of('.');
    const std::string suffix = " (" + std::to_string(n) + ")";
    if (dot == std::string::npos || dot == 0) {
        return name + suffix;
    }
    return name.substr(0, dot) + suffix + name.substr(dot);
}

} // namespace

Result<std::string, Error> sanitize_file_name(std::string_view name) {
    // Keep only the last path component, whatever the sender's separator.
    const auto slash = name.find_last_of("/\\");
    if (slash != std::string_view::npos) {
        name.remove_prefix(slash + 1);
    }

    std::string out;
    out.reserve(name.size());
    for (char c : name) {
        const auto uc = static_cast<unsigned char>(c);
        if (uc < 0x20 || uc == 0x7f || c == ':' || c == '*' || c == '?' ||
            c == '"' || c == '<' || c == '>' || c == '|') {
            out += '_';
        } else {
            out += c;
        }
    }

    const auto first = out.find_first_not_of(". ");
    if (first == std::string::npos) {
        return Result<std::string, Error>::err(
            Error{ErrorKind::Malformed, "unusable file name '" + std::string(name) + "'"});
    }
    out.erase(0, first);
    while (!out.empty() && (out.back() == ' ' || out.back() == '.')) {
        out.pop_back();
    }

    if (out.size() > MAX_FILE_NAME_BYTES) {
        // Cut at a UTF-8 boundary.
        size_t cut = MAX_FILE_NAME_BYTES;
        while (cut > 0 && (static_cast<unsigned char>(out[cut]) & 0xC0) == 0x80) {
            --cut;
        }
        out.resize(cut);
    }
    return Result<std::string, Error>::ok(std::move(out));
}

Result<std::vector<TransferItem>, Error> validate_manifest(
    const wire::Introduction& introduction,
    const TransferConfig& config) {
    using R = Result<std::vector<TransferItem>, Error>;

    if (introduction.files.empty()) {
        return R::err(Error{ErrorKind::Malformed, "empty manifest"});
    }
    if (introduction.files.size() > config.max_items) {
        return R::err(Error{ErrorKind::Malformed,
                            "manifest lists " + std::to_string(introduction.files.size()) +
                                " files, limit is " + std::to_string(config.max_items)});
    }

    std::vector<TransferItem> items;
    items.reserve(introduction.files.size());
    std::set<std::string> used;

    for (size_t i = 0; i < introduction.files.size(); ++i) {
        const auto& meta = introduction.files[i];
        if (meta.index != i) {
            return R::err(Error{ErrorKind::Malformed,
                                "item index " + std::to_string(meta.index) +
                                    " out of sequence"});
        }
        if (meta.size > config.max_item_size) {
            return R::err(Error{ErrorKind::Malformed,
                                "item " + std::to_string(i) + " exceeds size limit"});
        }
        if (!meta.content_hash.empty() && meta.content_hash.size() != crypto::CONTENT_HASH_SIZE) {
            return R::err(Error{ErrorKind::Malformed,
                                "item " + std::to_string(i) + " has a bad hash length"});
        }

        auto name = sanitize_file_name(meta.name);
        if (name.is_err()) {
            return R::err(name.unwrap_err());
        }
        std::string unique = name.unwrap();
        for (int n = 1; used.count(unique) > 0; ++n) {
            unique = with_suffix(name.unwrap(), n);
        }
        used.insert(unique);

        TransferItem item;
        item.index = meta.index;
        item.name = std::move(unique);
        item.size = meta.size;
        item.content_hash = meta.content_hash;
        item.mime_type = meta.mime_type;
        items.push_back(std::move(item));
    }

    return R::ok(std::move(items));
}

Result<std::vector<OutgoingFile>, Error> build_manifest(const QStringList& paths,
                                                        const TransferConfig& config,
                                                        bool hash_contents) {
    using R = Result<std::vector<OutgoingFile>, Error>;

    if (paths.isEmpty()) {
        return R::err(Error{ErrorKind::InvalidArgument, "no files to send"});
    }
    if (static_cast<uint64_t>(paths.size()) > config.max_items) {
        return R::err(Error{ErrorKind::InvalidArgument, "too many files"});
    }

    QMimeDatabase mime_db;
    std::vector<OutgoingFile> files;
    files.reserve(static_cast<size_t>(paths.size()));

    for (const auto& path : paths) {
        QFileInfo info(path);
        if (!info.exists()) {
            return R::err(Error{ErrorKind::IOFailure, "no such file: " + path.toStdString()});
        }
        if (info.isDir()) {
            return R::err(Error{ErrorKind::InvalidArgument,
                                "directories cannot be sent: " + path.toStdString()});
        }
        if (!info.isReadable()) {
            return R::err(Error{ErrorKind::IOFailure, "cannot read " + path.toStdString()});
        }

        OutgoingFile file;
        file.path = info.absoluteFilePath();
        file.item.index = static_cast<uint32_t>(files.size());
        file.item.name = info.fileName().toStdString();
        file.item.size = static_cast<uint64_t>(info.size());
        file.item.mime_type = mime_db.mimeTypeForFile(info).name().toStdString();

        if (hash_contents) {
            auto digest = crypto::hash_file(file.path);
            if (digest.is_err()) {
                return R::err(digest.unwrap_err());
            }
            file.item.content_hash = digest.unwrap();
        }
        files.push_back(std::move(file));
    }

    return R::ok(std::move(files));
}

wire::Introduction make_introduction(const std::string& sender_name,
                                     const std::vector<OutgoingFile>& files) {
    wire::Introduction intro;
    intro.sender_name = sender_name;
    intro.files.reserve(files.size());
    for (const auto& file : files) {
        wire::FileMetadata meta;
        meta.index = file.item.index;
        meta.name = file.item.name;
        meta.size = file.item.size;
        meta.content_hash = file.item.content_hash;
        meta.mime_type = file.item.mime_type;
        intro.files.push_back(std::move(meta));
    }
    return intro;
}

uint64_t total_size(const std::vector<TransferItem>& items) {
    uint64_t total = 0;
    for (const auto& item : items) {
        total += item.size;
    }
    return total;
}

} // namespace dropline::transfer
