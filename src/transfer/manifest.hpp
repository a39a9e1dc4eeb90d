#pragma once

#include "core/config.hpp"
#include "core/result.hpp"
#include "transfer/transfer_item.hpp"
#include "wire/frame.hpp"
#include <QStringList>
#include <string>
#include <vector>

namespace dropline::transfer {

constexpr size_t MAX_FILE_NAME_BYTES = 255;

/**
 * Reduce a peer-supplied name to a single safe path component.
 *
 * Directory parts are stripped, control characters and separators are
 * replaced with '_', leading dots are removed so nothing becomes hidden or
 * climbs out of the destination. Names that end up empty are refused.
 */
[[nodiscard]] Result<std::string, Error> sanitize_file_name(std::string_view name);

/**
 * Check an incoming introduction and turn it into transfer items.
 *
 * Malformed when the list is empty or too long, indices are not 0..n-1 in
 * order, a size exceeds the limit, a hash has the wrong length, or a name
 * cannot be sanitized. Duplicate names get a " (n)" suffix.
 */
[[nodiscard]] Result<std::vector<TransferItem>, Error> validate_manifest(
    const wire::Introduction& introduction,
    const TransferConfig& config);

/**
 * Stat (and optionally hash) local files for sending. IOFailure for a
 * missing or unreadable file, InvalidArgument for an empty list or a
 * directory.
 */
[[nodiscard]] Result<std::vector<OutgoingFile>, Error> build_manifest(
    const QStringList& paths,
    const TransferConfig& config,
    bool hash_contents = true);

[[nodiscard]] wire::Introduction make_introduction(const std::string& sender_name,
                                                   const std::vector<OutgoingFile>& files);

[[nodiscard]] uint64_t total_size(const std::vector<TransferItem>& items);

} // namespace dropline::transfer
