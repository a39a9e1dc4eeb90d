#pragma once

#include "core/result.hpp"

#include <QLoggingCategory>
#include <QString>

Q_DECLARE_LOGGING_CATEGORY(droplineWireLog)
Q_DECLARE_LOGGING_CATEGORY(droplineDiscoveryLog)
Q_DECLARE_LOGGING_CATEGORY(droplineHandshakeLog)
Q_DECLARE_LOGGING_CATEGORY(droplineTransferLog)
Q_DECLARE_LOGGING_CATEGORY(droplineSessionLog)

namespace dropline {

// Installs a Qt message handler that appends to `path` (or the default log
// file when empty). Lines are stamped with UTC time, level and category.
// Messages are mirrored to stderr when `mirror_stderr` is set.
void install_file_logging(const QString& path = {}, bool mirror_stderr = true);

// Returns the default log file path (may be empty if unavailable).
QString default_log_file_path();

// Maps a level name (debug, info, warning, critical) onto filter rules for
// every dropline.* category.
Result<void, Error> apply_log_level(const QString& level);

// DROPLINE_DEBUG=1 turns on debug output for all dropline.* categories.
void apply_log_environment();

} // namespace dropline
