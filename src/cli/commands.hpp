#pragma once

#include <QString>
#include <QStringList>
#include <QTextStream>
#include <chrono>
#include <cstdint>

#include "core/result.hpp"

namespace dropline::network {
class SessionManager;
}

namespace dropline::cli {

struct SendOptions {
    QStringList files;
    // Device id or display name of a discovered peer. With no target at all
    // the user picks from what discovery finds within `browseTime`.
    QString to;
    // Explicit address; used instead of discovery when set.
    QString host;
    uint16_t hostPort = 0;
    // Invite JSON, or a path to a file holding it.
    QString invite;
    std::chrono::milliseconds findTimeout{10000};
    std::chrono::milliseconds browseTime{3000};
};

struct ReceiveOptions {
    bool once = false;
    bool showInvite = false;
    // Address to put into the invite; first non-loopback IPv4 when empty.
    QString inviteAddress;
};

struct ListOptions {
    int seconds = 3;
};

/**
 * Send files and wait until the session ends. Progress goes to `err`.
 */
[[nodiscard]] Result<void> run_send(network::SessionManager& manager,
                                    const SendOptions& options,
                                    QTextStream& out,
                                    QTextStream& err);

/**
 * Listen for senders until interrupted (or after one session with `once`).
 * With `once`, the result is that of the session.
 */
[[nodiscard]] Result<void> run_receive(network::SessionManager& manager,
                                       const ReceiveOptions& options,
                                       QTextStream& out,
                                       QTextStream& err);

/**
 * Browse for `seconds` and print what was found.
 */
[[nodiscard]] Result<void> run_list(network::SessionManager& manager,
                                    const ListOptions& options,
                                    QTextStream& out);

} // namespace dropline::cli
