#include "cli/commands.hpp"

#include <QEventLoop>
#include <QFile>
#include <QFileInfo>
#include <QHostAddress>
#include <QNetworkInterface>
#include <QTimer>
#include <algorithm>
#include <optional>

#include "cli/format.hpp"
#include "cli/prompt.hpp"
#include "network/pairing.hpp"
#include "network/session_manager.hpp"

namespace dropline::cli {

namespace {

template<class... Ts>
struct overloaded : Ts... { using Ts::operator()...; };
template<class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

QString sid(const SessionId& id) {
    return QString::fromStdString(id.short_string());
}

/**
 * End state of one session as seen through sessionEvent.
 */
struct Outcome {
    transfer::SessionState state = transfer::SessionState::Connecting;
    std::optional<Error> error;

    [[nodiscard]] Result<void> toResult() const {
        if (state == transfer::SessionState::Completed) {
            return Result<void>::ok();
        }
        return Result<void>::err(error.value_or(
            Error{ErrorKind::Other, std::string("session ended ") + transfer::to_string(state)}));
    }
};

Result<network::PairingInvite> read_invite(const QString& value) {
    QString json = value;
    if (QFileInfo::exists(value)) {
        QFile file(value);
        if (!file.open(QIODevice::ReadOnly)) {
            return Result<network::PairingInvite>::err(
                Error{ErrorKind::IOFailure, "cannot read " + value.toStdString()});
        }
        json = QString::fromUtf8(file.readAll());
    }
    return network::parse_invite_json(json);
}

QHostAddress default_invite_address() {
    for (const auto& address : QNetworkInterface::allAddresses()) {
        if (address.protocol() == QAbstractSocket::IPv4Protocol && !address.isLoopback()) {
            return address;
        }
    }
    return QHostAddress(QHostAddress::LocalHost);
}

void ask_pin(Prompt& prompt, network::SessionManager& manager, QTextStream& err,
             const SessionId& id, const QString& code) {
    err << "Verification code: " << code << '\n';
    prompt.ask(QStringLiteral("Does the other device show the same code?"),
               [&manager, &err, id](bool accepted) {
                   auto result = manager.confirmPin(id, accepted);
                   if (result.is_err()) {
                       err << QString::fromStdString(result.unwrap_err().describe()) << '\n';
                   }
               });
}

Result<network::SessionHandle> wait_for_endpoint(network::SessionManager& manager,
                                                 const SendOptions& options) {
    auto* discovery = manager.discovery();
    if (!discovery) {
        return Result<network::SessionHandle>::err(
            Error{ErrorKind::InvalidArgument, "discovery is disabled; use --host"});
    }

    auto endpoint = discovery->findEndpoint(options.to);
    if (!endpoint) {
        QEventLoop loop;
        QTimer timeout;
        timeout.setSingleShot(true);
        QObject::connect(&timeout, &QTimer::timeout, &loop, &QEventLoop::quit);
        QObject::connect(discovery, &network::DiscoveryService::endpointFound, &loop,
                         [&](const network::Endpoint&) {
                             endpoint = discovery->findEndpoint(options.to);
                             if (endpoint) {
                                 loop.quit();
                             }
                         });
        timeout.start(options.findTimeout);
        loop.exec();
    }

    if (!endpoint) {
        return Result<network::SessionHandle>::err(
            Error{ErrorKind::DiscoveryFailed, "no device named " + options.to.toStdString() + " found"});
    }
    return manager.connectToEndpoint(*endpoint, options.files);
}

Result<network::SessionHandle> choose_endpoint(network::SessionManager& manager,
                                               const SendOptions& options,
                                               Prompt& prompt,
                                               QTextStream& err) {
    auto* discovery = manager.discovery();
    if (!discovery) {
        return Result<network::SessionHandle>::err(
            Error{ErrorKind::InvalidArgument, "discovery is disabled; use --host or --invite"});
    }

    err << "Looking for devices...\n";
    {
        QEventLoop loop;
        QTimer::singleShot(options.browseTime, &loop, &QEventLoop::quit);
        loop.exec();
    }

    const auto endpoints = sorted_by_name(discovery->endpoints());
    if (endpoints.empty()) {
        return Result<network::SessionHandle>::err(Error{ErrorKind::DiscoveryFailed, "no devices found"});
    }
    err << format_endpoint_choices(endpoints);

    std::optional<size_t> choice;
    bool answered = false;
    QEventLoop loop;
    prompt.askChoice(QStringLiteral("Send to which device?"), endpoints.size(),
                     [&](std::optional<size_t> picked) {
                         choice = picked;
                         answered = true;
                         loop.quit();
                     });
    if (!answered) {
        loop.exec();
    }
    if (!choice) {
        return Result<network::SessionHandle>::err(Error{ErrorKind::Cancelled, "no device chosen"});
    }
    return manager.connectToEndpoint(endpoints[*choice], options.files);
}

} // namespace

Result<void> run_send(network::SessionManager& manager,
                      const SendOptions& options,
                      QTextStream& out,
                      QTextStream& err) {
    if (options.files.isEmpty()) {
        return Result<void>::err(Error{ErrorKind::InvalidArgument, "no files to send"});
    }
    const int targets = (options.to.isEmpty() ? 0 : 1) + (options.host.isEmpty() ? 0 : 1) +
                        (options.invite.isEmpty() ? 0 : 1);
    if (targets > 1) {
        return Result<void>::err(
            Error{ErrorKind::InvalidArgument, "give at most one of --to, --host or --invite"});
    }

    auto started = manager.start(uint16_t{0});
    if (started.is_err()) {
        const auto& error = started.unwrap_err();
        if (error.kind != ErrorKind::DiscoveryFailed || targets == 0 || !options.to.isEmpty()) {
            return Result<void>::err(error);
        }
        err << "warning: " << QString::fromStdString(error.describe()) << '\n';
    }

    Prompt prompt(err);
    Outcome outcome;
    std::optional<SessionId> current;
    QEventLoop loop;

    QObject::connect(&manager, &network::SessionManager::authCodeRequired, &loop,
                     [&](const SessionId& id, const QString& code) {
                         if (current && *current == id) {
                             ask_pin(prompt, manager, err, id, code);
                         }
                     });
    QObject::connect(&manager, &network::SessionManager::sessionEvent, &loop,
                     [&](const SessionId& id, const transfer::SessionEvent& event) {
                         if (!current || *current != id) {
                             return;
                         }
                         std::visit(overloaded{
                             [&](const transfer::ProgressUpdate& update) {
                                 err << '\r' << format_progress(update) << Qt::flush;
                             },
                             [&](const transfer::StateChanged& changed) {
                                 outcome.state = changed.state;
                                 if (changed.state == transfer::SessionState::Negotiating) {
                                     err << "Waiting for the receiver to accept...\n";
                                 }
                                 if (transfer::is_terminal(changed.state)) {
                                     loop.quit();
                                 }
                             },
                             [&](const transfer::ErrorEvent& error) {
                                 outcome.error = Error{error.kind, error.message};
                             },
                         }, event);
                     });

    auto handle = [&]() -> Result<network::SessionHandle> {
        if (!options.invite.isEmpty()) {
            auto invite = read_invite(options.invite);
            if (invite.is_err()) {
                return Result<network::SessionHandle>::err(invite.unwrap_err());
            }
            return manager.connectToInvite(invite.unwrap(), options.files);
        }
        if (!options.host.isEmpty()) {
            const QHostAddress host(options.host);
            if (host.isNull() || options.hostPort == 0) {
                return Result<network::SessionHandle>::err(
                    Error{ErrorKind::InvalidArgument, "invalid address " + options.host.toStdString()});
            }
            return manager.connectToAddress(DeviceId{}, host, options.hostPort, options.files);
        }
        if (!options.to.isEmpty()) {
            return wait_for_endpoint(manager, options);
        }
        return choose_endpoint(manager, options, prompt, err);
    }();
    if (handle.is_err()) {
        return Result<void>::err(handle.unwrap_err());
    }

    current = handle.unwrap().id;
    err << "Sending " << options.files.size() << " file(s), session " << sid(*current) << '\n';
    loop.exec();
    err << '\n';

    auto result = outcome.toResult();
    if (result.is_ok()) {
        out << "Transfer complete.\n";
    }
    return result;
}

Result<void> run_receive(network::SessionManager& manager,
                         const ReceiveOptions& options,
                         QTextStream& out,
                         QTextStream& err) {
    auto started = manager.start();
    if (started.is_err()) {
        const auto& error = started.unwrap_err();
        if (error.kind != ErrorKind::DiscoveryFailed) {
            return Result<void>::err(error);
        }
        err << "warning: " << QString::fromStdString(error.describe()) << '\n';
    }

    out << "Receiving as \"" << manager.config().device.name << "\" on port "
        << manager.listeningPort() << " into " << manager.config().transfer.download_dir << '\n';

    if (options.showInvite) {
        QHostAddress address = options.inviteAddress.isEmpty()
            ? default_invite_address()
            : QHostAddress(options.inviteAddress);
        if (address.isNull()) {
            return Result<void>::err(
                Error{ErrorKind::InvalidArgument, "invalid address " + options.inviteAddress.toStdString()});
        }
        out << network::generate_invite_json(manager.createInvite(address)) << '\n';
    }
    out.flush();

    Prompt prompt(err);
    Outcome last;
    QEventLoop loop;

    QObject::connect(&manager, &network::SessionManager::authCodeRequired, &loop,
                     [&](const SessionId& id, const QString& code) {
                         ask_pin(prompt, manager, err, id, code);
                     });
    QObject::connect(&manager, &network::SessionManager::transferRequested, &loop,
                     [&](const SessionId& id, const QString& peer, const QStringList& names,
                         quint64 total) {
                         err << peer << " wants to send " << names.size() << " file(s), "
                             << format_bytes(total) << ":\n";
                         for (const auto& name : names) {
                             err << "  " << name << '\n';
                         }
                         prompt.ask(QStringLiteral("Accept?"), [&manager, &err, id](bool accepted) {
                             auto result = accepted ? manager.acceptTransfer(id)
                                                    : manager.rejectTransfer(id);
                             if (result.is_err()) {
                                 err << QString::fromStdString(result.unwrap_err().describe()) << '\n';
                             }
                         });
                     });
    QObject::connect(&manager, &network::SessionManager::sessionEvent, &loop,
                     [&](const SessionId& id, const transfer::SessionEvent& event) {
                         std::visit(overloaded{
                             [&](const transfer::ProgressUpdate& update) {
                                 err << '\r' << sid(id) << ' ' << format_progress(update) << Qt::flush;
                             },
                             [&](const transfer::StateChanged& changed) {
                                 if (!transfer::is_terminal(changed.state)) {
                                     return;
                                 }
                                 last = Outcome{changed.state, std::nullopt};
                                 if (changed.state == transfer::SessionState::Completed) {
                                     err << '\n' << sid(id) << " complete\n";
                                 }
                                 if (options.once) {
                                     loop.quit();
                                 }
                             },
                             [&](const transfer::ErrorEvent& error) {
                                 last.error = Error{error.kind, error.message};
                                 err << '\n' << sid(id) << ' '
                                     << QString::fromStdString(last.error->describe()) << '\n';
                             },
                         }, event);
                     });

    loop.exec();
    return options.once ? last.toResult() : Result<void>::ok();
}

Result<void> run_list(network::SessionManager& manager,
                      const ListOptions& options,
                      QTextStream& out) {
    if (!manager.discovery()) {
        return Result<void>::err(Error{ErrorKind::InvalidArgument, "discovery is disabled"});
    }
    auto started = manager.start(uint16_t{0});
    if (started.is_err()) {
        return Result<void>::err(started.unwrap_err());
    }

    QEventLoop loop;
    QTimer::singleShot(std::chrono::seconds(std::max(options.seconds, 1)), &loop, &QEventLoop::quit);
    loop.exec();

    out << format_endpoint_table(manager.discovery()->endpoints());
    return Result<void>::ok();
}

} // namespace dropline::cli
