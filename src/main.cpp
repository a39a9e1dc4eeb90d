#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDir>
#include <QSettings>
#include <QTextStream>

#include "cli/commands.hpp"
#include "core/config.hpp"
#include "core/logging.hpp"
#include "crypto/keys.hpp"
#include "network/session_manager.hpp"

namespace {

QTextStream& err_stream() {
    static QTextStream stream(stderr);
    return stream;
}

int report(const dropline::Error& error) {
    err_stream() << "dropline: " << QString::fromStdString(error.describe()) << Qt::endl;
    return 1;
}

std::optional<uint16_t> parse_port(const QString& text) {
    bool ok = false;
    const uint value = text.toUInt(&ok);
    if (!ok || value > 65535) {
        return std::nullopt;
    }
    return static_cast<uint16_t>(value);
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName("dropline");
    app.setApplicationVersion("0.1.0");
    app.setOrganizationName("Dropline");
    app.setOrganizationDomain("dropline.local");

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Dropline nearby file sharing"));
    parser.addHelpOption();
    parser.addVersionOption();

    const QCommandLineOption logLevelOption(
        QStringList{QStringLiteral("log-level")},
        QStringLiteral("Log level: debug, info, warning or critical."),
        QStringLiteral("level"));
    parser.addOption(logLevelOption);

    const QCommandLineOption logFileOption(
        QStringList{QStringLiteral("log-file")},
        QStringLiteral("Append log output to this file."),
        QStringLiteral("path"));
    parser.addOption(logFileOption);

    const QCommandLineOption portOption(
        QStringList{QStringLiteral("port")},
        QStringLiteral("Port to listen on."),
        QStringLiteral("port"));
    parser.addOption(portOption);

    const QCommandLineOption nameOption(
        QStringList{QStringLiteral("name")},
        QStringLiteral("Device name shown to peers."),
        QStringLiteral("name"));
    parser.addOption(nameOption);

    const QCommandLineOption destOption(
        QStringList{QStringLiteral("dest")},
        QStringLiteral("Directory received files are written to."),
        QStringLiteral("dir"));
    parser.addOption(destOption);

    const QCommandLineOption trustOption(
        QStringList{QStringLiteral("trust")},
        QStringLiteral("Trust mode: implicit, pin or shared-secret."),
        QStringLiteral("mode"));
    parser.addOption(trustOption);

    const QCommandLineOption discoveryOption(
        QStringList{QStringLiteral("discovery")},
        QStringLiteral("Discovery backend: auto, avahi, udp or off."),
        QStringLiteral("backend"));
    parser.addOption(discoveryOption);

    const QCommandLineOption toOption(
        QStringList{QStringLiteral("to")},
        QStringLiteral("'send': name or id of a discovered device. Without --to, --host "
                       "or --invite the receiver is picked from a list."),
        QStringLiteral("device"));
    parser.addOption(toOption);

    const QCommandLineOption hostOption(
        QStringList{QStringLiteral("host")},
        QStringLiteral("'send': address of the receiver (skips discovery)."),
        QStringLiteral("address"));
    parser.addOption(hostOption);

    const QCommandLineOption portToOption(
        QStringList{QStringLiteral("port-to")},
        QStringLiteral("'send': port of the receiver given with --host."),
        QStringLiteral("port"));
    parser.addOption(portToOption);

    const QCommandLineOption inviteOption(
        QStringList{QStringLiteral("invite")},
        QStringLiteral("'send': invite JSON or a file containing it."),
        QStringLiteral("invite"));
    parser.addOption(inviteOption);

    const QCommandLineOption acceptAllOption(
        QStringList{QStringLiteral("accept-all")},
        QStringLiteral("'receive': accept every transfer without asking."));
    parser.addOption(acceptAllOption);

    const QCommandLineOption pinOption(
        QStringList{QStringLiteral("pin")},
        QStringLiteral("Require verification codes to be confirmed (same as --trust pin)."));
    parser.addOption(pinOption);

    const QCommandLineOption showInviteOption(
        QStringList{QStringLiteral("show-invite")},
        QStringLiteral("'receive': print an invite and require its secret from senders."));
    parser.addOption(showInviteOption);

    const QCommandLineOption inviteAddressOption(
        QStringList{QStringLiteral("invite-address")},
        QStringLiteral("'receive': address to put into the invite."),
        QStringLiteral("address"));
    parser.addOption(inviteAddressOption);

    const QCommandLineOption onceOption(
        QStringList{QStringLiteral("once")},
        QStringLiteral("'receive': exit after the first session ends."));
    parser.addOption(onceOption);

    const QCommandLineOption secondsOption(
        QStringList{QStringLiteral("seconds")},
        QStringLiteral("'list': how long to browse."),
        QStringLiteral("seconds"));
    parser.addOption(secondsOption);

    parser.addPositionalArgument(QStringLiteral("command"),
                                 QStringLiteral("send, receive or list."));
    parser.addPositionalArgument(QStringLiteral("files"),
                                 QStringLiteral("'send': files to send."),
                                 QStringLiteral("[files...]"));
    parser.process(app);

    const auto positional = parser.positionalArguments();
    if (positional.isEmpty()) {
        parser.showHelp(2);
    }
    const QString command = positional.first();

    if (parser.isSet(logFileOption)) {
        dropline::install_file_logging(parser.value(logFileOption));
    }
    dropline::apply_log_environment();
    if (parser.isSet(logLevelOption)) {
        auto level = dropline::apply_log_level(parser.value(logLevelOption));
        if (level.is_err()) {
            return report(level.unwrap_err());
        }
    }

    auto crypto_ready = dropline::crypto::init();
    if (crypto_ready.is_err()) {
        qCritical() << "Failed to initialize libsodium";
        return 1;
    }

    QSettings settings;
    auto config = dropline::load_config(settings);
    dropline::apply_environment(config);

    if (parser.isSet(nameOption)) {
        config.device.name = parser.value(nameOption);
    }
    if (parser.isSet(destOption)) {
        config.transfer.download_dir = QDir(parser.value(destOption)).absolutePath();
    }
    if (parser.isSet(portOption)) {
        const auto port = parse_port(parser.value(portOption));
        if (!port) {
            return report(dropline::Error{dropline::ErrorKind::InvalidArgument, "invalid --port"});
        }
        config.network.port = *port;
    }
    if (parser.isSet(trustOption)) {
        const auto mode = dropline::parse_trust_mode(parser.value(trustOption).toStdString());
        if (!mode) {
            return report(dropline::Error{dropline::ErrorKind::InvalidArgument, "invalid --trust"});
        }
        config.network.trust_mode = *mode;
    }
    if (parser.isSet(pinOption)) {
        config.network.trust_mode = dropline::TrustMode::PinConfirmation;
    }
    if (parser.isSet(discoveryOption)) {
        const auto value = parser.value(discoveryOption);
        if (value == QStringLiteral("off")) {
            config.discovery.enabled = false;
        } else {
            const auto backend = dropline::parse_discovery_backend(value.toStdString());
            if (!backend) {
                return report(dropline::Error{dropline::ErrorKind::InvalidArgument, "invalid --discovery"});
            }
            config.discovery.enabled = true;
            config.discovery.backend = *backend;
        }
    }
    if (command == QStringLiteral("send") &&
        (parser.isSet(hostOption) || parser.isSet(inviteOption))) {
        config.discovery.enabled = false;
    }
    if (parser.isSet(acceptAllOption)) {
        config.transfer.auto_accept = true;
    }

    auto valid = config.validate();
    if (valid.is_err()) {
        return report(valid.unwrap_err());
    }

    dropline::network::SessionManager manager(config);
    QTextStream out(stdout);
    auto& err = err_stream();

    if (command == QStringLiteral("send")) {
        dropline::cli::SendOptions options;
        options.files = positional.mid(1);
        options.to = parser.value(toOption);
        options.host = parser.value(hostOption);
        options.invite = parser.value(inviteOption);
        if (parser.isSet(portToOption)) {
            const auto port = parse_port(parser.value(portToOption));
            if (!port) {
                return report(dropline::Error{dropline::ErrorKind::InvalidArgument, "invalid --port-to"});
            }
            options.hostPort = *port;
        } else {
            options.hostPort = dropline::NetworkConfig::DEFAULT_PORT;
        }

        const auto result = dropline::cli::run_send(manager, options, out, err);
        manager.stop();
        return result.is_ok() ? 0 : report(result.unwrap_err());
    }

    if (command == QStringLiteral("receive")) {
        dropline::cli::ReceiveOptions options;
        options.once = parser.isSet(onceOption);
        options.showInvite = parser.isSet(showInviteOption);
        options.inviteAddress = parser.value(inviteAddressOption);

        const auto result = dropline::cli::run_receive(manager, options, out, err);
        manager.stop();
        return result.is_ok() ? 0 : report(result.unwrap_err());
    }

    if (command == QStringLiteral("list")) {
        dropline::cli::ListOptions options;
        if (parser.isSet(secondsOption)) {
            options.seconds = parser.value(secondsOption).toInt();
        }

        const auto result = dropline::cli::run_list(manager, options, out);
        manager.stop();
        return result.is_ok() ? 0 : report(result.unwrap_err());
    }

    err << "dropline: unknown command '" << command << "'" << Qt::endl;
    return 2;
}
