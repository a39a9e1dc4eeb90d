#include <QCoreApplication>
#include <QEventLoop>
#include <QFile>
#include <QHostAddress>
#include <QTemporaryDir>
#include <QTimer>

#include "core/logging.hpp"
#include "crypto/keys.hpp"
#include "network/session_manager.hpp"

// Sends one file between two engines on localhost. Exit codes: 0 success,
// 1 setup failure, 2 transfer did not complete, 3 content mismatch.
int main(int argc, char **argv) {
    QCoreApplication app(argc, argv);

    qputenv("DROPLINE_DEBUG", "1");
    dropline::apply_log_environment();

    auto crypto_ready = dropline::crypto::init();
    if (crypto_ready.is_err()) {
        return 1;
    }

    QTemporaryDir sourceDir;
    QTemporaryDir downloadDir;
    if (!sourceDir.isValid() || !downloadDir.isValid()) {
        return 1;
    }

    const QString sourcePath = sourceDir.filePath(QStringLiteral("payload.bin"));
    QByteArray payload(3 * 1024 * 1024 + 17, '\0');
    for (qsizetype i = 0; i < payload.size(); ++i) {
        payload[i] = static_cast<char>((i * 131) & 0xff);
    }
    {
        QFile file(sourcePath);
        if (!file.open(QIODevice::WriteOnly) || file.write(payload) != payload.size()) {
            return 1;
        }
    }

    dropline::EngineConfig senderConfig;
    senderConfig.device = {dropline::DeviceId::generate(), QStringLiteral("A")};
    senderConfig.discovery.enabled = false;

    dropline::EngineConfig receiverConfig = senderConfig;
    receiverConfig.device = {dropline::DeviceId::generate(), QStringLiteral("B")};
    receiverConfig.transfer.download_dir = downloadDir.path();
    receiverConfig.transfer.auto_accept = true;

    dropline::network::SessionManager a(senderConfig);
    dropline::network::SessionManager b(receiverConfig);

    auto portA = a.start(uint16_t{0});
    auto portB = b.start(uint16_t{0});
    if (portA.is_err() || portB.is_err()) {
        return 1;
    }

    auto handle = a.connectToAddress(receiverConfig.device.id, QHostAddress::LocalHost,
                                     portB.unwrap(), {sourcePath});
    if (handle.is_err()) {
        qCritical().noquote() << QString::fromStdString(handle.unwrap_err().describe());
        return 1;
    }

    bool senderDone = false;
    bool receiverDone = false;
    bool completed = true;

    auto watch = [&](dropline::network::SessionManager& manager, bool& done) {
        QObject::connect(&manager, &dropline::network::SessionManager::sessionEvent, &app,
                         [&](const dropline::SessionId&, const dropline::transfer::SessionEvent& event) {
                             if (const auto* changed = std::get_if<dropline::transfer::StateChanged>(&event)) {
                                 if (dropline::transfer::is_terminal(changed->state)) {
                                     done = true;
                                     completed = completed &&
                                         changed->state == dropline::transfer::SessionState::Completed;
                                 }
                             }
                         });
    };
    watch(a, senderDone);
    watch(b, receiverDone);

    QEventLoop loop;
    QTimer timeout;
    timeout.setSingleShot(true);
    timeout.setInterval(20000);
    QObject::connect(&timeout, &QTimer::timeout, &loop, &QEventLoop::quit);

    QTimer poll;
    poll.setInterval(20);
    QObject::connect(&poll, &QTimer::timeout, &loop, [&]() {
        if (senderDone && receiverDone) {
            loop.quit();
        }
    });

    timeout.start();
    poll.start();
    loop.exec();

    if (!senderDone || !receiverDone || !completed) {
        return 2;
    }

    QFile received(downloadDir.filePath(QStringLiteral("payload.bin")));
    if (!received.open(QIODevice::ReadOnly) || received.readAll() != payload) {
        return 3;
    }
    return 0;
}
