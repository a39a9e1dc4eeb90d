#include "core/logging.hpp"

#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QMutex>
#include <QStandardPaths>
#include <QtGlobal>

#include <cstdio>

Q_LOGGING_CATEGORY(droplineWireLog, "dropline.wire")
Q_LOGGING_CATEGORY(droplineDiscoveryLog, "dropline.discovery")
Q_LOGGING_CATEGORY(droplineHandshakeLog, "dropline.handshake")
Q_LOGGING_CATEGORY(droplineTransferLog, "dropline.transfer")
Q_LOGGING_CATEGORY(droplineSessionLog, "dropline.session")

namespace dropline {
namespace {

QString compute_log_file_path() {
    const auto base = QStandardPaths::writableLocation(QStandardPaths::AppLocalDataLocation);
    if (base.isEmpty()) {
        return QString{};
    }
    return QDir(base).filePath(QStringLiteral("logs/dropline.log"));
}

const char* level_tag(QtMsgType type) {
    switch (type) {
        case QtDebugMsg: return "D";
        case QtInfoMsg: return "I";
        case QtWarningMsg: return "W";
        case QtCriticalMsg: return "C";
        case QtFatalMsg: return "F";
    }
    return "?";
}

struct LoggerState {
    QMutex mu;
    QFile file;
    QString path;
    bool mirror_stderr = true;
    bool initialized = false;
};

LoggerState& state() {
    static LoggerState s{};
    return s;
}

void ensure_open(LoggerState& s) {
    if (s.initialized) return;
    s.initialized = true;

    if (s.path.isEmpty()) {
        return;
    }

    QDir dir(QFileInfo(s.path).absolutePath());
    dir.mkpath(QStringLiteral("."));

    s.file.setFileName(s.path);
    if (!s.file.open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
        std::fprintf(stderr, "dropline: cannot open log file %s\n",
                     qPrintable(s.path));
    }
}

void message_handler(QtMsgType type,
                     const QMessageLogContext& ctx,
                     const QString& msg) {
    auto& s = state();
    QMutexLocker lock(&s.mu);
    ensure_open(s);

    const auto ts = QDateTime::currentDateTimeUtc().toString(Qt::ISODateWithMs);
    const auto cat = ctx.category ? QString::fromLatin1(ctx.category) : QStringLiteral("");

    const auto line = QStringLiteral("%1 %2 %3 %4\n")
                          .arg(ts, QString::fromLatin1(level_tag(type)), cat, msg);
    const auto bytes = line.toUtf8();

    if (s.file.isOpen()) {
        s.file.write(bytes);
        s.file.flush();
    }
    if (s.mirror_stderr || !s.file.isOpen()) {
        std::fwrite(bytes.constData(), 1, static_cast<size_t>(bytes.size()), stderr);
    }
}

} // namespace

void install_file_logging(const QString& path, bool mirror_stderr) {
    auto& s = state();
    {
        QMutexLocker lock(&s.mu);
        s.path = path.isEmpty() ? compute_log_file_path() : path;
        s.mirror_stderr = mirror_stderr;
        s.initialized = false;
        if (s.file.isOpen()) {
            s.file.close();
        }
    }
    qSetMessagePattern(QStringLiteral("%{category} %{message}"));
    qInstallMessageHandler(message_handler);
}

QString default_log_file_path() {
    return compute_log_file_path();
}

Result<void, Error> apply_log_level(const QString& level) {
    const auto lower = level.trimmed().toLower();
    QString rules;
    if (lower == QStringLiteral("debug")) {
        rules = QStringLiteral("dropline.*.debug=true");
    } else if (lower == QStringLiteral("info")) {
        rules = QStringLiteral("dropline.*.debug=false\ndropline.*.info=true");
    } else if (lower == QStringLiteral("warning")) {
        rules = QStringLiteral("dropline.*.debug=false\ndropline.*.info=false");
    } else if (lower == QStringLiteral("critical")) {
        rules = QStringLiteral(
            "dropline.*.debug=false\ndropline.*.info=false\ndropline.*.warning=false");
    } else {
        return Result<void, Error>::err(
            Error{ErrorKind::InvalidArgument, "unknown log level: " + level.toStdString()});
    }
    QLoggingCategory::setFilterRules(rules);
    return Result<void, Error>::ok();
}

void apply_log_environment() {
    if (qEnvironmentVariableIntValue("DROPLINE_DEBUG") == 1) {
        QLoggingCategory::setFilterRules(QStringLiteral("dropline.*.debug=true"));
    }
}

} // namespace dropline
