#include "logging/file_logging.hpp"

#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QMutex>
#include <QStandardPaths>
#include <QtGlobal>
#include <cstdio>

namespace spool::logging {
namespace {

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
    QtMessageHandler previous = nullptr;
};

LoggerState& state() {
    static LoggerState s{};
    return s;
}

void message_handler(QtMsgType type,
                     const QMessageLogContext& ctx,
                     const QString& msg) {
    auto& s = state();
    QMutexLocker lock(&s.mu);

    const auto ts = QDateTime::currentDateTimeUtc().toString(Qt::ISODateWithMs);
    const auto cat = ctx.category ? QString::fromLatin1(ctx.category) : QStringLiteral("default");

    const auto line = QStringLiteral("%1 %2 %3 %4\n")
                          .arg(ts, QString::fromLatin1(level_tag(type)), cat, msg);
    const auto bytes = line.toUtf8();

    if (s.file.isOpen()) {
        s.file.write(bytes);
        s.file.flush();
    }
    std::fwrite(bytes.constData(), 1, static_cast<size_t>(bytes.size()), stderr);
}

} // namespace

Result<void, Error> install_file_logging(const QString& path) {
    auto& s = state();
    {
        QMutexLocker lock(&s.mu);
        if (s.file.isOpen()) {
            s.file.close();
        }

        QDir dir(QFileInfo(path).absolutePath());
        if (!dir.mkpath(QStringLiteral("."))) {
            return fail(ErrorCode::IoFailure,
                        "Cannot create log directory " + dir.path().toStdString());
        }

        s.file.setFileName(path);
        if (!s.file.open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
            return fail(ErrorCode::IoFailure,
                        "Cannot open log file " + path.toStdString() + ": " +
                        s.file.errorString().toStdString());
        }
    }

    // The handler stamps time, level and category itself.
    qSetMessagePattern(QStringLiteral("%{category} %{message}"));
    QtMessageHandler previous = qInstallMessageHandler(message_handler);
    if (previous != message_handler) {
        s.previous = previous;
    }
    return Result<void, Error>::ok();
}

void uninstall_file_logging() {
    auto& s = state();
    qInstallMessageHandler(s.previous);
    QMutexLocker lock(&s.mu);
    s.previous = nullptr;
    if (s.file.isOpen()) {
        s.file.close();
    }
}

QString default_log_file_path() {
    const auto base = QStandardPaths::writableLocation(QStandardPaths::AppLocalDataLocation);
    if (base.isEmpty()) {
        return QString{};
    }
    return QDir(base).filePath(QStringLiteral("logs/spool.log"));
}

} // namespace spool::logging
