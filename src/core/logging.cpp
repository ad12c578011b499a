#include "core/logging.hpp"

#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QMutex>

namespace tuid {

Q_LOGGING_CATEGORY(lcId, "tuid.id", QtInfoMsg)
Q_LOGGING_CATEGORY(lcUuid, "tuid.uuid", QtInfoMsg)
Q_LOGGING_CATEGORY(lcCrypto, "tuid.crypto", QtInfoMsg)
Q_LOGGING_CATEGORY(lcSerde, "tuid.serde", QtInfoMsg)
Q_LOGGING_CATEGORY(lcCli, "tuid.cli", QtInfoMsg)

namespace {

char severity(QtMsgType type) {
    switch (type) {
        case QtDebugMsg: return 'D';
        case QtInfoMsg: return 'I';
        case QtWarningMsg: return 'W';
        case QtCriticalMsg: return 'C';
        case QtFatalMsg: return 'F';
    }
    return '?';
}

QByteArray format_line(QtMsgType type, const QMessageLogContext& ctx, const QString& msg) {
    const auto when = QDateTime::currentDateTimeUtc().toString(Qt::ISODateWithMs);
    const auto category = QLatin1String(ctx.category ? ctx.category : "default");
    return QStringLiteral("%1 %2 %3 %4\n")
        .arg(when, QString(QLatin1Char(severity(type))), category, msg)
        .toUtf8();
}

struct FileSink {
    QMutex mu;
    QFile file;
    QtMessageHandler chained = nullptr;
};

FileSink& sink() {
    static FileSink s;
    return s;
}

void write_to_file(QtMsgType type, const QMessageLogContext& ctx, const QString& msg) {
    auto& s = sink();
    QtMessageHandler chained = nullptr;
    {
        QMutexLocker lock(&s.mu);
        if (s.file.isOpen()) {
            s.file.write(format_line(type, ctx, msg));
            s.file.flush();
        }
        chained = s.chained;
    }

    // Warnings and worse still reach the terminal.
    if (type != QtDebugMsg && type != QtInfoMsg && chained) {
        chained(type, ctx, msg);
    }
}

} // namespace

bool install_file_logging(const QString& path) {
    auto& s = sink();
    {
        QMutexLocker lock(&s.mu);
        s.file.close();

        QDir().mkpath(QFileInfo(path).absolutePath());
        s.file.setFileName(path);
        if (s.file.open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
            lock.unlock();
            const auto previous = qInstallMessageHandler(write_to_file);
            if (previous != write_to_file) {
                lock.relock();
                s.chained = previous;
            }
            return true;
        }
    }

    // The old log file is gone either way; hand messages back.
    uninstall_file_logging();
    return false;
}

void uninstall_file_logging() {
    auto& s = sink();
    QtMessageHandler chained = nullptr;
    {
        QMutexLocker lock(&s.mu);
        chained = s.chained;
        s.chained = nullptr;
        s.file.close();
    }

    const auto current = qInstallMessageHandler(chained);
    if (current != write_to_file) {
        // Not ours to replace.
        qInstallMessageHandler(current);
    }
}

void set_debug_logging(bool enabled) {
    QLoggingCategory::setFilterRules(QStringLiteral("tuid.*.debug=%1\n")
                                         .arg(enabled ? QStringLiteral("true")
                                                      : QStringLiteral("false")));
}

} // namespace tuid
