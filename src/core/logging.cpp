#include "core/logging.hpp"

#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QMutex>
#include <QtGlobal>

#include <cstdio>

Q_LOGGING_CATEGORY(datlanDiscovery, "datlan.discovery", QtInfoMsg)
Q_LOGGING_CATEGORY(datlanTransport, "datlan.transport", QtInfoMsg)
Q_LOGGING_CATEGORY(datlanApp, "datlan.app")

namespace datlan {
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
    const auto cat = ctx.category ? QString::fromLatin1(ctx.category) : QStringLiteral("");

    const auto line = QStringLiteral("%1 %2 %3 %4\n")
                          .arg(ts, QString::fromLatin1(level_tag(type)), cat, msg)
                          .toUtf8();

    std::fwrite(line.constData(), 1, static_cast<size_t>(line.size()), stderr);
    std::fflush(stderr);

    if (s.file.isOpen()) {
        s.file.write(line);
        s.file.flush();
    }
}

} // namespace

void install_logging(const QString& file_path) {
    auto& s = state();
    {
        QMutexLocker lock(&s.mu);
        if (!file_path.isEmpty() && !s.file.isOpen()) {
            QDir dir(QFileInfo(file_path).absolutePath());
            dir.mkpath(QStringLiteral("."));
            s.file.setFileName(file_path);
            if (!s.file.open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
                std::fprintf(stderr, "datlan: cannot open log file %s\n",
                             qPrintable(file_path));
            }
        }
    }

    qSetMessagePattern(QStringLiteral("%{category} %{message}"));
    qInstallMessageHandler(message_handler);
}

void enable_discovery_debug() {
    QLoggingCategory::setFilterRules(QStringLiteral(
        "datlan.discovery.debug=true\n"
        "datlan.transport.debug=true\n"));
}

} // namespace datlan
