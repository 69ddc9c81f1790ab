#include <QtCore/QFile>
#include <QtCore/QMutex>
#include <QtCore/QMutexLocker>
#include <QtCore/QStringList>

#include <cstdio>

#include "Logger.hpp"

Q_LOGGING_CATEGORY(appCore,  "daytrack.core")
Q_LOGGING_CATEGORY(appHttp,  "daytrack.http")
Q_LOGGING_CATEGORY(appSql,   "daytrack.sql")
Q_LOGGING_CATEGORY(appSched, "daytrack.sched")

namespace {

// Sink state shared with the message handler; every field is read and
// written under `mutex`.
struct LogSink {
    QMutex mutex;
    QFile file;
    bool toFile = false;
    bool toStderr = true;
};

LogSink &sink() {
    static LogSink instance;
    return instance;
}

void messageHandler(QtMsgType type, const QMessageLogContext &ctx, const QString &msg) {
    const QByteArray line = (qFormatLogMessage(type, ctx, msg) + '\n').toUtf8();

    LogSink &out = sink();
    QMutexLocker lock(&out.mutex);

    if (out.toStderr) {
        std::fwrite(line.constData(), 1, static_cast<size_t>(line.size()), stderr);
    }
    if (out.toFile && out.file.write(line) == line.size()) {
        out.file.flush();
    } else if (out.toFile) {
        // disk full or file gone: keep serving, stop writing there
        out.toFile = false;
        std::fprintf(stderr, "daytrack: log file write failed, file sink disabled\n");
    }
}

} // END NAMESPACE

std::optional<QString> filterRulesFor(const QString &level) {
    static const QStringList kLevels{"debug", "info", "warning", "critical"};

    const int threshold = kLevels.indexOf(level.trimmed().toLower());
    if (threshold < 0) {
        return std::nullopt;
    }

    QStringList rules;
    for (int i = 0; i < kLevels.size(); ++i) {
        rules << QString("daytrack.*.%1=%2")
                     .arg(kLevels.at(i), i >= threshold ? QStringLiteral("true")
                                                        : QStringLiteral("false"));
    }
    rules << QStringLiteral("qt.network.ssl.warning=false");
    return rules.join('\n');
}

bool initLogging(const LogSettings &settings) {
    qSetMessagePattern("%{time yyyy-MM-dd hh:mm:ss.zzz} [%{type}] %{category} "
                       "(%{if-debug}%{function}:%{line}%{endif}): %{message}");

    const auto rules = filterRulesFor(settings.level);
    if (rules) {
        QLoggingCategory::setFilterRules(*rules);
    }

    bool fileOpened = true;
    bool fileActive = false;
    {
        LogSink &out = sink();
        QMutexLocker lock(&out.mutex);

        out.toStderr = settings.echoToStderr;
        if (out.file.isOpen()) {
            out.file.close();
        }
        out.toFile = false;

        if (!settings.filePath.isEmpty()) {
            out.file.setFileName(settings.filePath);
            out.toFile = out.file.open(QIODevice::WriteOnly | QIODevice::Append);
            fileOpened = out.toFile;
        }
        fileActive = out.toFile;
    }

    qInstallMessageHandler(messageHandler);

    if (!rules) {
        qWarning(appCore) << "Unknown log level" << settings.level << "- keeping current rules";
    }
    if (!fileOpened) {
        qWarning(appCore) << "Failed to open log file:" << settings.filePath;
    }

    qInfo(appCore) << "Logging initialized, level" << settings.level
                   << (fileActive ? QString("-> %1").arg(settings.filePath)
                                : QString("(stderr only)"));
    return rules.has_value() && fileOpened;
}

void shutdownLogging() {
    qInstallMessageHandler(nullptr);

    LogSink &out = sink();
    QMutexLocker lock(&out.mutex);
    out.toFile = false;
    out.toStderr = true;
    out.file.close();
}

const char* toString(QHttpServerRequest::Method m) {
    using M = QHttpServerRequest::Method;
    switch (m) {
    case M::Get: return "GET";
    case M::Post: return "POST";
    case M::Put: return "PUT";
    case M::Delete: return "DELETE";
    case M::Patch: return "PATCH";
    case M::Head: return "HEAD";
    case M::Options: return "OPTIONS";
    case M::Trace: return "TRACE";
    case M::Connect: return "CONNECT";
    default: return "UNKNOWN";
    }
}
