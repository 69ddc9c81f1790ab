#ifndef DAYTRACK_UTILS_LOGGER_HPP
#define DAYTRACK_UTILS_LOGGER_HPP

#include <QtHttpServer/QHttpServerRequest>
#include <QtCore/QLoggingCategory>
#include <QtCore/QString>
#include <optional>

Q_DECLARE_LOGGING_CATEGORY(appCore)
Q_DECLARE_LOGGING_CATEGORY(appHttp)
Q_DECLARE_LOGGING_CATEGORY(appSql)
Q_DECLARE_LOGGING_CATEGORY(appSched)

struct LogSettings {
    QString filePath;                  // empty: no file sink
    QString level = QStringLiteral("info");
    bool echoToStderr = true;
};

// QLoggingCategory rules that keep daytrack.* messages at `level` and above
// ("debug", "info", "warning", "critical"). nullopt for anything else.
std::optional<QString> filterRulesFor(const QString &level);

// Installs the message handler and the filter rules. Returns false when the
// level is unknown or the log file cannot be opened; logging still goes to
// stderr in the second case.
bool initLogging(const LogSettings &settings);
void shutdownLogging();

const char* toString(QHttpServerRequest::Method m);

#endif // DAYTRACK_UTILS_LOGGER_HPP
