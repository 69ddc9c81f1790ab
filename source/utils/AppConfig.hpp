#ifndef DAYTRACK_UTILS_APPCONFIG_HPP
#define DAYTRACK_UTILS_APPCONFIG_HPP

#include <QProcessEnvironment>
#include <QString>
#include <QStringList>
#include <QTime>
#include <optional>

struct AppConfig {
    quint16 port = 3000;
    QString databasePath = QStringLiteral("tasks.db");
    QString logFile = QStringLiteral("daytrack.log");
    QString logLevel = QStringLiteral("info");
    QString staticDir = QStringLiteral("static");
    QTime archiveAt = QTime(23, 59);
    QTime resetAt = QTime(0, 0);
};

// Reads options from the command line, falling back to PORT and DAYTRACK_*
// environment variables, then to the defaults above. Returns nullopt and
// fills outError on a malformed value or an unknown option. "--help" is
// reported through outHelp with the usage text.
std::optional<AppConfig> parseConfig(const QStringList &arguments,
                                     const QProcessEnvironment &env,
                                     QString *outError = nullptr,
                                     QString *outHelp = nullptr);

#endif // DAYTRACK_UTILS_APPCONFIG_HPP
