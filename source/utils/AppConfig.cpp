#include "AppConfig.hpp"

#include <QCommandLineOption>
#include <QCommandLineParser>

#include "Logger.hpp"

namespace {

QString pick(const QCommandLineParser &parser, const QCommandLineOption &option,
             const QProcessEnvironment &env, const QString &envName,
             const QString &fallback) {
    if (parser.isSet(option)) {
        return parser.value(option);
    }
    if (env.contains(envName)) {
        return env.value(envName);
    }
    return fallback;
}

bool parseTimeOfDay(const QString &text, QTime &out) {
    const QTime time = QTime::fromString(text.trimmed(), QStringLiteral("HH:mm"));
    if (!time.isValid()) {
        return false;
    }
    out = time;
    return true;
}

} // END NAMESPACE

std::optional<AppConfig> parseConfig(const QStringList &arguments,
                                     const QProcessEnvironment &env,
                                     QString *outError, QString *outHelp) {
    const auto fail = [outError](const QString &message) -> std::optional<AppConfig> {
        if (outError) {
            *outError = message;
        }
        return std::nullopt;
    };

    AppConfig config;

    QCommandLineParser parser;
    parser.setApplicationDescription("Daily task tracker with nightly archive and reset");
    const QCommandLineOption helpOption = parser.addHelpOption();

    const QCommandLineOption portOption("port", "Listen port (env PORT).", "port");
    const QCommandLineOption dbOption("db", "SQLite database file (env DAYTRACK_DB).", "path");
    const QCommandLineOption logOption("log-file",
                                       "Log file, empty for stderr only (env DAYTRACK_LOG_FILE).",
                                       "path");
    const QCommandLineOption levelOption("log-level",
                                         "debug, info, warning or critical (env DAYTRACK_LOG_LEVEL).",
                                         "level");
    const QCommandLineOption staticOption("static-dir",
                                          "Directory holding index.html (env DAYTRACK_STATIC_DIR).",
                                          "dir");
    const QCommandLineOption archiveOption("archive-at",
                                           "Daily archive time HH:mm (env DAYTRACK_ARCHIVE_AT).",
                                           "time");
    const QCommandLineOption resetOption("reset-at",
                                         "Daily reset time HH:mm (env DAYTRACK_RESET_AT).",
                                         "time");
    parser.addOptions({portOption, dbOption, logOption, levelOption, staticOption,
                       archiveOption, resetOption});

    if (!parser.parse(arguments)) {
        return fail(parser.errorText());
    }

    if (parser.isSet(helpOption)) {
        if (outHelp) {
            *outHelp = parser.helpText();
        }
        return fail(QStringLiteral("help requested"));
    }

    const QString portText = pick(parser, portOption, env, "PORT",
                                  QString::number(config.port));
    bool ok = false;
    const uint port = portText.trimmed().toUInt(&ok);
    if (!ok || port == 0 || port > 65535) {
        return fail(QString("Invalid port: '%1'").arg(portText));
    }
    config.port = static_cast<quint16>(port);

    config.databasePath = pick(parser, dbOption, env, "DAYTRACK_DB", config.databasePath);
    if (config.databasePath.trimmed().isEmpty()) {
        return fail(QStringLiteral("Database path must not be empty"));
    }

    config.logFile = pick(parser, logOption, env, "DAYTRACK_LOG_FILE", config.logFile);
    config.logLevel = pick(parser, levelOption, env, "DAYTRACK_LOG_LEVEL", config.logLevel)
                          .trimmed()
                          .toLower();
    if (!filterRulesFor(config.logLevel)) {
        return fail(QString("Invalid log level: '%1'").arg(config.logLevel));
    }

    config.staticDir = pick(parser, staticOption, env, "DAYTRACK_STATIC_DIR", config.staticDir);

    const QString archiveText = pick(parser, archiveOption, env, "DAYTRACK_ARCHIVE_AT",
                                     config.archiveAt.toString("HH:mm"));
    if (!parseTimeOfDay(archiveText, config.archiveAt)) {
        return fail(QString("Invalid archive time: '%1' (expected HH:mm)").arg(archiveText));
    }

    const QString resetText = pick(parser, resetOption, env, "DAYTRACK_RESET_AT",
                                   config.resetAt.toString("HH:mm"));
    if (!parseTimeOfDay(resetText, config.resetAt)) {
        return fail(QString("Invalid reset time: '%1' (expected HH:mm)").arg(resetText));
    }

    return config;
}
