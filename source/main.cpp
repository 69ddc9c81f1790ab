#include <QCoreApplication>
#include <QHostAddress>
#include <QProcessEnvironment>
#include <QTcpServer>
#include <QtHttpServer/QHttpServer>

#include <cstdio>

#include "ApiRouter.hpp"
#include "AppConfig.hpp"
#include "DailyMaintenance.hpp"
#include "DailyScheduler.hpp"
#include "Errors.hpp"
#include "Logger.hpp"
#include "SQLiteStorage.hpp"
#include "TaskServiceImpl.hpp"

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName("daytrack");

    // ──────────────────────────────
    // 1. Configuration
    // ──────────────────────────────
    QString configError;
    QString helpText;
    const auto config = parseConfig(app.arguments(),
                                    QProcessEnvironment::systemEnvironment(),
                                    &configError, &helpText);
    if (!config) {
        if (!helpText.isEmpty()) {
            fprintf(stdout, "%s", helpText.toLocal8Bit().constData());
            return 0;
        }
        fprintf(stderr, "daytrack: %s\n", configError.toLocal8Bit().constData());
        return 2;
    }

    LogSettings logSettings;
    logSettings.filePath = config->logFile;
    logSettings.level = config->logLevel;
    if (!initLogging(logSettings)) {
        qWarning(appCore) << "Logging to stderr only";
    }

    // ──────────────────────────────
    // 2. Storage and service
    // ──────────────────────────────
    std::shared_ptr<SQLiteStorage> storage;
    try {
        storage = std::make_shared<SQLiteStorage>(config->databasePath);
    } catch (const StorageError &e) {
        qCritical(appCore) << "Cannot open storage:" << e.what();
        return 1;
    }

    auto service = std::make_shared<TaskServiceImpl>(storage);

    // ──────────────────────────────
    // 3. HTTP routes
    // ──────────────────────────────
    QHttpServer server;

    ApiRouter router(service, config->staticDir);
    router.registerRoutes(server);

    // ──────────────────────────────
    // 4. Daily archive and reset
    // ──────────────────────────────
    DailyMaintenance maintenance(service);
    DailyScheduler scheduler;
    scheduler.addDailyJob("archive", config->archiveAt,
                          [&maintenance]() { maintenance.archive(); });
    scheduler.addDailyJob("reset", config->resetAt,
                          [&maintenance]() { maintenance.reset(); });
    scheduler.start();

    // ──────────────────────────────
    // 5. Bind and run
    // ──────────────────────────────
    auto tcp = new QTcpServer(&app);
    if (!tcp->listen(QHostAddress::Any, config->port) || !server.bind(tcp)) {
        qCritical(appCore) << "Server failed to start on port" << config->port
                           << tcp->errorString();
        return 1;
    }

    qInfo(appCore) << "Server running on http://localhost:" << tcp->serverPort();
    qInfo(appCore) << "Daily logging scheduled for" << config->archiveAt.toString("HH:mm");
    qInfo(appCore) << "Daily reset scheduled for" << config->resetAt.toString("HH:mm");

    const int rc = app.exec();
    scheduler.stop();
    shutdownLogging();
    return rc;
}
