#include <QJsonArray>
#include <QJsonObject>
#include <QtHttpServer/QHttpServerRequest>

#include "ErrorHandler.hpp"
#include "Errors.hpp"
#include "JsonUtils.hpp"
#include "LogRouter.hpp"
#include "Logger.hpp"
#include "RouteUtils.hpp"

LogRouter::LogRouter(std::shared_ptr<ITaskService> service)
    : m_service(std::move(service)) {}

QHttpServerResponse LogRouter::listLogs() const {
    return guarded("GET /api/logs", [this](const QString &requestId) {
        qInfo(appHttp) << "[GET] /api/logs" << "| requestId=" << requestId;

        QJsonArray items;
        for (const LogEntry &entry : m_service->listLogs()) {
            items.append(entry.toJson());
        }

        return makeJsonArray(items);
    });
}

QHttpServerResponse LogRouter::appendLog(const QByteArray &body) {
    return guarded("POST /api/logs", [this, &body](const QString &requestId) {
        qInfo(appHttp) << "[POST] /api/logs"
                       << "bytes=" << body.size()
                       << "| requestId=" << requestId;

        QString parseError;
        const auto payload = parseBodyObject(body, &parseError);
        if (!payload) {
            throw ValidationError("Invalid JSON: " + parseError);
        }

        const qint64 id =
            m_service->appendLog(payload->value("date"), payload->value("tasks"));

        return makeJson(QJsonObject{{"success", true}, {"id", id}});
    });
}

void LogRouter::registerRoutes(QHttpServer &server) {
    using Method = QHttpServerRequest::Method;

    mirrorRoute(server, "/api/logs", Method::Get,
                [this](const QHttpServerRequest &) { return listLogs(); });

    mirrorRoute(server, "/api/logs", Method::Post,
                [this](const QHttpServerRequest &request) {
                    return appendLog(request.body());
                });
}
