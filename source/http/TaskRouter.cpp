#include <QJsonArray>
#include <QJsonObject>
#include <QtHttpServer/QHttpServerRequest>
#include <QtHttpServer/QHttpServerResponse>

#include "ErrorHandler.hpp"
#include "Errors.hpp"
#include "JsonUtils.hpp"
#include "Logger.hpp"
#include "RouteUtils.hpp"
#include "TaskRouter.hpp"

TaskRouter::TaskRouter(std::shared_ptr<ITaskService> service)
    : m_service(std::move(service)) {}

QHttpServerResponse TaskRouter::listTasks() const {
    return guarded("GET /api/tasks", [this](const QString &requestId) {
        qInfo(appHttp) << "[GET] /api/tasks" << "| requestId=" << requestId;

        QJsonArray items;
        for (const Task &task : m_service->listTasks()) {
            items.append(task.toJson());
        }

        return makeJsonArray(items);
    });
}

QHttpServerResponse TaskRouter::createTask(const QByteArray &body) {
    return guarded("POST /api/tasks", [this, &body](const QString &requestId) {
        qInfo(appHttp) << "[POST] /api/tasks"
                       << "bytes=" << body.size()
                       << "| requestId=" << requestId;

        QString parseError;
        const auto payload = parseBodyObject(body, &parseError);
        if (!payload) {
            throw ValidationError("Invalid JSON: " + parseError);
        }

        const QJsonValue text = payload->value("text");
        if (!text.isString()) {
            throw ValidationError(QStringLiteral("Task text is required"));
        }

        const Task created = m_service->addTask(text.toString());

        return makeJson(QJsonObject{{"id", created.id},
                                    {"text", created.text},
                                    {"completed", false}});
    });
}

QHttpServerResponse TaskRouter::updateTask(qint64 taskId, const QByteArray &body) {
    return guarded("PUT /api/tasks/<id>", [this, taskId, &body](const QString &requestId) {
        qInfo(appHttp) << "[PUT] /api/tasks/" << taskId
                       << "bytes=" << body.size()
                       << "| requestId=" << requestId;

        QString parseError;
        const auto payload = parseBodyObject(body, &parseError);
        if (!payload) {
            throw ValidationError("Invalid JSON: " + parseError);
        }

        m_service->setCompletion(taskId, isTruthy(payload->value("completed")));

        return makeJson(QJsonObject{{"success", true}});
    });
}

QHttpServerResponse TaskRouter::deleteTask(qint64 taskId) {
    return guarded("DELETE /api/tasks/<id>", [this, taskId](const QString &requestId) {
        qInfo(appHttp) << "[DELETE] /api/tasks/" << taskId
                       << "| requestId=" << requestId;

        m_service->deleteTask(taskId);

        return makeJson(QJsonObject{{"success", true}});
    });
}

QHttpServerResponse TaskRouter::clearTasks() {
    return guarded("DELETE /api/tasks", [this](const QString &requestId) {
        qInfo(appHttp) << "[DELETE] /api/tasks (all)"
                       << "| requestId=" << requestId;

        const int deleted = m_service->clearAll();

        return makeJson(QJsonObject{{"success", true}, {"deleted", deleted}});
    });
}

void TaskRouter::registerRoutes(QHttpServer &server) {
    using Method = QHttpServerRequest::Method;

    mirrorRoute(server, "/api/tasks", Method::Get,
                [this](const QHttpServerRequest &) { return listTasks(); });

    mirrorRoute(server, "/api/tasks", Method::Post,
                [this](const QHttpServerRequest &request) {
                    return createTask(request.body());
                });

    mirrorRoute(server, "/api/tasks", Method::Delete,
                [this](const QHttpServerRequest &) { return clearTasks(); });

    mirrorRoute(server, "/api/tasks/<arg>", Method::Put,
                [this](qint64 taskId, const QHttpServerRequest &request) {
                    return updateTask(taskId, request.body());
                });

    mirrorRoute(server, "/api/tasks/<arg>", Method::Delete,
                [this](qint64 taskId, const QHttpServerRequest &) {
                    return deleteTask(taskId);
                });
}
