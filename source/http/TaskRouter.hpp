#ifndef DAYTRACK_HTTP_TASKROUTER_HPP
#define DAYTRACK_HTTP_TASKROUTER_HPP

#include <QByteArray>
#include <QtHttpServer/QHttpServerResponse>
#include <memory>

#include "IRouter.hpp"
#include "ITaskService.hpp"

// /api/tasks and /api/tasks/<id>. The handlers are public so they can be
// driven without a listening socket.
class TaskRouter : public IRouter {
public:
    explicit TaskRouter(std::shared_ptr<ITaskService> service);

    void registerRoutes(QHttpServer &server) override;

    QHttpServerResponse listTasks() const;
    QHttpServerResponse createTask(const QByteArray &body);
    QHttpServerResponse updateTask(qint64 taskId, const QByteArray &body);
    QHttpServerResponse deleteTask(qint64 taskId);
    QHttpServerResponse clearTasks();

private:
    std::shared_ptr<ITaskService> m_service;
};

#endif // DAYTRACK_HTTP_TASKROUTER_HPP
