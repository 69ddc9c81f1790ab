#ifndef DAYTRACK_HTTP_LOGROUTER_HPP
#define DAYTRACK_HTTP_LOGROUTER_HPP

#include <QByteArray>
#include <QtHttpServer/QHttpServerResponse>
#include <memory>

#include "IRouter.hpp"
#include "ITaskService.hpp"

class LogRouter : public IRouter {
public:
    explicit LogRouter(std::shared_ptr<ITaskService> service);

    void registerRoutes(QHttpServer &server) override;

    QHttpServerResponse listLogs() const;
    QHttpServerResponse appendLog(const QByteArray &body);

private:
    std::shared_ptr<ITaskService> m_service;
};

#endif // DAYTRACK_HTTP_LOGROUTER_HPP
