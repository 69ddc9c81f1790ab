#include "ApiRouter.hpp"

#include "Logger.hpp"
#include "RouteUtils.hpp"

ApiRouter::ApiRouter(std::shared_ptr<ITaskService> service, QString staticDir)
    : m_tasks(service)
    , m_logs(service)
    , m_static(std::move(staticDir)) {}

void ApiRouter::registerRoutes(QHttpServer &server) {
    m_tasks.registerRoutes(server);
    m_logs.registerRoutes(server);
    m_static.registerRoutes(server);
    installCors(server);

    qInfo(appHttp) << "Routes registered";
}
