#ifndef DAYTRACK_HTTP_APIROUTER_HPP
#define DAYTRACK_HTTP_APIROUTER_HPP

#include <QString>
#include <memory>

#include "IRouter.hpp"
#include "ITaskService.hpp"
#include "LogRouter.hpp"
#include "StaticRouter.hpp"
#include "TaskRouter.hpp"

// Everything the server answers: task and log API, landing page, JSON 404
// and CORS. Must outlive the QHttpServer it is registered on.
class ApiRouter : public IRouter {
public:
    ApiRouter(std::shared_ptr<ITaskService> service, QString staticDir);

    void registerRoutes(QHttpServer &server) override;

private:
    TaskRouter m_tasks;
    LogRouter m_logs;
    StaticRouter m_static;
};

#endif // DAYTRACK_HTTP_APIROUTER_HPP
