#ifndef DAYTRACK_HTTP_STATICROUTER_HPP
#define DAYTRACK_HTTP_STATICROUTER_HPP

#include <QString>
#include <QtHttpServer/QHttpServerResponse>

#include "IRouter.hpp"

// Landing page at "/" plus the JSON 404 for anything no other router claims.
class StaticRouter : public IRouter {
public:
    explicit StaticRouter(QString staticDir);

    void registerRoutes(QHttpServer &server) override;

    QHttpServerResponse landingPage() const;

private:
    QString m_staticDir;
};

#endif // DAYTRACK_HTTP_STATICROUTER_HPP
