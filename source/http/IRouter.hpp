#ifndef DAYTRACK_HTTP_IROUTER_HPP
#define DAYTRACK_HTTP_IROUTER_HPP

#include <QtHttpServer/QHttpServer>

class IRouter {
public:
    virtual ~IRouter() = default;

    virtual void registerRoutes(QHttpServer &server) = 0;
};

#endif // DAYTRACK_HTTP_IROUTER_HPP
