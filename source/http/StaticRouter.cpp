#include <QDir>
#include <QFile>
#include <QtHttpServer/QHttpServerRequest>
#include <QtHttpServer/QHttpServerResponder>

#include "ErrorHandler.hpp"
#include "Errors.hpp"
#include "Logger.hpp"
#include "RouteUtils.hpp"
#include "StaticRouter.hpp"

StaticRouter::StaticRouter(QString staticDir)
    : m_staticDir(std::move(staticDir)) {}

QHttpServerResponse StaticRouter::landingPage() const {
    return guarded("GET /", [this](const QString &requestId) {
        const QString path = QDir(m_staticDir).filePath(QStringLiteral("index.html"));
        qInfo(appHttp) << "[GET] /" << "file:" << path << "| requestId=" << requestId;

        QFile file(path);
        if (!file.open(QIODevice::ReadOnly)) {
            throw NotFoundError(QStringLiteral("Landing page not found"));
        }

        return QHttpServerResponse("text/html; charset=utf-8", file.readAll());
    });
}

void StaticRouter::registerRoutes(QHttpServer &server) {
    server.route("/", QHttpServerRequest::Method::Get,
                 [this](const QHttpServerRequest &) { return landingPage(); });
    server.route("/index.html", QHttpServerRequest::Method::Get,
                 [this](const QHttpServerRequest &) { return landingPage(); });

    server.setMissingHandler(&server, [](const QHttpServerRequest &request,
                                         QHttpServerResponder &responder) {
        sendNotFound(responder, request);
    });
}
