#ifndef DAYTRACK_HTTP_ROUTEUTILS_HPP
#define DAYTRACK_HTTP_ROUTEUTILS_HPP

#include <QHttpHeaders>
#include <QString>
#include <QtHttpServer/QHttpServer>
#include <QtHttpServer/QHttpServerRequest>
#include <QtHttpServer/QHttpServerResponder>
#include <QtHttpServer/QHttpServerResponse>

#include "JsonUtils.hpp"
#include "Logger.hpp"

// Registers the handler for both "path" and "path/".
template <typename Handler>
void mirrorRoute(QHttpServer &server, const char *path,
                 QHttpServerRequest::Method method, Handler handler) {
    server.route(path, method, handler);

    QString withSlash = QString::fromLatin1(path);
    if (!withSlash.endsWith('/')) {
        withSlash.append('/');
    }

    server.route(withSlash.toLatin1().constData(), method, handler);
}

inline void addCorsHeaders(QHttpServerResponse &response) {
    QHttpHeaders headers = response.headers();
    headers.replaceOrAppend(QHttpHeaders::WellKnownHeader::AccessControlAllowOrigin,
                            "*");
    response.setHeaders(std::move(headers));
}

inline QHttpServerResponse makePreflightResponse() {
    QHttpServerResponse response(QHttpServerResponse::StatusCode::NoContent);

    QHttpHeaders headers;
    headers.append(QHttpHeaders::WellKnownHeader::AccessControlAllowMethods,
                   "GET, POST, PUT, DELETE, OPTIONS");
    headers.append(QHttpHeaders::WellKnownHeader::AccessControlAllowHeaders,
                   "Content-Type");
    response.setHeaders(std::move(headers));
    addCorsHeaders(response);

    return response;
}

// The missing handler answers through the responder, which bypasses the
// after-request handlers, so the CORS header is added here.
inline QHttpServerResponse makeNotFoundRoute(QHttpServerRequest::Method method,
                                             const QString &path) {
    qWarning(appHttp) << "404 no route for" << toString(method) << path;
    QHttpServerResponse response = makeError(
        QStringLiteral("Route not found"), QHttpServerResponse::StatusCode::NotFound);
    addCorsHeaders(response);
    return response;
}

inline void sendNotFound(QHttpServerResponder &responder,
                         const QHttpServerRequest &request) {
    responder.sendResponse(
        makeNotFoundRoute(request.method(), request.url().path()));
}

// Stamps Access-Control-Allow-Origin on every response and answers
// preflight requests for the API paths.
inline void installCors(QHttpServer &server) {
    using Method = QHttpServerRequest::Method;

    mirrorRoute(server, "/api/tasks", Method::Options,
                [](const QHttpServerRequest &) { return makePreflightResponse(); });
    mirrorRoute(server, "/api/tasks/<arg>", Method::Options,
                [](const QString &, const QHttpServerRequest &) {
                    return makePreflightResponse();
                });
    mirrorRoute(server, "/api/logs", Method::Options,
                [](const QHttpServerRequest &) { return makePreflightResponse(); });

    server.addAfterRequestHandler(&server, [](const QHttpServerRequest &,
                                              QHttpServerResponse &response) {
        addCorsHeaders(response);
    });
}

#endif // DAYTRACK_HTTP_ROUTEUTILS_HPP
