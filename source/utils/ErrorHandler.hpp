#ifndef DAYTRACK_UTILS_ERRORHANDLER_HPP
#define DAYTRACK_UTILS_ERRORHANDLER_HPP

#include <QDateTime>
#include <QUuid>
#include <QtHttpServer/QHttpServerRequest>
#include <QtHttpServer/QHttpServerResponse>

#include "Errors.hpp"
#include "JsonUtils.hpp"
#include "Logger.hpp"

// Runs one route body and turns the error taxonomy into status codes:
// ValidationError -> 400, NotFoundError -> 404, StorageError and anything
// else derived from std::exception -> 500. Every call gets a request id that
// shows up in the [DONE]/[ERR] log lines.
template <typename Fn>
QHttpServerResponse guarded(const char *routeName, Fn &&fn) {
    const QString requestId = QUuid::createUuid().toString(QUuid::WithoutBraces);
    const qint64 started = QDateTime::currentMSecsSinceEpoch();
    const auto elapsed = [started]() {
        return QDateTime::currentMSecsSinceEpoch() - started;
    };

    try {
        QHttpServerResponse resp = fn(requestId);
        qInfo(appHttp) << "[DONE]" << routeName
                       << "| requestId=" << requestId
                       << "| ms=" << elapsed();
        return resp;
    } catch (const ValidationError &e) {
        qWarning(appHttp) << "[400]" << routeName << "| requestId=" << requestId
                          << "| what=" << e.what();
        return makeError(QString::fromStdString(e.what()),
                         QHttpServerResponse::StatusCode::BadRequest);
    } catch (const NotFoundError &e) {
        qWarning(appHttp) << "[404]" << routeName << "| requestId=" << requestId
                          << "| what=" << e.what();
        return makeError(QString::fromStdString(e.what()),
                         QHttpServerResponse::StatusCode::NotFound);
    } catch (const StorageError &e) {
        qCritical(appHttp) << "[ERR]" << routeName << "| requestId=" << requestId
                           << "| ms=" << elapsed() << "| sql=" << e.what();
        return makeError(QString::fromStdString(e.what()),
                         QHttpServerResponse::StatusCode::InternalServerError);
    } catch (const std::exception &e) {
        qCritical(appHttp) << "[EXC]" << routeName << "| requestId=" << requestId
                           << "| ms=" << elapsed() << "| what=" << e.what();
        return makeError(QString::fromStdString(e.what()),
                         QHttpServerResponse::StatusCode::InternalServerError);
    }
}

#endif // DAYTRACK_UTILS_ERRORHANDLER_HPP
