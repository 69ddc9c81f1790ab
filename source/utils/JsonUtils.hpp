#ifndef DAYTRACK_UTILS_JSONUTILS_HPP
#define DAYTRACK_UTILS_JSONUTILS_HPP

#include <QByteArray>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonValue>
#include <QtHttpServer/QHttpServerResponse>
#include <optional>

inline QHttpServerResponse makeJson(const QJsonObject &obj,
                                    QHttpServerResponse::StatusCode status =
                                    QHttpServerResponse::StatusCode::Ok) {
    return QHttpServerResponse(
        "application/json", QJsonDocument(obj).toJson(QJsonDocument::Compact),
        status);
}

inline QHttpServerResponse
makeJsonArray(const QJsonArray &arr, QHttpServerResponse::StatusCode status =
                                     QHttpServerResponse::StatusCode::Ok) {
    return QHttpServerResponse(
        "application/json", QJsonDocument(arr).toJson(QJsonDocument::Compact),
        status);
}

inline QHttpServerResponse makeError(const QString &message,
                                     QHttpServerResponse::StatusCode code) {
    return makeJson(QJsonObject{{"error", message}}, code);
}

// An empty body reads as {} so that bodiless PUT/DELETE requests behave like
// requests with no fields set.
inline std::optional<QJsonObject>
parseBodyObject(const QByteArray &body, QString *outError = nullptr) {
    if (body.trimmed().isEmpty()) {
        return QJsonObject{};
    }

    QJsonParseError parseError{};
    const QJsonDocument doc = QJsonDocument::fromJson(body, &parseError);

    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        if (outError) {
            *outError = parseError.error != QJsonParseError::NoError
                            ? parseError.errorString()
                            : QStringLiteral("expected a JSON object");
        }

        return std::nullopt;
    }

    return doc.object();
}

// Truthiness as a browser client means it: null, false, 0, NaN and "" are false.
inline bool isTruthy(const QJsonValue &value) {
    switch (value.type()) {
    case QJsonValue::Bool:
        return value.toBool();
    case QJsonValue::Double: {
        const double d = value.toDouble();
        return d == d && d != 0.0;
    }
    case QJsonValue::String:
        return !value.toString().isEmpty();
    case QJsonValue::Array:
    case QJsonValue::Object:
        return true;
    case QJsonValue::Null:
    case QJsonValue::Undefined:
    default:
        return false;
    }
}

#endif // DAYTRACK_UTILS_JSONUTILS_HPP
