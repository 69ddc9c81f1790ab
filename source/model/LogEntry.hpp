#ifndef DAYTRACK_MODEL_LOGENTRY_HPP
#define DAYTRACK_MODEL_LOGENTRY_HPP

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QString>

struct LogEntry {
    qint64 id = -1;
    QString date;
    // Compact JSON text of the archived rows. Stored and returned untouched.
    QString tasksData;
    QString createdAt;

    QJsonObject toJson() const {
        return QJsonObject{{"id", id},
                           {"date", date},
                           {"tasks_data", tasksData},
                           {"created_at", createdAt}};
    }

    static QString serializeTasks(const QJsonArray &tasks) {
        return QString::fromUtf8(
            QJsonDocument(tasks).toJson(QJsonDocument::Compact));
    }
};

#endif // DAYTRACK_MODEL_LOGENTRY_HPP
