#ifndef DAYTRACK_MODEL_TASK_HPP
#define DAYTRACK_MODEL_TASK_HPP

#include <QJsonObject>
#include <QString>

struct Task {
    qint64 id = -1;
    QString text;
    bool completed = false;
    // SQLite CURRENT_TIMESTAMP text, "yyyy-MM-dd hh:mm:ss" in UTC.
    QString createdAt;

    // Row shape, as stored: completed is 0/1.
    QJsonObject toJson() const {
        return QJsonObject{{"id", id},
                           {"text", text},
                           {"completed", completed ? 1 : 0},
                           {"created_at", createdAt}};
    }
};

#endif // DAYTRACK_MODEL_TASK_HPP
