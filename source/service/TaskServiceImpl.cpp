#include "TaskServiceImpl.hpp"

#include <QJsonDocument>
#include <QJsonObject>

#include "Errors.hpp"
#include "JsonUtils.hpp"
#include "Logger.hpp"

namespace {

// Compact JSON text for any value. QJsonDocument only takes arrays and
// objects, so scalars go through a one-element array and lose the brackets.
QString serializeValue(const QJsonValue &value) {
    if (value.isArray()) {
        return LogEntry::serializeTasks(value.toArray());
    }
    if (value.isObject()) {
        return QString::fromUtf8(
            QJsonDocument(value.toObject()).toJson(QJsonDocument::Compact));
    }

    const QByteArray wrapped =
        QJsonDocument(QJsonArray{value}).toJson(QJsonDocument::Compact);
    return QString::fromUtf8(wrapped.mid(1, wrapped.size() - 2));
}

// Text stored in the date column. Strings go in as they are, numbers and
// true as their JSON text; arrays and objects are not a date.
QString dateText(const QJsonValue &date) {
    if (date.isString()) {
        return date.toString();
    }
    if (date.isArray() || date.isObject()) {
        return QString();
    }
    return serializeValue(date);
}

} // END NAMESPACE

TaskServiceImpl::TaskServiceImpl(std::shared_ptr<IStorage> storage)
    : m_storage(std::move(storage)) {}

// ───────────────────────────────────────────────
// Tasks
// ───────────────────────────────────────────────

std::vector<Task> TaskServiceImpl::listTasks() const {
    auto tasks = m_storage->getAllTasks();
    qInfo(appCore) << "[Server] Retrieved" << tasks.size() << "tasks";
    return tasks;
}

Task TaskServiceImpl::addTask(const QString &text) {
    const QString trimmed = text.trimmed();
    if (trimmed.isEmpty()) {
        qWarning(appCore) << "[Server] Attempt to add task with empty text";
        throw ValidationError(QStringLiteral("Task text is required"));
    }

    Task stored = m_storage->insertTask(trimmed);
    qInfo(appCore) << "[Server] Task added:" << stored.text
                   << "(id=" << stored.id << ")";
    return stored;
}

void TaskServiceImpl::setCompletion(qint64 taskId, bool completed) {
    if (m_storage->updateCompleted(taskId, completed) == 0) {
        qWarning(appCore) << "[Server] Task with id" << taskId << "not found";
        throw NotFoundError(QStringLiteral("Task not found"));
    }

    qInfo(appCore) << "[Server] Task" << taskId
                   << (completed ? "completed" : "reopened");
}

void TaskServiceImpl::deleteTask(qint64 taskId) {
    if (m_storage->deleteTask(taskId) == 0) {
        qWarning(appCore) << "[Server] Task with id" << taskId << "not found";
        throw NotFoundError(QStringLiteral("Task not found"));
    }

    qInfo(appCore) << "[Server] Task deleted (id=" << taskId << ")";
}

int TaskServiceImpl::clearAll() {
    const int deleted = m_storage->deleteAllTasks();
    qInfo(appCore) << "[Server] Cleared" << deleted << "tasks";
    return deleted;
}

// ───────────────────────────────────────────────
// Logs
// ───────────────────────────────────────────────

std::vector<LogEntry> TaskServiceImpl::listLogs() const {
    auto logs = m_storage->getAllLogs();
    qInfo(appCore) << "[Server] Retrieved" << logs.size() << "log entries";
    return logs;
}

qint64 TaskServiceImpl::appendLog(const QJsonValue &date, const QJsonValue &tasks) {
    const QString day = isTruthy(date) ? dateText(date) : QString();
    if (day.isEmpty() || !isTruthy(tasks)) {
        qWarning(appCore) << "[Server] Log append rejected: date or tasks missing";
        throw ValidationError(QStringLiteral("Date and tasks are required"));
    }

    const qint64 id = m_storage->insertLog(day, serializeValue(tasks));
    qInfo(appCore) << "[Server] Log appended for" << day << "(id=" << id << ")";
    return id;
}
