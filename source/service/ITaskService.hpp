#ifndef DAYTRACK_SERVICE_ITASKSERVICE_HPP
#define DAYTRACK_SERVICE_ITASKSERVICE_HPP

#include <QJsonArray>
#include <QJsonValue>
#include <QString>
#include <vector>

#include "LogEntry.hpp"
#include "Task.hpp"

// Task and log operations shared by the HTTP routers and the daily jobs.
// Failures surface as ValidationError, NotFoundError or StorageError.
class ITaskService {
public:
    virtual ~ITaskService() = default;

    virtual std::vector<Task> listTasks() const = 0;
    virtual Task addTask(const QString &text) = 0;
    virtual void setCompletion(qint64 taskId, bool completed) = 0;
    virtual void deleteTask(qint64 taskId) = 0;
    virtual int clearAll() = 0;

    virtual std::vector<LogEntry> listLogs() const = 0;
    virtual qint64 appendLog(const QJsonValue &date, const QJsonValue &tasks) = 0;
};

#endif // DAYTRACK_SERVICE_ITASKSERVICE_HPP
