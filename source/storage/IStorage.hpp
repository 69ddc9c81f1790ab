#ifndef DAYTRACK_STORAGE_ISTORAGE_HPP
#define DAYTRACK_STORAGE_ISTORAGE_HPP

#include <QJsonArray>
#include <QString>
#include <vector>

#include "LogEntry.hpp"
#include "Task.hpp"

// Raw data access. Every method runs a single statement and throws
// StorageError when the driver reports a failure. Row-count results let the
// caller decide whether "nothing matched" is an error.
class IStorage {
public:
    virtual ~IStorage() = default;

    virtual std::vector<Task> getAllTasks() const = 0;
    virtual Task insertTask(const QString &text) = 0;
    virtual int updateCompleted(qint64 id, bool completed) = 0;
    virtual int deleteTask(qint64 id) = 0;
    virtual int deleteAllTasks() = 0;

    virtual std::vector<LogEntry> getAllLogs() const = 0;
    virtual qint64 insertLog(const QString &date, const QString &tasksData) = 0;
};

#endif // DAYTRACK_STORAGE_ISTORAGE_HPP
