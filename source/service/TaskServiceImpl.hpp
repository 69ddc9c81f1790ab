#ifndef DAYTRACK_SERVICE_TASKSERVICEIMPL_HPP
#define DAYTRACK_SERVICE_TASKSERVICEIMPL_HPP

#include <memory>
#include <vector>

#include "IStorage.hpp"
#include "ITaskService.hpp"

class TaskServiceImpl : public ITaskService {
public:
    explicit TaskServiceImpl(std::shared_ptr<IStorage> storage);

    std::vector<Task> listTasks() const override;
    Task addTask(const QString &text) override;
    void setCompletion(qint64 taskId, bool completed) override;
    void deleteTask(qint64 taskId) override;
    int clearAll() override;

    std::vector<LogEntry> listLogs() const override;
    qint64 appendLog(const QJsonValue &date, const QJsonValue &tasks) override;

private:
    std::shared_ptr<IStorage> m_storage;
};

#endif // DAYTRACK_SERVICE_TASKSERVICEIMPL_HPP
