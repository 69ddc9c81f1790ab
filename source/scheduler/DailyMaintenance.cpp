#include "DailyMaintenance.hpp"

#include <QJsonArray>
#include <exception>

#include "Logger.hpp"

DailyMaintenance::DailyMaintenance(std::shared_ptr<ITaskService> service,
                                   TodayFn today)
    : m_service(std::move(service)), m_today(std::move(today)) {}

QString DailyMaintenance::dateLabel(const QDate &date) {
    // QDate::toString(format) uses the C locale, so names stay English.
    return date.toString(QStringLiteral("ddd MMM dd yyyy"));
}

std::optional<qint64> DailyMaintenance::archive() {
    qInfo(appSched) << "Running daily task save...";

    try {
        const auto tasks = m_service->listTasks();
        if (tasks.empty()) {
            qInfo(appSched) << "No tasks to archive";
            return std::nullopt;
        }

        QJsonArray rows;
        for (const Task &task : tasks) {
            rows.append(task.toJson());
        }

        const QString today = dateLabel(m_today());
        const qint64 id = m_service->appendLog(today, rows);
        qInfo(appSched) << "Saved" << tasks.size() << "tasks to log for" << today
                        << "(id=" << id << ")";
        return id;
    } catch (const std::exception &e) {
        qCritical(appSched) << "Error saving tasks to log:" << e.what();
        return std::nullopt;
    }
}

std::optional<int> DailyMaintenance::reset() {
    qInfo(appSched) << "Running daily task reset...";

    try {
        const int deleted = m_service->clearAll();
        qInfo(appSched) << "Reset completed. Deleted" << deleted << "tasks.";
        return deleted;
    } catch (const std::exception &e) {
        qCritical(appSched) << "Error resetting tasks:" << e.what();
        return std::nullopt;
    }
}
