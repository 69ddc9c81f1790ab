#ifndef DAYTRACK_SCHEDULER_DAILYMAINTENANCE_HPP
#define DAYTRACK_SCHEDULER_DAILYMAINTENANCE_HPP

#include <QDate>
#include <QString>
#include <functional>
#include <memory>
#include <optional>

#include "ITaskService.hpp"

// The two nightly jobs. Neither throws: failures go to the operational log
// because nobody is waiting on the result.
class DailyMaintenance {
public:
    using TodayFn = std::function<QDate()>;

    explicit DailyMaintenance(std::shared_ptr<ITaskService> service,
                              TodayFn today = &QDate::currentDate);

    // Copies the current task list into the log under today's label.
    // Returns the new log id; nullopt when there was nothing to archive or
    // the write failed.
    std::optional<qint64> archive();

    // Clears the task list. Returns the deleted count, nullopt on failure.
    std::optional<int> reset();

    // "Sun Oct 18 2026"
    static QString dateLabel(const QDate &date);

private:
    std::shared_ptr<ITaskService> m_service;
    TodayFn m_today;
};

#endif // DAYTRACK_SCHEDULER_DAILYMAINTENANCE_HPP
