#ifndef DAYTRACK_SCHEDULER_DAILYSCHEDULER_HPP
#define DAYTRACK_SCHEDULER_DAILYSCHEDULER_HPP

#include <QDateTime>
#include <QObject>
#include <QString>
#include <QTime>
#include <QTimer>
#include <functional>
#include <memory>
#include <vector>

// Runs jobs once a day at a local wall-clock time. Timers never sleep longer
// than maxSleepMs(), so a clock change or a suspended machine delays a job by
// at most that much instead of shifting it for good.
class DailyScheduler : public QObject {
    Q_OBJECT

public:
    using Job = std::function<void()>;
    using Clock = std::function<QDateTime()>;

    static constexpr int kMaxSleepMs = 60 * 1000;

    // An empty clock reads QDateTime::currentDateTime().
    explicit DailyScheduler(QObject *parent = nullptr, Clock clock = {});
    ~DailyScheduler() override;

    // Takes effect on the next arm.
    void setMaxSleepMs(int ms);
    int maxSleepMs() const { return m_maxSleepMs; }

    void addDailyJob(const QString &name, const QTime &at, Job job);

    void start();
    void stop();
    bool isRunning() const { return m_running; }

    // Next run of the named job, invalid if unknown or not started.
    QDateTime nextRun(const QString &name) const;

    // First local time strictly after `now` whose time of day is `at`.
    static QDateTime nextOccurrence(const QDateTime &now, const QTime &at);

signals:
    void jobFinished(const QString &name);

private:
    struct Entry {
        QString name;
        QTime at;
        Job job;
        QTimer timer;
        QDateTime nextRun;
    };

    void arm(Entry &entry);
    void onWake(Entry &entry);

    Clock m_clock;
    std::vector<std::unique_ptr<Entry>> m_entries;
    int m_maxSleepMs = kMaxSleepMs;
    bool m_running = false;
};

#endif // DAYTRACK_SCHEDULER_DAILYSCHEDULER_HPP
