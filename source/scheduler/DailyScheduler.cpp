#include "DailyScheduler.hpp"

#include <algorithm>
#include <exception>
#include <utility>

#include "Logger.hpp"

DailyScheduler::DailyScheduler(QObject *parent, Clock clock)
    : QObject(parent), m_clock(std::move(clock)) {
    if (!m_clock) {
        m_clock = []() { return QDateTime::currentDateTime(); };
    }
}

DailyScheduler::~DailyScheduler() { stop(); }

void DailyScheduler::setMaxSleepMs(int ms) {
    m_maxSleepMs = std::max(1, ms);
}

QDateTime DailyScheduler::nextOccurrence(const QDateTime &now, const QTime &at) {
    QDateTime candidate(now.date(), at, now.timeZone());
    if (candidate <= now) {
        candidate = QDateTime(now.date().addDays(1), at, now.timeZone());
    }
    return candidate;
}

void DailyScheduler::addDailyJob(const QString &name, const QTime &at, Job job) {
    auto entry = std::make_unique<Entry>();
    entry->name = name;
    entry->at = at;
    entry->job = std::move(job);
    entry->timer.setSingleShot(true);
    entry->timer.setTimerType(Qt::PreciseTimer);

    Entry *raw = entry.get();
    connect(&raw->timer, &QTimer::timeout, this, [this, raw]() { onWake(*raw); });

    qInfo(appSched) << "Job" << name << "scheduled daily at" << at.toString("HH:mm");
    m_entries.push_back(std::move(entry));

    if (m_running) {
        arm(*raw);
    }
}

void DailyScheduler::start() {
    if (m_running) {
        return;
    }
    m_running = true;

    for (auto &entry : m_entries) {
        entry->nextRun = nextOccurrence(m_clock(), entry->at);
        arm(*entry);
        qInfo(appSched) << "Job" << entry->name << "next run"
                        << entry->nextRun.toString(Qt::ISODate);
    }
}

void DailyScheduler::stop() {
    m_running = false;
    for (auto &entry : m_entries) {
        entry->timer.stop();
        entry->nextRun = QDateTime();
    }
}

QDateTime DailyScheduler::nextRun(const QString &name) const {
    const auto it = std::find_if(m_entries.begin(), m_entries.end(),
                                 [&name](const std::unique_ptr<Entry> &entry) {
                                     return entry->name == name;
                                 });
    return it == m_entries.end() ? QDateTime() : (*it)->nextRun;
}

void DailyScheduler::arm(Entry &entry) {
    if (!entry.nextRun.isValid()) {
        entry.nextRun = nextOccurrence(m_clock(), entry.at);
    }

    const qint64 remaining = m_clock().msecsTo(entry.nextRun);
    const qint64 sleep = std::clamp<qint64>(remaining, 0, m_maxSleepMs);
    entry.timer.start(static_cast<int>(sleep));
}

void DailyScheduler::onWake(Entry &entry) {
    if (!m_running) {
        return;
    }

    const QDateTime now = m_clock();
    if (now < entry.nextRun) {
        arm(entry);
        return;
    }

    qInfo(appSched) << "Running daily job" << entry.name << "at"
                    << now.toString("HH:mm:ss");
    try {
        entry.job();
    } catch (const std::exception &e) {
        qCritical(appSched) << "Job" << entry.name << "failed:" << e.what();
    }

    entry.nextRun = nextOccurrence(m_clock(), entry.at);
    qInfo(appSched) << "Job" << entry.name << "next run"
                    << entry.nextRun.toString(Qt::ISODate);

    emit jobFinished(entry.name);
    arm(entry);
}
