#ifndef DAYTRACK_STORAGE_SQLITESTORAGE_HPP
#define DAYTRACK_STORAGE_SQLITESTORAGE_HPP

#include "IStorage.hpp"
#include <QtSql/QSqlDatabase>

class SQLiteStorage : public IStorage {
public:
    // Opens (or creates) dbPath and ensures both tables exist.
    // Throws StorageError if either step fails.
    explicit SQLiteStorage(const QString &dbPath);
    ~SQLiteStorage() override;

    SQLiteStorage(const SQLiteStorage &) = delete;
    SQLiteStorage &operator=(const SQLiteStorage &) = delete;

    std::vector<Task> getAllTasks() const override;
    Task insertTask(const QString &text) override;
    int updateCompleted(qint64 id, bool completed) override;
    int deleteTask(qint64 id) override;
    int deleteAllTasks() override;

    std::vector<LogEntry> getAllLogs() const override;
    qint64 insertLog(const QString &date, const QString &tasksData) override;

private:
    QString m_connectionName;
    QSqlDatabase m_db;
};

#endif // DAYTRACK_STORAGE_SQLITESTORAGE_HPP
