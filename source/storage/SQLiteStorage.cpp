#include "SQLiteStorage.hpp"

#include <QUuid>
#include <QVariant>
#include <QtSql/QSqlError>
#include <QtSql/QSqlQuery>
#include <QtSql/QSqlRecord>

#include "Errors.hpp"
#include "Logger.hpp"

// ─────────────────────────────────────────────────────────────────────────────
// helpers
// ─────────────────────────────────────────────────────────────────────────────
namespace {

[[noreturn]] void failWith(const char *what, const QSqlError &error) {
    qCritical(appSql) << what << error.text();
    throw StorageError(error.text());
}

void ensureSchema(QSqlDatabase db) {
    QSqlQuery query(db);

    qInfo(appSql) << "Ensuring DB schema...";

    if (!query.exec("CREATE TABLE IF NOT EXISTS tasks ("
                    "  id INTEGER PRIMARY KEY AUTOINCREMENT,"
                    "  text TEXT NOT NULL,"
                    "  completed BOOLEAN DEFAULT 0,"
                    "  created_at DATETIME DEFAULT CURRENT_TIMESTAMP"
                    ");")) {
        failWith("schema tasks:", query.lastError());
    }

    // snapshot table; no link back to tasks
    if (!query.exec("CREATE TABLE IF NOT EXISTS task_logs ("
                    "  id INTEGER PRIMARY KEY AUTOINCREMENT,"
                    "  date TEXT NOT NULL,"
                    "  tasks_data TEXT NOT NULL,"
                    "  created_at DATETIME DEFAULT CURRENT_TIMESTAMP"
                    ");")) {
        failWith("schema task_logs:", query.lastError());
    }

    qInfo(appSql) << "Schema OK";
}

Task rowToTask(const QSqlRecord &record) {
    Task task;
    task.id = record.value("id").toLongLong();
    task.text = record.value("text").toString();
    task.completed = record.value("completed").toInt() != 0;
    task.createdAt = record.value("created_at").toString();

    return task;
}

LogEntry rowToLog(const QSqlRecord &record) {
    LogEntry entry;
    entry.id = record.value("id").toLongLong();
    entry.date = record.value("date").toString();
    entry.tasksData = record.value("tasks_data").toString();
    entry.createdAt = record.value("created_at").toString();

    return entry;
}

} // END NAMESPACE

// ─────────────────────────────────────────────────────────────────────────────
// ctor / dtor
// ─────────────────────────────────────────────────────────────────────────────
SQLiteStorage::SQLiteStorage(const QString &dbPath)
    : m_connectionName(QStringLiteral("daytrack-") +
                       QUuid::createUuid().toString(QUuid::WithoutBraces)) {
    m_db = QSqlDatabase::addDatabase("QSQLITE", m_connectionName);
    m_db.setDatabaseName(dbPath);

    // the destructor does not run when we throw from here
    const auto dropConnection = [this]() {
        m_db.close();
        m_db = QSqlDatabase();
        QSqlDatabase::removeDatabase(m_connectionName);
    };

    if (!m_db.open()) {
        const QSqlError error = m_db.lastError();
        qCritical(appSql) << "Failed to open database:" << dbPath;
        dropConnection();
        failWith("open:", error);
    }

    try {
        ensureSchema(m_db);
    } catch (const StorageError &) {
        dropConnection();
        throw;
    }

    qInfo(appSql) << "SQLiteStorage ready, path:" << dbPath;
}

SQLiteStorage::~SQLiteStorage() {
    m_db.close();
    m_db = QSqlDatabase();
    QSqlDatabase::removeDatabase(m_connectionName);
}

// ─────────────────────────────────────────────────────────────────────────────
// tasks
// ─────────────────────────────────────────────────────────────────────────────
std::vector<Task> SQLiteStorage::getAllTasks() const {
    qInfo(appSql) << "Query: getAllTasks()";
    std::vector<Task> out;

    QSqlQuery query(m_db);
    if (!query.exec("SELECT id, text, completed, created_at FROM tasks "
                    "ORDER BY created_at ASC, id ASC")) {
        failWith("getAllTasks:", query.lastError());
    }

    while (query.next()) {
        out.push_back(rowToTask(query.record()));
    }

    qInfo(appSql) << "→" << out.size() << "tasks fetched";
    return out;
}

Task SQLiteStorage::insertTask(const QString &text) {
    qInfo(appSql) << "Insert task text=" << text;

    QSqlQuery query(m_db);
    query.prepare("INSERT INTO tasks(text) VALUES(?)");
    query.addBindValue(text);

    if (!query.exec()) {
        failWith("insertTask:", query.lastError());
    }

    const qint64 newId = query.lastInsertId().toLongLong();

    QSqlQuery select(m_db);
    select.prepare("SELECT id, text, completed, created_at FROM tasks WHERE id = ?");
    select.addBindValue(newId);

    if (!select.exec()) {
        failWith("insertTask reload:", select.lastError());
    }

    Task task;
    if (select.next()) {
        task = rowToTask(select.record());
    } else {
        task.id = newId;
        task.text = text;
    }

    qInfo(appSql) << "Task inserted id=" << newId;
    return task;
}

int SQLiteStorage::updateCompleted(qint64 id, bool completed) {
    qInfo(appSql) << "Update task id=" << id << "completed=" << completed;

    QSqlQuery query(m_db);
    query.prepare("UPDATE tasks SET completed = ? WHERE id = ?");
    query.addBindValue(completed ? 1 : 0);
    query.addBindValue(id);

    if (!query.exec()) {
        failWith("updateCompleted:", query.lastError());
    }

    const int changes = query.numRowsAffected();
    if (changes == 0) {
        qInfo(appSql) << "No rows updated for id=" << id;
    }
    return changes;
}

int SQLiteStorage::deleteTask(qint64 id) {
    qInfo(appSql) << "Delete task id=" << id;

    QSqlQuery query(m_db);
    query.prepare("DELETE FROM tasks WHERE id = ?");
    query.addBindValue(id);

    if (!query.exec()) {
        failWith("deleteTask:", query.lastError());
    }

    const int changes = query.numRowsAffected();
    qInfo(appSql) << (changes > 0 ? "Deleted" : "Not found") << "id=" << id;
    return changes;
}

int SQLiteStorage::deleteAllTasks() {
    qInfo(appSql) << "Delete ALL tasks";

    QSqlQuery query(m_db);
    if (!query.exec("DELETE FROM tasks")) {
        failWith("clear tasks:", query.lastError());
    }

    const int changes = query.numRowsAffected();
    qInfo(appSql) << "Cleared" << changes << "tasks";
    return changes;
}

// ─────────────────────────────────────────────────────────────────────────────
// logs
// ─────────────────────────────────────────────────────────────────────────────
std::vector<LogEntry> SQLiteStorage::getAllLogs() const {
    qInfo(appSql) << "Query: getAllLogs()";
    std::vector<LogEntry> out;

    QSqlQuery query(m_db);
    if (!query.exec("SELECT id, date, tasks_data, created_at FROM task_logs "
                    "ORDER BY created_at DESC, id DESC")) {
        failWith("getAllLogs:", query.lastError());
    }

    while (query.next()) {
        out.push_back(rowToLog(query.record()));
    }

    qInfo(appSql) << "→" << out.size() << "log entries fetched";
    return out;
}

qint64 SQLiteStorage::insertLog(const QString &date, const QString &tasksData) {
    qInfo(appSql) << "Insert log date=" << date << "bytes=" << tasksData.size();

    QSqlQuery query(m_db);
    query.prepare("INSERT INTO task_logs(date, tasks_data) VALUES(?, ?)");
    query.addBindValue(date);
    query.addBindValue(tasksData);

    if (!query.exec()) {
        failWith("insertLog:", query.lastError());
    }

    const qint64 newId = query.lastInsertId().toLongLong();
    qInfo(appSql) << "Log inserted id=" << newId;
    return newId;
}
