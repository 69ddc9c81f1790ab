#include <gtest/gtest.h>

#include <QJsonArray>
#include <QJsonObject>

#include "Errors.hpp"
#include "TaskServiceImpl.hpp"
#include "TestSupport.hpp"

class TaskServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        storage = makeMemoryStorage();
        service = std::make_unique<TaskServiceImpl>(storage);
    }

    std::shared_ptr<SQLiteStorage> storage;
    std::unique_ptr<TaskServiceImpl> service;
};

TEST_F(TaskServiceTest, AddTrimsTextAndStartsIncomplete) {
    const auto before = service->listTasks().size();

    const Task task = service->addTask("  buy milk \t");

    EXPECT_EQ(task.text, "buy milk");
    EXPECT_FALSE(task.completed);

    const auto tasks = service->listTasks();
    ASSERT_EQ(tasks.size(), before + 1);
    EXPECT_EQ(tasks.back().text, "buy milk");
    EXPECT_FALSE(tasks.back().completed);
}

TEST_F(TaskServiceTest, BlankTextIsRejectedWithoutWriting) {
    EXPECT_THROW(service->addTask(""), ValidationError);
    EXPECT_THROW(service->addTask("   "), ValidationError);
    EXPECT_THROW(service->addTask("\n\t "), ValidationError);

    EXPECT_TRUE(service->listTasks().empty());
}

TEST_F(TaskServiceTest, SetCompletionTogglesFlag) {
    const Task task = service->addTask("call mom");

    service->setCompletion(task.id, true);
    EXPECT_TRUE(service->listTasks().front().completed);

    service->setCompletion(task.id, false);
    EXPECT_FALSE(service->listTasks().front().completed);
}

TEST_F(TaskServiceTest, SetCompletionOnUnknownIdLeavesRowsAlone) {
    const Task task = service->addTask("read");

    EXPECT_THROW(service->setCompletion(task.id + 100, true), NotFoundError);

    const auto tasks = service->listTasks();
    ASSERT_EQ(tasks.size(), 1u);
    EXPECT_FALSE(tasks.front().completed);
}

TEST_F(TaskServiceTest, DeleteRemovesOneRow) {
    const Task keep = service->addTask("keep");
    const Task drop = service->addTask("drop");

    service->deleteTask(drop.id);

    const auto tasks = service->listTasks();
    ASSERT_EQ(tasks.size(), 1u);
    EXPECT_EQ(tasks.front().id, keep.id);

    EXPECT_THROW(service->deleteTask(drop.id), NotFoundError);
}

TEST_F(TaskServiceTest, ClearAllOnEmptyStoreReturnsZero) {
    EXPECT_EQ(service->clearAll(), 0);
}

TEST_F(TaskServiceTest, ClearAllReturnsDeletedCount) {
    service->addTask("a");
    service->addTask("b");
    service->addTask("c");

    EXPECT_EQ(service->clearAll(), 3);
    EXPECT_TRUE(service->listTasks().empty());
}

TEST_F(TaskServiceTest, AppendLogStoresCompactJson) {
    const QJsonArray tasks{QJsonObject{{"id", 1}, {"text", "x"}, {"completed", 1}}};

    const qint64 id = service->appendLog(QJsonValue("Sun Oct 18 2026"), tasks);

    const auto logs = service->listLogs();
    ASSERT_EQ(logs.size(), 1u);
    EXPECT_EQ(logs.front().id, id);
    EXPECT_EQ(logs.front().date, "Sun Oct 18 2026");
    EXPECT_EQ(logs.front().tasksData, R"([{"completed":1,"id":1,"text":"x"}])");
}

TEST_F(TaskServiceTest, AppendLogAcceptsEmptyList) {
    EXPECT_NO_THROW(service->appendLog(QJsonValue("today"), QJsonArray{}));
    EXPECT_EQ(service->listLogs().front().tasksData, "[]");
}

TEST_F(TaskServiceTest, AppendLogStoresScalarDateAsText) {
    service->appendLog(QJsonValue(20261018), QJsonArray{});
    service->appendLog(QJsonValue(true), QJsonArray{});

    const auto logs = service->listLogs();
    ASSERT_EQ(logs.size(), 2u);
    EXPECT_EQ(logs.at(0).date, "true");
    EXPECT_EQ(logs.at(1).date, "20261018");
}

TEST_F(TaskServiceTest, AppendLogRequiresDateAndTasks) {
    const QJsonArray tasks{QJsonObject{{"id", 1}}};

    EXPECT_THROW(service->appendLog(QJsonValue(QJsonValue::Undefined), tasks),
                 ValidationError);
    EXPECT_THROW(service->appendLog(QJsonValue(""), tasks), ValidationError);
    EXPECT_THROW(service->appendLog(QJsonValue(QJsonValue::Null), tasks),
                 ValidationError);
    EXPECT_THROW(service->appendLog(QJsonValue("today"),
                                    QJsonValue(QJsonValue::Undefined)),
                 ValidationError);
    EXPECT_THROW(service->appendLog(QJsonValue("today"), QJsonValue(false)),
                 ValidationError);
    EXPECT_THROW(service->appendLog(QJsonValue(0), tasks), ValidationError);
    EXPECT_THROW(service->appendLog(QJsonValue(QJsonArray{"2026-10-18"}), tasks),
                 ValidationError);

    EXPECT_TRUE(service->listLogs().empty());
}

TEST(TaskServiceFailureTest, StorageErrorsPropagateVerbatim) {
    TaskServiceImpl service(std::make_shared<FailingStorage>("disk I/O error"));

    try {
        service.listTasks();
        FAIL() << "expected StorageError";
    } catch (const StorageError &e) {
        EXPECT_STREQ(e.what(), "disk I/O error");
    }

    EXPECT_THROW(service.addTask("x"), StorageError);
    EXPECT_THROW(service.clearAll(), StorageError);
}
