#include <gtest/gtest.h>

#include <QEventLoop>
#include <QHostAddress>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QNetworkAccessManager>
#include <QNetworkProxy>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <QTcpServer>
#include <QTimer>
#include <QtHttpServer/QHttpServer>
#include <memory>

#include "ApiRouter.hpp"
#include "TestSupport.hpp"

namespace {

struct Reply {
    int status = 0;
    QByteArray body;
    QByteArray allowOrigin;
    bool timedOut = false;

    QJsonDocument json() const { return QJsonDocument::fromJson(body); }
};

} // namespace

// Serves the full route table on an ephemeral localhost port.
class HttpServerTest : public ::testing::Test {
protected:
    void SetUp() override {
        m_service = std::make_shared<TaskServiceImpl>(makeMemoryStorage());
        m_router = std::make_unique<ApiRouter>(m_service,
                                               QString::fromUtf8(DAYTRACK_STATIC_DIR));
        m_server = std::make_unique<QHttpServer>();
        m_router->registerRoutes(*m_server);

        auto tcp = new QTcpServer(m_server.get());
        ASSERT_TRUE(tcp->listen(QHostAddress::LocalHost, 0)) << tcp->errorString().toStdString();
        ASSERT_TRUE(m_server->bind(tcp));
        m_port = tcp->serverPort();

        m_network.setProxy(QNetworkProxy::NoProxy);
    }

    void TearDown() override {
        m_server.reset();
        m_router.reset();
    }

    Reply send(const QByteArray &verb, const QString &path,
               const QByteArray &body = QByteArray()) {
        QNetworkRequest request(
            QUrl(QStringLiteral("http://127.0.0.1:%1%2").arg(m_port).arg(path)));
        request.setAttribute(QNetworkRequest::Http2AllowedAttribute, false);
        if (!body.isEmpty()) {
            request.setHeader(QNetworkRequest::ContentTypeHeader, "application/json");
        }

        QNetworkReply *reply = m_network.sendCustomRequest(request, verb, body);

        Reply out;
        QEventLoop loop;
        QObject::connect(reply, &QNetworkReply::finished, &loop, &QEventLoop::quit);
        QTimer timeout;
        timeout.setSingleShot(true);
        QObject::connect(&timeout, &QTimer::timeout, &loop, [&]() {
            out.timedOut = true;
            loop.quit();
        });
        timeout.start(5000);
        loop.exec();

        if (out.timedOut) {
            reply->abort();
        } else {
            out.status = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
            out.body = reply->readAll();
            out.allowOrigin = reply->rawHeader("Access-Control-Allow-Origin");
        }
        reply->deleteLater();
        return out;
    }

    std::shared_ptr<TaskServiceImpl> m_service;
    std::unique_ptr<ApiRouter> m_router;
    std::unique_ptr<QHttpServer> m_server;
    QNetworkAccessManager m_network;
    quint16 m_port = 0;
};

TEST_F(HttpServerTest, TaskLifecycle) {
    const Reply created = send("POST", "/api/tasks", R"({"text":"  buy milk  "})");
    ASSERT_FALSE(created.timedOut);
    ASSERT_EQ(created.status, 200) << created.body.toStdString();
    EXPECT_EQ(created.json().object(),
              (QJsonObject{{"id", 1}, {"text", "buy milk"}, {"completed", false}}));
    EXPECT_EQ(created.allowOrigin, "*");

    const Reply updated = send("PUT", "/api/tasks/1", R"({"completed":true})");
    ASSERT_EQ(updated.status, 200) << updated.body.toStdString();
    EXPECT_EQ(updated.json().object(), (QJsonObject{{"success", true}}));

    const Reply listed = send("GET", "/api/tasks");
    ASSERT_EQ(listed.status, 200);
    const QJsonArray tasks = listed.json().array();
    ASSERT_EQ(tasks.size(), 1);
    EXPECT_EQ(tasks.at(0).toObject().value("text").toString(), "buy milk");
    EXPECT_EQ(tasks.at(0).toObject().value("completed").toInt(), 1);
    EXPECT_EQ(listed.allowOrigin, "*");

    const Reply removed = send("DELETE", "/api/tasks/1");
    ASSERT_EQ(removed.status, 200);
    EXPECT_EQ(removed.json().object(), (QJsonObject{{"success", true}}));
    EXPECT_TRUE(send("GET", "/api/tasks").json().array().isEmpty());
}

TEST_F(HttpServerTest, ErrorsKeepJsonBodyAndCors) {
    const Reply missing = send("DELETE", "/api/tasks/999");
    EXPECT_EQ(missing.status, 404);
    EXPECT_EQ(missing.json().object(), (QJsonObject{{"error", "Task not found"}}));
    EXPECT_EQ(missing.allowOrigin, "*");

    const Reply blank = send("POST", "/api/tasks", R"({"text":"   "})");
    EXPECT_EQ(blank.status, 400);
    EXPECT_EQ(blank.json().object(), (QJsonObject{{"error", "Task text is required"}}));

    const Reply noBody = send("PUT", "/api/tasks/42");
    EXPECT_EQ(noBody.status, 404);
}

TEST_F(HttpServerTest, UnknownRouteIsJsonNotFound) {
    for (const char *path : {"/api/nope", "/api/tasks/abc"}) {
        const Reply reply = send("GET", QString::fromLatin1(path));
        EXPECT_EQ(reply.status, 404) << path;
        EXPECT_EQ(reply.json().object(), (QJsonObject{{"error", "Route not found"}}))
            << path;
        EXPECT_EQ(reply.allowOrigin, "*") << path;
    }
}

TEST_F(HttpServerTest, TrailingSlashReachesSameHandler) {
    ASSERT_EQ(send("POST", "/api/tasks/", R"({"text":"water plants"})").status, 200);

    const Reply listed = send("GET", "/api/tasks/");
    ASSERT_EQ(listed.status, 200);
    EXPECT_EQ(listed.json().array().size(), 1);

    const Reply cleared = send("DELETE", "/api/tasks");
    ASSERT_EQ(cleared.status, 200);
    EXPECT_EQ(cleared.json().object().value("deleted").toInt(), 1);
}

TEST_F(HttpServerTest, PreflightIsAnswered) {
    for (const char *path : {"/api/tasks", "/api/tasks/7", "/api/logs"}) {
        const Reply reply = send("OPTIONS", QString::fromLatin1(path));
        EXPECT_EQ(reply.status, 204) << path;
        EXPECT_EQ(reply.allowOrigin, "*") << path;
    }
}

TEST_F(HttpServerTest, LogsAppendAndList) {
    const Reply appended = send("POST", "/api/logs",
                                R"({"date":"Sun Oct 18 2026","tasks":[{"text":"a"}]})");
    ASSERT_EQ(appended.status, 200) << appended.body.toStdString();
    EXPECT_TRUE(appended.json().object().value("success").toBool());

    EXPECT_EQ(send("POST", "/api/logs", R"({"tasks":[]})").status, 400);

    const Reply listed = send("GET", "/api/logs");
    ASSERT_EQ(listed.status, 200);
    const QJsonArray logs = listed.json().array();
    ASSERT_EQ(logs.size(), 1);
    EXPECT_EQ(logs.at(0).toObject().value("date").toString(), "Sun Oct 18 2026");
    EXPECT_EQ(listed.allowOrigin, "*");
}

TEST_F(HttpServerTest, LandingPageIsServed) {
    const Reply page = send("GET", "/");

    EXPECT_EQ(page.status, 200);
    EXPECT_TRUE(page.body.contains("/api/tasks"));
}
