#include <gtest/gtest.h>

#include "AppConfig.hpp"

namespace {

QStringList args(std::initializer_list<const char *> rest) {
    QStringList out{QStringLiteral("daytrack")};
    for (const char *arg : rest) {
        out << QString::fromLatin1(arg);
    }
    return out;
}

} // namespace

TEST(AppConfigTest, DefaultsWithoutInput) {
    QString error;
    const auto config = parseConfig(args({}), QProcessEnvironment(), &error);

    ASSERT_TRUE(config.has_value()) << error.toStdString();
    EXPECT_EQ(config->port, 3000);
    EXPECT_EQ(config->databasePath, "tasks.db");
    EXPECT_EQ(config->staticDir, "static");
    EXPECT_EQ(config->archiveAt, QTime(23, 59));
    EXPECT_EQ(config->resetAt, QTime(0, 0));
    EXPECT_EQ(config->logLevel, "info");
}

TEST(AppConfigTest, EnvironmentSuppliesPort) {
    QProcessEnvironment env;
    env.insert("PORT", "8088");
    env.insert("DAYTRACK_DB", "/var/lib/daytrack/tasks.db");

    const auto config = parseConfig(args({}), env);

    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->port, 8088);
    EXPECT_EQ(config->databasePath, "/var/lib/daytrack/tasks.db");
}

TEST(AppConfigTest, CommandLineWinsOverEnvironment) {
    QProcessEnvironment env;
    env.insert("PORT", "8088");
    env.insert("DAYTRACK_ARCHIVE_AT", "22:00");

    const auto config = parseConfig(
        args({"--port", "9000", "--archive-at", "23:30", "--reset-at", "00:05",
              "--log-file", ""}),
        env);

    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->port, 9000);
    EXPECT_EQ(config->archiveAt, QTime(23, 30));
    EXPECT_EQ(config->resetAt, QTime(0, 5));
    EXPECT_TRUE(config->logFile.isEmpty());
}

TEST(AppConfigTest, RejectsBadPort) {
    for (const char *port : {"0", "70000", "http", "-1"}) {
        QString error;
        EXPECT_FALSE(parseConfig(args({"--port", port}), QProcessEnvironment(), &error))
            << port;
        EXPECT_TRUE(error.contains("Invalid port")) << port;
    }
}

TEST(AppConfigTest, RejectsBadTime) {
    QString error;
    EXPECT_FALSE(parseConfig(args({"--reset-at", "25:00"}), QProcessEnvironment(), &error));
    EXPECT_TRUE(error.contains("reset"));

    QProcessEnvironment env;
    env.insert("DAYTRACK_ARCHIVE_AT", "late");
    EXPECT_FALSE(parseConfig(args({}), env, &error));
    EXPECT_TRUE(error.contains("archive"));
}

TEST(AppConfigTest, LogLevelFromEnvironmentOrCommandLine) {
    QProcessEnvironment env;
    env.insert("DAYTRACK_LOG_LEVEL", "Warning");

    const auto fromEnv = parseConfig(args({}), env);
    ASSERT_TRUE(fromEnv.has_value());
    EXPECT_EQ(fromEnv->logLevel, "warning");

    const auto fromCli = parseConfig(args({"--log-level", "debug"}), env);
    ASSERT_TRUE(fromCli.has_value());
    EXPECT_EQ(fromCli->logLevel, "debug");

    QString error;
    EXPECT_FALSE(parseConfig(args({"--log-level", "loud"}), env, &error));
    EXPECT_TRUE(error.contains("log level"));
}

TEST(AppConfigTest, RejectsUnknownOption) {
    QString error;
    EXPECT_FALSE(parseConfig(args({"--verbose"}), QProcessEnvironment(), &error));
    EXPECT_FALSE(error.isEmpty());
}

TEST(AppConfigTest, HelpReturnsUsage) {
    QString error;
    QString help;
    EXPECT_FALSE(parseConfig(args({"--help"}), QProcessEnvironment(), &error, &help));
    EXPECT_TRUE(help.contains("--archive-at"));
}
