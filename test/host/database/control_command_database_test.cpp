#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "database/control_command_database.hpp"
#include "shared/process/mock_command_runner.hpp"

namespace database
{
    using ::testing::_;
    using ::testing::ElementsAre;
    using ::testing::Return;
    using process::exited;
    using process::MockCommandRunner;

    static const char* PROCESS_LIST =
        "GetProcessList\nOK\n"
        "name, description, dispstatus, textstatus, starttime, elapsedtime, pid\n"
        "hdbdaemon, HDB Daemon, GREEN, Running, 2024 01 01 08:00:00, 1:00:00, 1234\n";

    TEST(ControlCommandDatabaseTest, WrapsCommandsInSu)
    {
        MockCommandRunner runner;
        manifest::DatabaseInfo info;
        ControlCommandDatabase db(runner, info);

        EXPECT_THAT(db.commandLine("sapcontrol -nr 00 -function Start"),
                    ElementsAre("su", "-", "hdbadm", "-c", "sapcontrol -nr 00 -function Start"));
    }

    TEST(ControlCommandDatabaseTest, RunsThroughShellWithoutUser)
    {
        MockCommandRunner runner;
        manifest::DatabaseInfo info;
        info.run_as.clear();
        ControlCommandDatabase db(runner, info);

        EXPECT_THAT(db.commandLine("echo GREEN"), ElementsAre("/bin/sh", "-c", "echo GREEN"));
    }

    TEST(ControlCommandDatabaseTest, HealthyWhenTokenPresentAndExitZero)
    {
        MockCommandRunner runner;
        manifest::DatabaseInfo info;
        ControlCommandDatabase db(runner, info);

        EXPECT_CALL(runner, run(ElementsAre("su", "-", "hdbadm", "-c", info.probe_command)))
            .WillOnce(Return(exited(0, PROCESS_LIST)));

        EXPECT_EQ(db.health(), DatabaseState::Healthy);
    }

    TEST(ControlCommandDatabaseTest, UnhealthyCases)
    {
        MockCommandRunner runner;
        manifest::DatabaseInfo info;
        ControlCommandDatabase db(runner, info);

        EXPECT_CALL(runner, run(_))
            // token absent
            .WillOnce(Return(exited(0, "hdbdaemon, HDB Daemon, YELLOW, Initializing\n")))
            // token present but the probe itself failed
            .WillOnce(Return(exited(3, PROCESS_LIST)))
            // case-sensitive match
            .WillOnce(Return(exited(0, "hdbdaemon, green\n")))
            // could not run at all
            .WillOnce(Return(Result<process::CommandOutput>::Error(ResultCode::InternalError, "fork failed")));

        EXPECT_EQ(db.health(), DatabaseState::Unhealthy);
        EXPECT_EQ(db.health(), DatabaseState::Unhealthy);
        EXPECT_EQ(db.health(), DatabaseState::Unhealthy);
        EXPECT_EQ(db.health(), DatabaseState::Unhealthy);
    }

    TEST(ControlCommandDatabaseTest, CustomToken)
    {
        MockCommandRunner runner;
        manifest::DatabaseInfo info;
        info.healthy_token = "running";
        ControlCommandDatabase db(runner, info);

        EXPECT_CALL(runner, run(_)).WillOnce(Return(exited(0, "db is running\n")));
        EXPECT_EQ(db.health(), DatabaseState::Healthy);
    }

    TEST(ControlCommandDatabaseTest, StartReportsExitCode)
    {
        MockCommandRunner runner;
        manifest::DatabaseInfo info;
        ControlCommandDatabase db(runner, info);

        EXPECT_CALL(runner, run(ElementsAre("su", "-", "hdbadm", "-c", info.start_command)))
            .WillOnce(Return(exited(0, "Start\nOK\n")))
            .WillOnce(Return(exited(1, "FAIL: NIECONN_REFUSED\n")));

        EXPECT_TRUE(db.start());

        auto r = db.start();
        EXPECT_EQ(r.code(), ResultCode::CommandFailed);
        EXPECT_STREQ(r.c_str(), "database start command exited with 1");
    }

    TEST(ControlCommandDatabaseTest, StartPropagatesRunnerError)
    {
        MockCommandRunner runner;
        manifest::DatabaseInfo info;
        ControlCommandDatabase db(runner, info);

        EXPECT_CALL(runner, run(_))
            .WillOnce(Return(Result<process::CommandOutput>::Error(ResultCode::InvalidArgument, "empty command")));

        EXPECT_EQ(db.start().code(), ResultCode::InvalidArgument);
    }
}
