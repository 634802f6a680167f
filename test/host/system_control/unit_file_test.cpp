#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "system_control/unit_file.hpp"

namespace system_control
{
    using ::testing::HasSubstr;
    using ::testing::Not;

    static UnitSpec watcherSpec()
    {
        UnitSpec spec;
        spec.name = "tierwatch.service";
        spec.description = "Database tier and application services check and start";
        spec.exec_path = "/opt/tierwatch/bin/tierwatch";
        spec.exec_args = {"--config", "/etc/tierwatch/tierwatch.yaml"};
        spec.working_dir = "/opt/tierwatch";
        spec.log_path = "/opt/tierwatch/tierwatch.log";
        return spec;
    }

    TEST(UnitFileTest, RendersOneShotRootService)
    {
        auto text = renderUnitFile(watcherSpec());

        EXPECT_THAT(text, HasSubstr("[Unit]\nDescription=Database tier and application services check and start\n"));
        EXPECT_THAT(text, HasSubstr("After=network.target\n"));
        EXPECT_THAT(text, HasSubstr("Type=simple\n"));
        EXPECT_THAT(text, HasSubstr("User=root\n"));
        EXPECT_THAT(text, HasSubstr("Group=root\n"));
        EXPECT_THAT(text, HasSubstr("WorkingDirectory=/opt/tierwatch\n"));
        EXPECT_THAT(text, HasSubstr("ExecStart=/opt/tierwatch/bin/tierwatch --config /etc/tierwatch/tierwatch.yaml\n"));
        EXPECT_THAT(text, HasSubstr("Restart=no\n"));
        EXPECT_THAT(text, HasSubstr("StandardOutput=append:/opt/tierwatch/tierwatch.log\n"));
        EXPECT_THAT(text, HasSubstr("StandardError=append:/opt/tierwatch/tierwatch.log\n"));
        EXPECT_THAT(text, HasSubstr("[Install]\nWantedBy=multi-user.target\n"));
        EXPECT_THAT(text, Not(HasSubstr("Restart=always")));
    }

    TEST(UnitFileTest, QuotesArgumentsWithWhitespace)
    {
        auto spec = watcherSpec();
        spec.exec_path = "/opt/tier watch/tierwatch";
        spec.exec_args = {"--config", "/etc/my configs/t.yaml"};

        auto text = renderUnitFile(spec);
        EXPECT_THAT(text, HasSubstr("ExecStart=\"/opt/tier watch/tierwatch\" --config \"/etc/my configs/t.yaml\"\n"));
    }

    TEST(UnitFileTest, EscapesSpecifiersEverywhere)
    {
        auto spec = watcherSpec();
        spec.description = "100% up";
        spec.log_path = "/var/log/%n.log";

        auto text = renderUnitFile(spec);
        EXPECT_THAT(text, HasSubstr("Description=100%% up\n"));
        EXPECT_THAT(text, HasSubstr("StandardOutput=append:/var/log/%%n.log\n"));
    }

    TEST(UnitFileTest, QuoteExecArg)
    {
        EXPECT_EQ(quoteExecArg("plain"), "plain");
        EXPECT_EQ(quoteExecArg(""), "\"\"");
        EXPECT_EQ(quoteExecArg("a b"), "\"a b\"");
        EXPECT_EQ(quoteExecArg("a;b"), "\"a;b\"");
        EXPECT_EQ(quoteExecArg("it's"), "\"it's\"");
        EXPECT_EQ(quoteExecArg("say \"hi\""), "\"say \\\"hi\\\"\"");
        EXPECT_EQ(quoteExecArg("C:\\x"), "\"C:\\\\x\"");
        EXPECT_EQ(quoteExecArg("$HOME"), "$$HOME");
        EXPECT_EQ(quoteExecArg("50%"), "50%%");
    }
}
