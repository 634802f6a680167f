#include <gtest/gtest.h>

#include "result.h"
#include "result_helper.hpp"

namespace
{
    Result<void> forward(Result<int> r)
    {
        RETURN_IF_ERR(r);
        return OK();
    }

    Result<void> forwardWithContext(Result<void> r)
    {
        RETURN_IF_ERR_MSG(r, "reload");
        return OK();
    }
}

TEST(ResultTest, DefaultIsSuccess)
{
    Result<void> r;
    EXPECT_TRUE(r);
    EXPECT_FALSE(r.hasError());
    EXPECT_EQ(r.code(), ResultCode::OK);
    EXPECT_STREQ(r.c_str(), "");
}

TEST(ResultTest, ValueAndError)
{
    auto ok = Result<std::string>::OK("sapinit");
    ASSERT_TRUE(ok);
    EXPECT_EQ(ok.value(), "sapinit");

    auto bad = Result<std::string>::Error(ResultCode::NotFound, "no such unit");
    EXPECT_FALSE(bad);
    EXPECT_TRUE(bad.hasError());
    EXPECT_EQ(bad.code(), ResultCode::NotFound);
    EXPECT_EQ(bad.error().value_or(""), "no such unit");
}

TEST(ResultTest, DuplicateIgnoredCountsAsSuccess)
{
    auto r = DuplicateIgnored("already there");
    EXPECT_TRUE(r);
    EXPECT_FALSE(r.hasError());
    EXPECT_EQ(r.code(), ResultCode::DuplicateIgnored);
}

TEST(ResultTest, ToStringIncludesMessage)
{
    EXPECT_EQ(to_string(Error(ResultCode::Timeout, "database not online")), "Timeout: database not online");
    EXPECT_EQ(to_string(Error(ResultCode::CommandFailed)), "CommandFailed");
    EXPECT_EQ(to_string(OK()), "OK");
    EXPECT_STREQ(to_string(ResultCode::InstallFailed), "InstallFailed");
}

TEST(ResultTest, ReturnIfErrForwardsCodeAndMessage)
{
    EXPECT_TRUE(forward(Result<int>::OK(1)));

    auto r = forward(Result<int>::Error(ResultCode::PermissionDenied, "denied"));
    EXPECT_EQ(r.code(), ResultCode::PermissionDenied);
    EXPECT_STREQ(r.c_str(), "denied");
}

TEST(ResultTest, ReturnIfErrMsgPrefixesContext)
{
    EXPECT_TRUE(forwardWithContext(OK()));
    EXPECT_STREQ(forwardWithContext(Error(ResultCode::CommandFailed, "exit 1")).c_str(), "reload: exit 1");
    EXPECT_STREQ(forwardWithContext(Error(ResultCode::CommandFailed)).c_str(), "reload");
}
