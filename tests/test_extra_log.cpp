// *****************************************************************************
// * This file is part of the RemoteFs project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include <thread>
#include <gtest/gtest.h>
#include <rfs/extra_log.h>
#include <rfs/scope_guard.h>

using namespace rfs;


namespace
{
struct ExtraLogTest : public testing::Test
{
    void SetUp() override { fetchExtraLog(); }
};
}


TEST_F(ExtraLogTest, AllLevelsShareOneLog)
{
    logExtraError  ("release failed");
    logExtraWarning("file was modified");
    logExtraInfo   ("deleted");

    const ErrorLog log = fetchExtraLog();
    ASSERT_EQ(log.size(), 3u);
    EXPECT_EQ(log[0].type, MSG_TYPE_ERROR);
    EXPECT_EQ(log[0].message, "release failed");
    EXPECT_EQ(log[1].type, MSG_TYPE_WARNING);
    EXPECT_EQ(log[2].type, MSG_TYPE_INFO);

    EXPECT_TRUE(fetchExtraLog().empty());
}


TEST_F(ExtraLogTest, SinkSeesEveryEntry)
{
    std::vector<std::string> forwarded;
    setExtraLogSink([&](const LogEntry& entry) { forwarded.push_back(entry.message); });
    RFS_ON_SCOPE_EXIT(setExtraLogSink(nullptr));

    logExtraError("one");
    logExtraInfo("two");

    EXPECT_EQ(forwarded, (std::vector<std::string>{"one", "two"}));
    EXPECT_EQ(fetchExtraLog().size(), 2u);
}


TEST_F(ExtraLogTest, ConcurrentLoggingKeepsAllEntries)
{
    std::vector<std::thread> workers;
    for (int i = 0; i < 4; ++i)
        workers.emplace_back([] { for (int j = 0; j < 100; ++j) logExtraInfo("tick"); });
    for (std::thread& t : workers)
        t.join();

    EXPECT_EQ(getStats(fetchExtraLog()).info, 400);
}


TEST(ExtraLog, OutstandingEntriesAreReportedOnDestruction)
{
    ErrorLog reported;
    {
        impl::ExtraLog log;
        log.init([&](const ErrorLog& outstanding) { reported = outstanding; });
        log.log("never fetched", MSG_TYPE_ERROR);
    }
    ASSERT_EQ(reported.size(), 1u);
    EXPECT_EQ(reported[0].message, "never fetched");

    bool called = false;
    {
        impl::ExtraLog log;
        log.init([&](const ErrorLog& /*outstanding*/) { called = true; });
        log.log("fetched", MSG_TYPE_INFO);
        EXPECT_EQ(log.fetchLog().size(), 1u);
    }
    EXPECT_FALSE(called);
}


TEST(ErrorLogFormat, MultiLineMessageIsIndented)
{
    const LogEntry entry{0, MSG_TYPE_WARNING, "first\nsecond"};
    const std::string output = formatMessage(entry);

    ASSERT_EQ(output.front(), '[');
    const size_t prefixEnd = output.find("]  Warning: first\n");
    ASSERT_NE(prefixEnd, std::string::npos);

    const size_t prefixSize = prefixEnd + std::string("]  Warning: ").size();
    EXPECT_EQ(output.substr(prefixSize), "first\n" + std::string(prefixSize, ' ') + "second");
}


TEST(ErrorLogFormat, TypeLabels)
{
    EXPECT_EQ(getMessageTypeLabel(MSG_TYPE_INFO), "Info");
    EXPECT_EQ(getMessageTypeLabel(MSG_TYPE_WARNING), "Warning");
    EXPECT_EQ(getMessageTypeLabel(MSG_TYPE_ERROR), "Error");
}
