// *****************************************************************************
// * This file is part of the RemoteFs project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include <thread>
#include <gtest/gtest.h>
#include <remote/connection_source.h>
#include "fake_ftp_server.h"

using namespace rfs;
using namespace rfs::test;


namespace
{
struct ConnectionSourceTest : public testing::Test
{
    ConnectionError expectConnectionError(ConnectionSource& source)
    {
        try
        {
            SessionHandle session = source.acquire();
        }
        catch (const ConnectionError& e) { return e; }

        ADD_FAILURE() << "acquire() did not fail";
        return ConnectionError(ConnectionErrorType::generic, 0, "", "");
    }

    void SetUp() override { fetchExtraLog(); }

    FakeFtpServer server;
};
}


TEST_F(ConnectionSourceTest, ReleasedSessionIsReused)
{
    ConnectionSource source(makeTestSettings(), server.makeClientFactory(), createLocalPathLockProvider());
    {
        SessionHandle session = source.acquire();
        EXPECT_TRUE(session.isHeld());
        EXPECT_EQ(server.getActiveConnections(), 1u);
    }
    EXPECT_EQ(source.getIdleCount(), 1u);
    {
        SessionHandle session = source.acquire();
        EXPECT_EQ(server.getActiveConnections(), 1u);
    }
    EXPECT_EQ(server.getTotalConnections(), 1u);
    EXPECT_EQ(server.getCommands("NOOP").size(), 1u); //health check before reuse

    const ConnectionSource::Stats stats = source.getStats();
    EXPECT_EQ(stats.created,  1u);
    EXPECT_EQ(stats.acquired, 2u);
    EXPECT_EQ(stats.released, 2u);
    EXPECT_EQ(stats.active,   0u);
}


TEST_F(ConnectionSourceTest, ConcurrentCheckoutsUseSeparateConnections)
{
    ConnectionSource source(makeTestSettings(), server.makeClientFactory(), createLocalPathLockProvider());

    SessionHandle session1 = source.acquire();
    SessionHandle session2 = source.acquire();
    EXPECT_NE(&*session1, &*session2);
    EXPECT_EQ(server.getActiveConnections(), 2u);
    EXPECT_EQ(source.getStats().peakActive, 2u);
}


TEST_F(ConnectionSourceTest, BorrowResetsWorkingDirectory)
{
    server.addFolder("/home/tester");
    ConnectionSettings settings = makeTestSettings();
    settings.workingDir = "home/tester";
    ConnectionSource source(settings, server.makeClientFactory(), createLocalPathLockProvider());
    {
        SessionHandle session = source.acquire();
        EXPECT_EQ(session->getBaseFolder(), RemotePath("home/tester"));
        session->changeWorkingDirectory(RemotePath());
    }
    SessionHandle session = source.acquire();
    EXPECT_EQ(session->getWorkingDirectory(), RemotePath("home/tester"));
}


TEST_F(ConnectionSourceTest, ReleaseTwiceIsAProgrammingError)
{
    ConnectionSource source(makeTestSettings(), server.makeClientFactory(), createLocalPathLockProvider());

    SessionHandle session = source.acquire();
    session.release();
    EXPECT_FALSE(session.isHeld());
    EXPECT_THROW(session.release(), std::logic_error);
    EXPECT_THROW(*session, std::logic_error);
    EXPECT_EQ(source.getStats().released, 1u);
}


TEST_F(ConnectionSourceTest, SelfMoveAssignmentKeepsSession)
{
    ConnectionSource source(makeTestSettings(), server.makeClientFactory(), createLocalPathLockProvider());

    SessionHandle session = source.acquire();
    SessionHandle& sameSession = session;
    session = std::move(sameSession);

    EXPECT_TRUE(session.isHeld());
    EXPECT_EQ(source.getStats().released, 0u);
    EXPECT_EQ(server.getActiveConnections(), 1u);

    session.release();
    EXPECT_EQ(source.getStats().released, 1u);
}


TEST_F(ConnectionSourceTest, MoveAssignmentReleasesPreviousSession)
{
    ConnectionSource source(makeTestSettings(), server.makeClientFactory(), createLocalPathLockProvider());

    SessionHandle first  = source.acquire();
    SessionHandle second = source.acquire();
    first = std::move(second);

    EXPECT_TRUE(first.isHeld());
    EXPECT_FALSE(second.isHeld());
    EXPECT_EQ(source.getStats().released, 1u);
}


TEST_F(ConnectionSourceTest, SurplusSessionsAreDisconnected)
{
    SessionPoolConfig poolCfg;
    poolCfg.maxIdleSessions = 1;
    ConnectionSource source(makeTestSettings(), server.makeClientFactory(), createLocalPathLockProvider(), poolCfg);
    {
        SessionHandle session1 = source.acquire();
        SessionHandle session2 = source.acquire();
    }
    EXPECT_EQ(source.getIdleCount(), 1u);
    EXPECT_EQ(server.getActiveConnections(), 1u);
}


TEST_F(ConnectionSourceTest, ExpiredIdleSessionIsReplaced)
{
    SessionPoolConfig poolCfg;
    poolCfg.maxIdleTime = std::chrono::seconds(0);
    ConnectionSource source(makeTestSettings(), server.makeClientFactory(), createLocalPathLockProvider(), poolCfg);

    source.acquire().release();
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
    SessionHandle session = source.acquire();

    EXPECT_EQ(server.getTotalConnections(), 2u);
    EXPECT_EQ(server.getActiveConnections(), 1u);
}


TEST_F(ConnectionSourceTest, DisconnectFailureIsLoggedNotThrown)
{
    SessionPoolConfig poolCfg;
    poolCfg.maxIdleSessions = 0;
    ConnectionSource source(makeTestSettings(), server.makeClientFactory(), createLocalPathLockProvider(), poolCfg);
    server.setFailDisconnect(true);

    SessionHandle session = source.acquire();
    EXPECT_NO_THROW(session.release());

    const ErrorLog log = fetchExtraLog();
    ASSERT_EQ(getStats(log).error, 1);
    EXPECT_NE(log[0].message.find("Connection reset by peer."), std::string::npos);
}


TEST_F(ConnectionSourceTest, LoginRejectedIsInvalidCredentials)
{
    server.setLoginReplyCode(530);
    ConnectionSource source(makeTestSettings(), server.makeClientFactory(), createLocalPathLockProvider());

    const ConnectionError e = expectConnectionError(source);
    EXPECT_EQ(e.getType(), ConnectionErrorType::invalidCredentials);
    EXPECT_EQ(e.getReplyCode(), 530);
    EXPECT_FALSE(e.isTransientError());
    EXPECT_EQ(source.getStats().active, 0u);
}


TEST_F(ConnectionSourceTest, SyntaxErrorInLoginIsInvalidCredentials)
{
    server.setLoginReplyCode(501);
    ConnectionSource source(makeTestSettings(), server.makeClientFactory(), createLocalPathLockProvider());

    EXPECT_EQ(expectConnectionError(source).getType(), ConnectionErrorType::invalidCredentials);
}


TEST_F(ConnectionSourceTest, ServiceNotAvailableIsTransient)
{
    server.setLoginReplyCode(421);
    ConnectionSource source(makeTestSettings(), server.makeClientFactory(), createLocalPathLockProvider());

    const ConnectionError e = expectConnectionError(source);
    EXPECT_EQ(e.getType(), ConnectionErrorType::serviceUnavailable);
    EXPECT_EQ(e.getReplyCode(), 421);
    EXPECT_TRUE(e.isTransientError());
}


TEST_F(ConnectionSourceTest, OtherReplyCodeIsConnectivityError)
{
    server.setLoginReplyCode(332);
    ConnectionSource source(makeTestSettings(), server.makeClientFactory(), createLocalPathLockProvider());

    const ConnectionError e = expectConnectionError(source);
    EXPECT_EQ(e.getType(), ConnectionErrorType::connectivity);
    EXPECT_EQ(e.getReplyCode(), 332);
}


TEST_F(ConnectionSourceTest, ConnectTimeoutIsTransient)
{
    server.setConnectFailure(ConnectFailure::timeout);
    ConnectionSource source(makeTestSettings(), server.makeClientFactory(), createLocalPathLockProvider());

    const ConnectionError e = expectConnectionError(source);
    EXPECT_EQ(e.getType(), ConnectionErrorType::timeout);
    EXPECT_TRUE(e.isTransientError());
}


TEST_F(ConnectionSourceTest, NetworkFailuresAreClassified)
{
    ConnectionSource source(makeTestSettings(), server.makeClientFactory(), createLocalPathLockProvider());

    server.setConnectFailure(ConnectFailure::refused);
    EXPECT_EQ(expectConnectionError(source).getType(), ConnectionErrorType::cannotReach);

    server.setConnectFailure(ConnectFailure::unknownHost);
    EXPECT_EQ(expectConnectionError(source).getType(), ConnectionErrorType::unknownHost);

    server.setConnectFailure(ConnectFailure::none);
    EXPECT_NO_THROW(source.acquire());
}


TEST_F(ConnectionSourceTest, ErrorMessageHidesPassword)
{
    server.setLoginReplyCode(530);
    ConnectionSource source(makeTestSettings(), server.makeClientFactory(), createLocalPathLockProvider());

    const std::string msg = expectConnectionError(source).toString();
    EXPECT_NE(msg.find("ftp://tester@ftp.example.com"), std::string::npos);
    EXPECT_EQ(msg.find("secret"), std::string::npos);
}
