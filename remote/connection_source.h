// *****************************************************************************
// * This file is part of the RemoteFs project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef CONNECTION_SOURCE_H_4471920385562017
#define CONNECTION_SOURCE_H_4471920385562017

#include <chrono>
#include <vector>
#include <rfs/thread.h>
#include "connection_error.h"
#include "remote_session.h"


namespace rfs
{
class ConnectionSource;

/*  move-only owner of a checked-out session: returns it to the pool exactly once
    - explicit release() a second time is a programming error => std::logic_error
    - destructor releases a still-held session; release errors are logged, never thrown      */
class SessionHandle
{
public:
    SessionHandle() {}
    SessionHandle(SessionHandle&& tmp) noexcept : source_(tmp.source_), session_(std::move(tmp.session_)) {}
    SessionHandle& operator=(SessionHandle&& tmp) noexcept;
    ~SessionHandle();

    RemoteSession& operator*() const;
    RemoteSession* operator->() const { return &**this; }

    bool isHeld() const { return static_cast<bool>(session_); }

    void release(); //throw std::logic_error

private:
    friend class ConnectionSource;
    SessionHandle(ConnectionSource& source, std::unique_ptr<RemoteSession>&& session) : source_(&source), session_(std::move(session)) {}

    SessionHandle           (const SessionHandle&) = delete;
    SessionHandle& operator=(const SessionHandle&) = delete;

    ConnectionSource* source_ = nullptr;
    std::unique_ptr<RemoteSession> session_;
};


//acquire and release sessions for one server configuration; thread-safe
//all SessionHandles must be released before the ConnectionSource is destroyed!
class ConnectionSource
{
public:
    ConnectionSource(const ConnectionSettings& settings,
                     const ProtocolClientFactory& clientFactory,
                     const std::shared_ptr<PathLockProvider>& lockProvider,
                     const SessionPoolConfig& poolCfg = SessionPoolConfig());
    ~ConnectionSource();

    /*  reuse a healthy idle session or connect a new one

        connection failures are classified:
            socket timeout  => ConnectionErrorType::timeout
            refused         => ConnectionErrorType::cannotReach
            DNS failure     => ConnectionErrorType::unknownHost
            530, 501        => ConnectionErrorType::invalidCredentials
            421             => ConnectionErrorType::serviceUnavailable
            other reply     => ConnectionErrorType::connectivity
            else            => ConnectionErrorType::generic                 */
    SessionHandle acquire(); //throw ConnectionError

    bool validate(RemoteSession& session) noexcept { return session.validate(); }

    struct Stats
    {
        size_t created    = 0;
        size_t acquired   = 0;
        size_t released   = 0;
        size_t active     = 0;
        size_t peakActive = 0;
    };
    Stats getStats() { return stats_.access([](const Stats& stats) { return stats; }); }

    size_t getIdleCount() { return idleSessions_.access([](const std::vector<IdleSession>& idle) { return idle.size(); }); }

    const ConnectionSettings& getSettings() const { return settings_; }
    const std::shared_ptr<PathLockProvider>& getLockProvider() const { return lockProvider_; }

private:
    ConnectionSource           (const ConnectionSource&) = delete;
    ConnectionSource& operator=(const ConnectionSource&) = delete;

    friend class SessionHandle;
    void release(std::unique_ptr<RemoteSession>&& session) noexcept;

    std::unique_ptr<RemoteSession> createSession(); //throw ConnectionError

    struct IdleSession
    {
        std::unique_ptr<RemoteSession> session;
        std::chrono::steady_clock::time_point lastUseTime;
    };

    const ConnectionSettings settings_;
    const ProtocolClientFactory clientFactory_;
    const std::shared_ptr<PathLockProvider> lockProvider_;
    const SessionPoolConfig poolCfg_;

    Protected<std::vector<IdleSession>> idleSessions_;
    Protected<Stats> stats_;
};
}

#endif //CONNECTION_SOURCE_H_4471920385562017
