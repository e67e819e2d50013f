// *****************************************************************************
// * This file is part of the RemoteFs project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include "connection_source.h"
#include <stdexcept>
#include "ftp_listing.h"

using namespace rfs;


namespace
{
//clean-up code: must not throw
void disconnectSession(RemoteSession& session, const std::string& reason) //nothrow
{
    try
    {
        session.disconnect(); //throw SysError
    }
    catch (const SysError& e)
    {
        logExtraError(replaceCpy("Failed to disconnect session for %x.", "%x", fmtPath(session.getDisplayPath(RemotePath()))) +
                      " (" + reason + ")\n\n" + e.toString());
    }
}
}


SessionHandle& SessionHandle::operator=(SessionHandle&& tmp) noexcept
{
    if (this != &tmp)
    {
        if (session_)
            source_->release(std::move(session_));

        source_  = tmp.source_;
        session_ = std::move(tmp.session_);
    }
    return *this;
}


SessionHandle::~SessionHandle()
{
    if (session_)
        source_->release(std::move(session_));
}


RemoteSession& SessionHandle::operator*() const
{
    if (!session_)
        throw std::logic_error(std::string(__FILE__) + '[' + numberTo<std::string>(__LINE__) + "] Session accessed after release.");
    return *session_;
}


void SessionHandle::release() //throw std::logic_error
{
    if (!session_)
        throw std::logic_error(std::string(__FILE__) + '[' + numberTo<std::string>(__LINE__) + "] Session released twice.");

    source_->release(std::move(session_));
}

//===========================================================================================================================

ConnectionSource::ConnectionSource(const ConnectionSettings& settings,
                                   const ProtocolClientFactory& clientFactory,
                                   const std::shared_ptr<PathLockProvider>& lockProvider,
                                   const SessionPoolConfig& poolCfg) :
    settings_(condenseSettings(settings)),
    clientFactory_(clientFactory),
    lockProvider_(lockProvider),
    poolCfg_(poolCfg)
{
    if (!clientFactory_ || !lockProvider_)
        throw std::logic_error(std::string(__FILE__) + '[' + numberTo<std::string>(__LINE__) + "] Contract violation!");
}


ConnectionSource::~ConnectionSource()
{
    idleSessions_.access([](std::vector<IdleSession>& idleSessions)
    {
        //run ~RemoteSession *inside* the lock! => avoid hitting server limits!
        for (IdleSession& idle : idleSessions)
            disconnectSession(*idle.session, "shutdown");
        idleSessions.clear();
    });
}


SessionHandle ConnectionSource::acquire() //throw ConnectionError
{
    std::unique_ptr<RemoteSession> session;

    for (;;) //try idle sessions first: most recently used at the back
    {
        std::optional<IdleSession> idle;
        idleSessions_.access([&](std::vector<IdleSession>& idleSessions)
        {
            if (!idleSessions.empty())
            {
                idle = std::move(idleSessions.back());
                /**/              idleSessions.pop_back();
            }
        });
        if (!idle)
            break;

        if (std::chrono::steady_clock::now() - idle->lastUseTime > poolCfg_.maxIdleTime)
        {
            disconnectSession(*idle->session, "idle timeout"); //it's unclear when the server lets a connection time out, so we do it preemptively
            continue;
        }

        if (!idle->session->validate()) //noexcept
        {
            disconnectSession(*idle->session, "validation failed");
            continue;
        }

        try
        {
            idle->session->applyBorrowSettings(); //throw SysError
        }
        catch (const SysError& e)
        {
            logExtraWarning("Discarding pooled session.\n\n" + e.toString());
            disconnectSession(*idle->session, "borrow settings failed");
            continue;
        }

        session = std::move(idle->session);
        break;
    }

    const bool isNewSession = !session;
    if (isNewSession)
        session = createSession(); //throw ConnectionError

    stats_.access([&](Stats& stats)
    {
        if (isNewSession)
            ++stats.created;
        ++stats.acquired;
        ++stats.active;
        stats.peakActive = std::max(stats.peakActive, stats.active);
    });
    return SessionHandle(*this, std::move(session));
}


void ConnectionSource::release(std::unique_ptr<RemoteSession>&& session) noexcept
{
    stats_.access([](Stats& stats)
    {
        ++stats.released;
        --stats.active;
    });

    std::unique_ptr<RemoteSession> surplusSession = std::move(session);

    idleSessions_.access([&](std::vector<IdleSession>& idleSessions)
    {
        if (idleSessions.size() < poolCfg_.maxIdleSessions)
            idleSessions.push_back({std::move(surplusSession), std::chrono::steady_clock::now()}); //pass ownership
    });

    if (surplusSession) //pool is full
        disconnectSession(*surplusSession, "pool limit reached");
}


std::unique_ptr<RemoteSession> ConnectionSource::createSession() //throw ConnectionError
{
    std::unique_ptr<ProtocolClient> client = clientFactory_();
    if (!client)
        throw std::logic_error(std::string(__FILE__) + '[' + numberTo<std::string>(__LINE__) + "] Contract violation!");

    ProtocolClient& clientRef = *client; //owned by "client" or "session" until the end of this function
    std::unique_ptr<RemoteSession> session;

    const std::string errorMsg = replaceCpy("Unable to connect to %x.", "%x", fmtPath(getDisplayPath(settings_, RemotePath())));

    auto makeError = [&](ConnectionErrorType type, int replyCode, const std::string& details)
    {
        return ConnectionError(type, replyCode, errorMsg, std::string(getConnectionErrorLabel(type)) + (details.empty() ? "" : ": ") + details);
    };

    try
    {
        clientRef.connect(settings_.server, getEffectivePort(settings_.portCfg), std::chrono::seconds(settings_.connectionTimeoutSec)); //throw SysError

        if (!clientRef.login(settings_.username, settings_.password)) //throw SysError
        {
            const int replyCode = clientRef.getReplyCode();
            throw makeError(replyCode == 0 ? ConnectionErrorType::invalidCredentials : classifyReplyCode(replyCode), replyCode,
                            replyCode == 0 ? "" : formatFtpStatus(replyCode));
        }

        RemotePath baseFolder;
        if (!settings_.workingDir.empty())
            baseFolder = sanitizeRemotePath(settings_.workingDir);
        else
            baseFolder = sanitizeRemotePath(clientRef.printWorkingDirectory()); //throw SysError; server home

        session = std::make_unique<RemoteSession>(std::move(client), settings_, lockProvider_, baseFolder);
        session->applyBorrowSettings(); //throw SysError
        return session;
    }
    catch (const SysErrorTimeout& e) { throw makeError(ConnectionErrorType::timeout,     clientRef.getReplyCode(), e.toString()); }
    catch (const SysErrorConnectionRefused& e) { throw makeError(ConnectionErrorType::cannotReach, clientRef.getReplyCode(), e.toString()); }
    catch (const SysErrorUnknownHost& e) { throw makeError(ConnectionErrorType::unknownHost, clientRef.getReplyCode(), e.toString()); }
    catch (const SysErrorFtpProtocol& e)
    {
        const int replyCode = static_cast<int>(e.ftpErrorCode);
        throw makeError(classifyReplyCode(replyCode), replyCode, e.toString());
    }
    catch (const SysError& e)
    {
        const int replyCode = clientRef.getReplyCode();
        throw makeError(classifyReplyCode(replyCode), replyCode, e.toString());
    }
}
