// *****************************************************************************
// * This file is part of the RemoteFs project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef LAZY_REMOTE_STREAM_H_6038127749251406
#define LAZY_REMOTE_STREAM_H_6038127749251406

#include <chrono>
#include <optional>
#include "connection_source.h"


namespace rfs
{
//runs on the streaming session right before it goes back to the pool
using BeforeReleaseHook = std::function<void(RemoteSession& session)>; //throw FileError


/*  file content stream that connects on first read: UNOPENED -> OPEN -> CLOSED
    - the session is acquired by the first tryRead() and released exactly once: at end of stream, close(), or destruction
    - release happens even if the pre-release hook throws
    - file deleted on the server: ErrorFileDeleted, stream is closed
    - content cannot be opened: FileError, session is released and the stream is closed
    - recheckInterval: before a read, compare current attributes (fetched on a separate session) with the snapshot
        => advisory only: the file may still change between check and read!
    - single owner: NOT thread-safe                                                                               */
class LazyRemoteStream : public InputStream
{
public:
    enum class State
    {
        unopened,
        open,
        closed,
    };

    LazyRemoteStream(ConnectionSource& source,
                     const FileAttributes& file,
                     std::optional<std::chrono::milliseconds> recheckInterval = std::nullopt,
                     const BeforeReleaseHook& beforeRelease = nullptr);
    ~LazyRemoteStream();

    size_t getBlockSize() override; //throw (FileError)

    //may return short; only 0 means EOF! CONTRACT: bytesToRead > 0!
    size_t tryRead(void* buffer, size_t bytesToRead) override; //throw FileError, ErrorFileDeleted, ConnectionError

    void close(); //throw FileError (hook); session is released in any case

    State getState() const { return state_; }
    const FileAttributes& getFileAttributes() const { return file_; }

private:
    LazyRemoteStream           (const LazyRemoteStream&) = delete;
    LazyRemoteStream& operator=(const LazyRemoteStream&) = delete;

    void open(); //throw FileError, ConnectionError
    void recheckAttributes(); //throw FileError, ErrorFileDeleted, ConnectionError
    void closeAfterError() noexcept;

    ConnectionSource& source_;
    const FileAttributes file_;
    const std::optional<std::chrono::milliseconds> recheckInterval_;
    const BeforeReleaseHook beforeRelease_;

    State state_ = State::unopened;
    SessionHandle session_;
    std::unique_ptr<InputStream> content_; //uses session_'s connection
    std::chrono::steady_clock::time_point lastCheckTime_;
};
}

#endif //LAZY_REMOTE_STREAM_H_6038127749251406
