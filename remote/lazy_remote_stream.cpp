// *****************************************************************************
// * This file is part of the RemoteFs project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include "lazy_remote_stream.h"
#include <rfs/extra_log.h>
#include <rfs/scope_guard.h>

using namespace rfs;


namespace
{
const size_t REMOTE_BLOCK_SIZE_DEFAULT = 64 * 1024;
}


LazyRemoteStream::LazyRemoteStream(ConnectionSource& source,
                                   const FileAttributes& file,
                                   std::optional<std::chrono::milliseconds> recheckInterval,
                                   const BeforeReleaseHook& beforeRelease) :
    source_(source),
    file_(file),
    recheckInterval_(recheckInterval),
    beforeRelease_(beforeRelease) {}


LazyRemoteStream::~LazyRemoteStream()
{
    closeAfterError(); //no exceptions during destruction
}


size_t LazyRemoteStream::getBlockSize() //throw (FileError)
{
    if (content_)
        return content_->getBlockSize(); //throw FileError
    return REMOTE_BLOCK_SIZE_DEFAULT;
}


void LazyRemoteStream::open() //throw FileError, ConnectionError
{
    session_ = source_.acquire(); //throw ConnectionError
    state_ = State::open;
    RFS_ON_SCOPE_FAIL(closeAfterError()); //no content => nothing left to read: release the session right away

    lastCheckTime_ = std::chrono::steady_clock::now();

    content_ = session_->retrieveFileContent(file_); //throw FileError
}


size_t LazyRemoteStream::tryRead(void* buffer, size_t bytesToRead) //throw FileError, ErrorFileDeleted, ConnectionError
{
    if (bytesToRead == 0) //"read() with a count of 0 returns zero" => indistinguishable from end of file! => check!
        throw std::logic_error(std::string(__FILE__) + '[' + numberTo<std::string>(__LINE__) + "] Contract violation!");

    if (state_ == State::closed)
        return 0;

    try
    {
        if (state_ == State::unopened)
            open(); //throw FileError, ConnectionError
        else if (recheckInterval_ && std::chrono::steady_clock::now() - lastCheckTime_ >= *recheckInterval_)
            recheckAttributes(); //throw FileError, ErrorFileDeleted, ConnectionError

        const size_t bytesRead = content_->tryRead(buffer, bytesToRead); //throw FileError, ErrorItemNotFound
        if (bytesRead == 0) //end of stream
            close(); //throw FileError
        return bytesRead;
    }
    catch (const ErrorItemNotFound& e)
    {
        closeAfterError();
        throw ErrorFileDeleted(replaceCpy("File %x was deleted while being read.", "%x", fmtPath(getDisplayPath(source_.getSettings(), file_.getPath()))), e.toString());
    }
}


void LazyRemoteStream::recheckAttributes() //throw FileError, ErrorFileDeleted, ConnectionError
{
    lastCheckTime_ = std::chrono::steady_clock::now();

    std::optional<FileAttributes> currentAttr;
    {
        //not the streaming session: its connection is busy with the download
        SessionHandle checkSession = source_.acquire(); //throw ConnectionError
        currentAttr = checkSession->getFileAttributes(file_.getPath()); //throw FileError
    }

    if (!currentAttr)
        throw ErrorItemNotFound(replaceCpy("Cannot find file %x.", "%x", fmtPath(getDisplayPath(source_.getSettings(), file_.getPath()))));

    if (currentAttr->getSize() != file_.getSize() ||
        currentAttr->getModTime() != file_.getModTime())
        logExtraWarning(replaceCpy("File %x was modified while being read.", "%x", fmtPath(getDisplayPath(source_.getSettings(), file_.getPath()))));
}


void LazyRemoteStream::close() //throw FileError
{
    if (state_ == State::closed)
        return;

    const bool wasOpened = state_ == State::open;
    state_ = State::closed;

    if (!wasOpened) //no session acquired => nothing to release
        return;

    content_.reset(); //stop the download *before* the connection is used again

    if (session_.isHeld())
    {
        RFS_ON_SCOPE_EXIT(session_.release()); //even if the hook throws

        if (beforeRelease_)
            beforeRelease_(*session_); //throw FileError
    }
}


void LazyRemoteStream::closeAfterError() noexcept
{
    try
    {
        close(); //throw FileError
    }
    catch (const FileError& e) { logExtraError(e.toString()); }
}
