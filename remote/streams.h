// *****************************************************************************
// * This file is part of the RemoteFs project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef STREAMS_H_5561093387204416
#define STREAMS_H_5561093387204416

#include <algorithm>
#include <cstring>
#include <string>
#include <rfs/file_error.h>


namespace rfs
{
struct InputStream
{
    virtual ~InputStream() {}
    virtual size_t getBlockSize() = 0; //throw (FileError); non-zero block size is file system-specific!

    //may return short; only 0 means EOF! CONTRACT: bytesToRead > 0!
    virtual size_t tryRead(void* buffer, size_t bytesToRead) = 0; //throw FileError, ErrorFileDeleted
};


//return "bytesToRead" bytes unless end of stream!
inline
size_t readFully(InputStream& streamIn, void* buffer, size_t bytesToRead) //throw FileError
{
    char* const bufStart = static_cast<char*>(buffer);
    size_t bytesRead = 0;
    while (bytesRead < bytesToRead)
    {
        const size_t bytesReadNow = streamIn.tryRead(bufStart + bytesRead, bytesToRead - bytesRead); //throw FileError
        if (bytesReadNow == 0) //end of stream
            break;
        bytesRead += bytesReadNow;
    }
    return bytesRead;
}


inline
std::string loadStream(InputStream& streamIn) //throw FileError
{
    std::string output;
    const size_t blockSize = streamIn.getBlockSize(); //throw FileError
    for (;;)
    {
        const size_t oldSize = output.size();
        output.resize(oldSize + blockSize);
        const size_t bytesRead = streamIn.tryRead(output.data() + oldSize, blockSize); //throw FileError
        output.resize(oldSize + bytesRead);
        if (bytesRead == 0) //end of stream
            return output;
    }
}


//in-memory content to upload
class MemoryInputStream : public InputStream
{
public:
    explicit MemoryInputStream(const std::string& content) : content_(content) {}

    size_t getBlockSize() override { return 64 * 1024; }

    size_t tryRead(void* buffer, size_t bytesToRead) override
    {
        const size_t junkSize = std::min(bytesToRead, content_.size() - pos_);
        std::memcpy(buffer, content_.data() + pos_, junkSize);
        pos_ += junkSize;
        return junkSize;
    }

private:
    const std::string content_;
    size_t pos_ = 0;
};
}

#endif //STREAMS_H_5561093387204416
