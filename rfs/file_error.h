// *****************************************************************************
// * This file is part of the RemoteFs project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef FILE_ERROR_H_4430295120983674
#define FILE_ERROR_H_4430295120983674

#include "sys_error.h" //we'll need this later anyway!


namespace rfs
{
class FileError //A high-level exception class giving detailed context information for end users
{
public:
    explicit FileError(const std::string& msg) : msg_(msg) {}
    FileError(const std::string& msg, const std::string& details) : msg_(msg + "\n\n" + details) {}
    virtual ~FileError() {}

    const std::string& toString() const { return msg_; }

private:
    std::string msg_;
};

#define DEFINE_NEW_FILE_ERROR(X) struct X : public rfs::FileError { X(const std::string& msg) : FileError(msg) {} X(const std::string& msg, const std::string& descr) : FileError(msg, descr) {} };

DEFINE_NEW_FILE_ERROR(ErrorTargetExisting)
DEFINE_NEW_FILE_ERROR(ErrorIllegalPath)  //parent folder missing, file vs. folder name clash
DEFINE_NEW_FILE_ERROR(ErrorItemNotFound)
DEFINE_NEW_FILE_ERROR(ErrorFileLocked)
DEFINE_NEW_FILE_ERROR(ErrorFileDeleted)  //file vanished while being read


#define THROW_LAST_FILE_ERROR(msg, functionName)                           \
    do { const ErrorCode ecInternal = getLastError(); throw FileError(msg, formatSystemError(functionName, ecInternal)); } while (false)

//----------- facilitate usage of std::string for error messages --------------------

inline std::string fmtPath(const std::string& displayPath) { return '"' + displayPath + '"'; }
inline std::string fmtPath(const char* displayPath) { return fmtPath(std::string(displayPath)); } //resolve overload ambiguity
}

#endif //FILE_ERROR_H_4430295120983674
