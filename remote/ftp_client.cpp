// *****************************************************************************
// * This file is part of the RemoteFs project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include "ftp_client.h"
#include <ctime>
#include <optional>
#include <rfs/stream_buffer.h>
#include <rfs/thread.h>
#include <libcurl/curl_wrap.h> //DON'T include <curl/curl.h> directly!
#include "ftp_listing.h"
#include <glib.h>
#include <fcntl.h>

using namespace rfs;


namespace
{
const char ftpPrefix[] = "ftp:";

const size_t FTP_BLOCK_SIZE_DOWNLOAD = 16 * 1024; //libcurl returns blocks of only 16 kB as returned by recv() even if we request larger blocks via CURLOPT_BUFFERSIZE
const size_t FTP_STREAM_BUFFER_SIZE = 1024 * 1024; //unit: [byte]

DEFINE_NEW_SYS_ERROR(SysErrorLoginDenied)


enum class ServerEncoding
{
    unknown,
    utf8,
    ansi,
};


bool isValidUtf(std::string_view str) { return ::g_utf8_validate(str.data(), str.size(), nullptr); }


std::string ansiToUtfEncoding(std::string_view str) //throw SysError
{
    if (str.empty()) return {};

    gsize bytesWritten = 0; //not including the terminating null

    GError* error = nullptr;
    RFS_ON_SCOPE_EXIT(if (error) ::g_error_free(error));

    gchar* utfStr = ::g_convert(str.data(),    //const gchar* str
                                str.size(),    //gssize len
                                "UTF-8",       //const gchar* to_codeset
                                "LATIN1",      //const gchar* from_codeset
                                nullptr,       //gsize* bytes_read
                                &bytesWritten, //gsize* bytes_written
                                &error);       //GError** error
    if (!utfStr)
        throw SysError(formatGlibError("g_convert(" + std::string(str) + ", LATIN1 -> UTF-8)", error));
    RFS_ON_SCOPE_EXIT(::g_free(utfStr));

    return {utfStr, bytesWritten};
}


std::string utfToAnsiEncoding(std::string_view str) //throw SysError
{
    if (str.empty()) return {};

    gchar* strNorm = ::g_utf8_normalize(str.data(), str.size(), G_NORMALIZE_DEFAULT_COMPOSE); //convert to pre-composed *before* attempting conversion
    if (!strNorm)
        throw SysError(formatSystemError("g_utf8_normalize(" + std::string(str) + ')', "", "Conversion failure"));
    RFS_ON_SCOPE_EXIT(::g_free(strNorm));

    gsize bytesWritten = 0;

    GError* error = nullptr;
    RFS_ON_SCOPE_EXIT(if (error) ::g_error_free(error));

    //fails for: 1. broken UTF-8 2. not-ANSI-encodable Unicode
    gchar* ansiStr = ::g_convert(strNorm,       //const gchar* str
                                 -1,            //gssize len
                                 "LATIN1",      //const gchar* to_codeset
                                 "UTF-8",       //const gchar* from_codeset
                                 nullptr,       //gsize* bytes_read
                                 &bytesWritten, //gsize* bytes_written
                                 &error);       //GError** error
    if (!ansiStr)
        throw SysError(formatGlibError("g_convert(" + std::string(str) + ", UTF-8 -> LATIN1)", error));
    RFS_ON_SCOPE_EXIT(::g_free(ansiStr));

    return {ansiStr, bytesWritten};
}

//===========================================================================================================================

struct InputStreamFtp : public InputStream
{
    using DownloadFun = std::function<void(const std::function<void(const void* buffer, size_t bytesToWrite)>& writeBlock)>; //throw FileError, ThreadStopRequest

    explicit InputStreamFtp(const DownloadFun& download)
    {
        worker_ = JoiningThread([asyncStreamOut = this->asyncStreamIn_, download]
        {
            try
            {
                download([&](const void* buffer, size_t bytesToWrite)
                {
                    asyncStreamOut->write(buffer, bytesToWrite); //throw ThreadStopRequest
                }); //throw FileError, ThreadStopRequest

                asyncStreamOut->closeStream();
            }
            catch (FileError&) { asyncStreamOut->setWriteError(std::current_exception()); }
            catch (const ThreadStopRequest&) {} //reader is gone: nobody left to report to
        });
    }

    ~InputStreamFtp()
    {
        asyncStreamIn_->setReadError(std::make_exception_ptr(ThreadStopRequest()));
        //worker_ joins *after* this line
    }

    size_t getBlockSize() override { return FTP_BLOCK_SIZE_DOWNLOAD; } //throw (FileError)

    //may return short; only 0 means EOF! CONTRACT: bytesToRead > 0!
    size_t tryRead(void* buffer, size_t bytesToRead) override //throw FileError, ErrorItemNotFound
    {
        return asyncStreamIn_->tryRead(buffer, bytesToRead); //throw FileError
        //no need to check for write errors: once end of stream is reached, asyncStreamOut->closeStream() was called => no errors occured
    }

private:
    std::shared_ptr<AsyncStreamBuffer> asyncStreamIn_ = std::make_shared<AsyncStreamBuffer>(FTP_STREAM_BUFFER_SIZE);
    JoiningThread worker_;
};

//===========================================================================================================================

class FtpClient : public ProtocolClient
{
public:
    explicit FtpClient(bool useTls) : useTls_(useTls) { libcurlInit(); }

    ~FtpClient()
    {
        if (easyHandle_)
            ::curl_easy_cleanup(easyHandle_);
        libcurlTearDown();
    }

    void connect(const std::string& server, uint16_t port, std::chrono::seconds connectTimeout) override //throw SysError
    {
        if (trimCpy(server).empty())
            throw SysError("Server name must not be empty.");

        //libcurl connects lazily => socket errors surface during login()
        server_ = std::string(trimCpy(server));
        port_ = port;
        connectTimeout_ = connectTimeout;
    }

    bool login(const std::string& username, const std::string& password) override //throw SysError
    {
        username_ = username;
        password_ = password;
        try
        {
            //'*': as long as we get an FTP response - *any* FTP response (including 550) - the connection itself is fine!
            features_ = parseFeatResponse(runSingleFtpCommand("*FEAT", false /*requestUtf8*/)); //throw SysError, SysErrorLoginDenied, SysErrorFtpProtocol
        }
        catch (const SysErrorLoginDenied&)
        {
            if (replyCode_ == 0)
                replyCode_ = 530; //"User not logged in."
            return false;
        }

        workingDir_ = getHomePath(); //throw SysError
        return true;
    }

    void disconnect() override //throw SysError
    {
        if (easyHandle_) //curl_easy_cleanup() sends QUIT on open control connections
            ::curl_easy_cleanup(std::exchange(easyHandle_, nullptr));
        features_ = {};
    }

    int getReplyCode() const override { return replyCode_; }

    void setTransferMode(TransferMode mode) override { transferMode_ = mode; }
    void setPassiveMode(bool passive) override { passiveMode_ = passive; }
    void setResponseTimeout(std::chrono::seconds timeout) override { responseTimeout_ = timeout; }

    bool sendNoOp() override //throw SysError
    {
        return runCommandIfAccepted("NOOP"); //throw SysError
    }

    std::unique_ptr<InputStream> retrieve(const std::string& serverPath) override //throw SysError
    {
        const RemotePath filePath = resolveRemotePath(workingDir_, serverPath);

        return std::make_unique<InputStreamFtp>([this, filePath](const std::function<void(const void* buffer, size_t bytesToWrite)>& writeBlock)
        {
            downloadFile(filePath, writeBlock); //throw FileError, ThreadStopRequest
        });
    }

    void store(const std::string& serverPath,
               const std::function<size_t(void* buffer, size_t bytesToRead)>& readBlock /*throw X*/, bool append) override //throw SysError, X
    {
        const RemotePath filePath = resolveRemotePath(workingDir_, serverPath);

        std::exception_ptr exception;

        auto getBytesToSend = [&](void* buffer, size_t bytesToRead) -> size_t
        {
            try
            {
                /*  libcurl calls back until 0 bytes are returned (Posix read() semantics)

                    [!] let's NOT use "incomplete read Posix semantics" for libcurl!
                    who knows if libcurl buffers properly, or if it requests incomplete packages!?     */
                return readBlock(buffer, bytesToRead); //throw X; return "bytesToRead" bytes unless end of stream
            }
            catch (...) //forwarded below
            {
                exception = std::current_exception();
                return CURL_READFUNC_ABORT; //signal error condition => CURLE_ABORTED_BY_CALLBACK
            }
        };
        curl_read_callback getBytesToSendWrapper = [](char* buffer, size_t size, size_t nitems, void* callbackData)
        {
            return (*static_cast<decltype(getBytesToSend)*>(callbackData))(buffer, size * nitems); //free this poor little C-API from its shackles and redirect to a proper lambda
        };

        try
        {
            std::vector<CurlOption> options =
            {
                {CURLOPT_UPLOAD, 1L},
                {CURLOPT_READDATA, &getBytesToSend},
                {CURLOPT_READFUNCTION, getBytesToSendWrapper},
            };
            if (append)
                options.emplace_back(CURLOPT_APPEND, 1L); //APPE instead of STOR: creates the file if missing

            perform(filePath, false /*isDir*/, CURLFTPMETHOD_NOCWD, options, true /*requestUtf8*/); //throw SysError, SysErrorFtpProtocol
        }
        catch (const SysError&)
        {
            if (exception)
                std::rethrow_exception(exception);
            throw;
        }
    }

    std::vector<NativeEntry> listEntries(const std::string& serverPath) override //throw SysError
    {
        const RemotePath dirPath = resolveRemotePath(workingDir_, serverPath);

        std::string rawListing; //get raw FTP directory listing

        curl_write_callback onBytesReceived = [](/*const*/ char* buffer, size_t size, size_t nitems, void* callbackData)
        {
            auto& listing = *static_cast<std::string*>(callbackData);
            listing.append(buffer, size * nitems);
            return size * nitems;
        };

        std::vector<CurlOption> options =
        {
            {CURLOPT_WRITEDATA, &rawListing},
            {CURLOPT_WRITEFUNCTION, onBytesReceived},
        };
        curl_ftpmethod pathMethod = CURLFTPMETHOD_SINGLECWD;

        const bool useMlsd = getFeatures().mlsd; //throw SysError
        if (useMlsd)
        {
            options.emplace_back(CURLOPT_CUSTOMREQUEST, "MLSD");

            //some FTP servers process wildcards characters inside the MLSD "dirpath"
            const bool pathHasWildcards =
                contains(afterFirst(dirPath.value, "[", IfNotFoundReturn::none), ']') ||
                contains(dirPath.value, '*') ||
                contains(dirPath.value, '?');

            if (!pathHasWildcards)
                pathMethod = CURLFTPMETHOD_NOCWD;
        }
        //else: use "LIST" + CURLFTPMETHOD_SINGLECWD
        //caveat: let's better not use LIST parameters: https://cr.yp.to/ftp/list.html

        perform(dirPath, true /*isDir*/, pathMethod, options, true /*requestUtf8*/); //throw SysError, SysErrorFtpProtocol

        const DecodeServerName decodeName = [this](std::string_view rawName) { return serverToUtfEncoding(rawName); }; //throw SysError

        if (useMlsd)
            return parseMlsdListing(rawListing, decodeName); //throw SysError
        else
            return parseListListing(rawListing, std::time(nullptr), decodeName); //throw SysError
    }

    bool deleteFile(const std::string& serverPath) override //throw SysError
    {
        return runCommandIfAccepted("DELE " + getServerPathInternal(resolveRemotePath(workingDir_, serverPath))); //throw SysError
    }

    bool makeDirectory(const std::string& serverPath) override //throw SysError
    {
        return runCommandIfAccepted("MKD " + getServerPathInternal(resolveRemotePath(workingDir_, serverPath))); //throw SysError
    }

    bool removeDirectory(const std::string& serverPath) override //throw SysError
    {
        return runCommandIfAccepted("RMD " + getServerPathInternal(resolveRemotePath(workingDir_, serverPath))); //throw SysError
    }

    bool rename(const std::string& serverPathFrom, const std::string& serverPathTo) override //throw SysError
    {
        curl_slist* quote = nullptr;
        RFS_ON_SCOPE_EXIT(::curl_slist_free_all(quote));
        quote = ::curl_slist_append(quote, ("RNFR " + getServerPathInternal(resolveRemotePath(workingDir_, serverPathFrom))).c_str()); //throw SysError
        quote = ::curl_slist_append(quote, ("RNTO " + getServerPathInternal(resolveRemotePath(workingDir_, serverPathTo  ))).c_str()); //

        try
        {
            perform(RemotePath(), true /*isDir*/, CURLFTPMETHOD_NOCWD,
            {
                {CURLOPT_NOBODY, 1L},
                {CURLOPT_QUOTE, quote},
            }, true /*requestUtf8*/); //throw SysError, SysErrorFtpProtocol
            return true;
        }
        catch (const SysErrorFtpProtocol& e)
        {
            if (isNegativeCompletion(e.ftpErrorCode))
                return false;
            throw;
        }
    }

    bool changeWorkingDirectory(const std::string& serverPath) override //throw SysError
    {
        return changeWorkingDirectoryImpl(resolveRemotePath(workingDir_, serverPath)); //throw SysError
    }

    bool changeToParentDirectory() override //throw SysError
    {
        const std::optional<RemotePath> parentPath = getParentPath(workingDir_);
        return changeWorkingDirectoryImpl(parentPath ? *parentPath : RemotePath()); //"CDUP" on server root stays on root
    }

    std::string printWorkingDirectory() override { return getServerPath(workingDir_); }

private:
    FtpClient           (const FtpClient&) = delete;
    FtpClient& operator=(const FtpClient&) = delete;

    static bool isNegativeCompletion(long ftpStatusCode) { return 500 <= ftpStatusCode && ftpStatusCode < 600; }

    bool changeWorkingDirectoryImpl(const RemotePath& dirPath) //throw SysError
    {
        //paths are sent absolute => the server-side working directory is irrelevant: just verify the folder can be entered
        if (!runCommandIfAccepted("CWD " + getServerPathInternal(dirPath))) //throw SysError
            return false;
        workingDir_ = dirPath;
        return true;
    }

    //server rejected the command with a permanent negative reply => false
    bool runCommandIfAccepted(const std::string& ftpCmd) //throw SysError
    {
        try
        {
            runSingleFtpCommand(ftpCmd, true /*requestUtf8*/); //throw SysError, SysErrorFtpProtocol
            return true;
        }
        catch (const SysErrorFtpProtocol& e)
        {
            if (isNegativeCompletion(e.ftpErrorCode))
                return false;
            throw;
        }
    }

    void downloadFile(const RemotePath& filePath, //throw FileError, ThreadStopRequest
                      const std::function<void(const void* buffer, size_t bytesToWrite)>& writeBlock /*throw ThreadStopRequest*/)
    {
        std::exception_ptr exception;

        auto onBytesReceived = [&](const void* buffer, size_t bytesToWrite)
        {
            try
            {
                writeBlock(buffer, bytesToWrite); //throw ThreadStopRequest
                //[!] let's NOT use "incomplete write Posix semantics" for libcurl!
                return bytesToWrite;
            }
            catch (...) //forwarded below
            {
                exception = std::current_exception();
                return bytesToWrite + 1; //signal error condition => CURLE_WRITE_ERROR
            }
        };
        curl_write_callback onBytesReceivedWrapper = [](char* buffer, size_t size, size_t nitems, void* callbackData)
        {
            return (*static_cast<decltype(onBytesReceived)*>(callbackData))(buffer, size * nitems); //free this poor little C-API from its shackles and redirect to a proper lambda
        };

        const std::string errorMsg = replaceCpy("Cannot read file %x.", "%x", fmtPath(getDisplayPath(filePath)));
        try
        {
            perform(filePath, false /*isDir*/, CURLFTPMETHOD_NOCWD,
            {
                {CURLOPT_WRITEDATA, &onBytesReceived},
                {CURLOPT_WRITEFUNCTION, onBytesReceivedWrapper},
                {CURLOPT_IGNORE_CONTENT_LENGTH, 1L}, //skip FTP "SIZE" command before download (=> download until actual EOF if file size changes)
            }, true /*requestUtf8*/); //throw SysError, SysErrorFtpProtocol
        }
        catch (const SysErrorFtpProtocol& e)
        {
            if (exception)
                std::rethrow_exception(exception);

            if (e.ftpErrorCode == 550) //"File unavailable, e.g. file not found, no access."
                throw ErrorItemNotFound(replaceCpy("Cannot find file %x.", "%x", fmtPath(getDisplayPath(filePath))), e.toString());

            throw FileError(errorMsg, e.toString());
        }
        catch (const SysError& e)
        {
            if (exception)
                std::rethrow_exception(exception);

            throw FileError(errorMsg, e.toString());
        }
    }

    //returns server response (header data)
    std::string perform(const RemotePath& itemPath, bool isDir, curl_ftpmethod pathMethod,
                        const std::vector<CurlOption>& extraOptions, bool requestUtf8) //throw SysError, SysErrorLoginDenied, SysErrorFtpProtocol
    {
        if (requestUtf8) //avoid endless recursion
            initUtf8(); //throw SysError, SysErrorFtpProtocol

        if (!easyHandle_)
        {
            easyHandle_ = ::curl_easy_init();
            if (!easyHandle_)
                throw SysError(formatSystemError("curl_easy_init", formatCurlStatusCode(CURLE_OUT_OF_MEMORY), ""));
        }
        else
            ::curl_easy_reset(easyHandle_);

        auto setCurlOption = [easyHandle = easyHandle_](const CurlOption& curlOpt) //throw SysError
        {
            if (const CURLcode rc = ::curl_easy_setopt(easyHandle, curlOpt.option, curlOpt.value);
                rc != CURLE_OK)
                throw SysError(formatSystemError("curl_easy_setopt(" + numberTo<std::string>(static_cast<int>(curlOpt.option)) + ")",
                                                 formatCurlStatusCode(rc), ::curl_easy_strerror(rc)));
        };

        char curlErrorBuf[CURL_ERROR_SIZE] = {};
        setCurlOption({CURLOPT_ERRORBUFFER, curlErrorBuf}); //throw SysError

        std::string headerData;
        curl_write_callback onHeaderReceived = [](/*const*/ char* buffer, size_t size, size_t nitems, void* callbackData)
        {
            auto& output = *static_cast<std::string*>(callbackData);
            output.append(buffer, size * nitems);
            return size * nitems;
        };
        setCurlOption({CURLOPT_HEADERDATA, &headerData}); //throw SysError
        setCurlOption({CURLOPT_HEADERFUNCTION, onHeaderReceived}); //throw SysError

        setCurlOption({CURLOPT_URL, getCurlUrlPath(itemPath, isDir).c_str()}); //throw SysError

        setCurlOption({CURLOPT_FTP_FILEMETHOD, pathMethod}); //throw SysError

        if (!username_.empty()) //else: libcurl will default to CURL_DEFAULT_USER("anonymous") and CURL_DEFAULT_PASSWORD("ftp@example.com")
        {
            setCurlOption({CURLOPT_USERNAME, username_.c_str()}); //throw SysError
            setCurlOption({CURLOPT_PASSWORD, password_.c_str()}); //throw SysError
        }

        if (port_ > 0)
            setCurlOption({CURLOPT_PORT, static_cast<long>(port_)}); //throw SysError

        //thread-safety: https://curl.haxx.se/libcurl/c/threadsafe.html
        setCurlOption({CURLOPT_NOSIGNAL, 1}); //throw SysError

        //allow PASV IP: some FTP servers really use IP different from control connection
        setCurlOption({CURLOPT_FTP_SKIP_PASV_IP, 0}); //throw SysError

        if (!passiveMode_)
            setCurlOption({CURLOPT_FTPPORT, "-"}); //"-": use the control connection's local IP address

        if (transferMode_ == TransferMode::ascii && !isDir)
            setCurlOption({CURLOPT_TRANSFERTEXT, 1L}); //throw SysError

        setCurlOption({CURLOPT_CONNECTTIMEOUT, static_cast<long>(connectTimeout_.count())}); //throw SysError

        //CURLOPT_TIMEOUT: "Since this puts a hard limit for how long time a request is allowed to take, it has limited use in dynamic use cases with varying transfer times."
        setCurlOption({CURLOPT_LOW_SPEED_TIME, static_cast<long>(responseTimeout_.count())}); //throw SysError
        setCurlOption({CURLOPT_LOW_SPEED_LIMIT, 1 /*[bytes]*/}); //throw SysError
        //can't use "0" which means "inactive", so use some low number

        setCurlOption({CURLOPT_SERVER_RESPONSE_TIMEOUT, static_cast<long>(responseTimeout_.count())}); //throw SysError
        //FTP only; unlike CURLOPT_TIMEOUT, this one is NOT a limit on the total transfer time

        //long-running file uploads require keep-alives for the TCP control connection
        setCurlOption({CURLOPT_TCP_KEEPALIVE, 1}); //throw SysError

        std::optional<SysError> socketException;
        //libcurl does *not* set FD_CLOEXEC for us! https://github.com/curl/curl/issues/2252
        auto onSocketCreate = [&](curl_socket_t curlfd, curlsocktype purpose)
        {
            if (::fcntl(curlfd, F_SETFD, FD_CLOEXEC) == -1) //=> RACE-condition if other thread calls fork/execv before this thread sets FD_CLOEXEC!
            {
                socketException = SysError(formatSystemError("fcntl(FD_CLOEXEC)", errno));
                return CURL_SOCKOPT_ERROR;
            }
            return CURL_SOCKOPT_OK;
        };

        using SocketCbType = decltype(onSocketCreate);
        using SocketCbWrapperType =            int (*)(SocketCbType* clientp, curl_socket_t curlfd, curlsocktype purpose); //needed for cdecl function pointer cast
        SocketCbWrapperType onSocketCreateWrapper = [](SocketCbType* clientp, curl_socket_t curlfd, curlsocktype purpose)
        {
            return (*clientp)(curlfd, purpose); //free this poor little C-API from its shackles and redirect to a proper lambda
        };

        setCurlOption({CURLOPT_SOCKOPTFUNCTION, onSocketCreateWrapper}); //throw SysError
        setCurlOption({CURLOPT_SOCKOPTDATA, &onSocketCreate}); //throw SysError

        setCurlOption({CURLOPT_CAINFO, 0}); //throw SysError
        //be explicit: "even when [CURLOPT_SSL_VERIFYPEER] is disabled [...] curl may still load the certificate file specified in CURLOPT_CAINFO."
        setCurlOption({CURLOPT_SSL_VERIFYPEER, 0}); //throw SysError
        setCurlOption({CURLOPT_SSL_VERIFYHOST, 0}); //throw SysError

        if (useTls_) //https://tools.ietf.org/html/rfc4217
        {
            //require SSL for both control and data:
            setCurlOption({CURLOPT_USE_SSL,    CURLUSESSL_ALL}); //throw SysError
            //try TLS first, then SSL (currently: CURLFTPAUTH_DEFAULT == CURLFTPAUTH_SSL):
            setCurlOption({CURLOPT_FTPSSLAUTH, CURLFTPAUTH_TLS}); //throw SysError
        }

        for (const CurlOption& option : extraOptions)
            setCurlOption(option); //throw SysError

        //=======================================================================================================
        const CURLcode rcPerf = ::curl_easy_perform(easyHandle_);
        //note: curl_easy_perform() considers FTP response codes >= 400 as failure

        long ftpStatusCode = 0; //optional
        /*const CURLcode rc =*/ ::curl_easy_getinfo(easyHandle_, CURLINFO_RESPONSE_CODE, &ftpStatusCode);
        replyCode_ = static_cast<int>(ftpStatusCode);

        if (socketException)
            throw* socketException; //throw SysError
        //=======================================================================================================

        if (rcPerf != CURLE_OK)
        {
            std::string errorMsg(trimCpy(curlErrorBuf)); //optional

            if (const std::vector<std::string_view> headerLines = splitFtpResponse(headerData);
                !headerLines.empty())
                if (const std::string_view response = trimCpy(headerLines.back()); //that *should* be the server's error response
                    !response.empty())
                    errorMsg += (errorMsg.empty() ? "" : "\n") + std::string(response);

            const std::string sysErrorMsg = formatSystemError("curl_easy_perform", formatCurlStatusCode(rcPerf), errorMsg);

            switch (rcPerf)
            {
                case CURLE_LOGIN_DENIED:
                    throw SysErrorLoginDenied(sysErrorMsg);
                case CURLE_OPERATION_TIMEDOUT:
                    throw SysErrorTimeout(sysErrorMsg);
                case CURLE_COULDNT_CONNECT:
                    throw SysErrorConnectionRefused(sysErrorMsg);
                case CURLE_COULDNT_RESOLVE_HOST:
                    throw SysErrorUnknownHost(sysErrorMsg);
                default:
                    break;
            }

            //https://en.wikipedia.org/wiki/List_of_FTP_server_return_codes
            if (ftpStatusCode != 0)
                throw SysErrorFtpProtocol(sysErrorMsg + '\n' + formatFtpStatus(ftpStatusCode), ftpStatusCode);

            throw SysError(sysErrorMsg);
        }
        return headerData;
    }

    //returns server response (header data)
    std::string runSingleFtpCommand(const std::string& ftpCmd, bool requestUtf8) //throw SysError, SysErrorFtpProtocol
    {
        curl_slist* quote = nullptr;
        RFS_ON_SCOPE_EXIT(::curl_slist_free_all(quote));
        quote = ::curl_slist_append(quote, ftpCmd.c_str());

        return perform(RemotePath(), true /*isDir*/, CURLFTPMETHOD_NOCWD /*avoid needless CWDs*/,
        {
            {CURLOPT_NOBODY, 1L},
            {CURLOPT_QUOTE, quote},
        }, requestUtf8); //throw SysError, SysErrorLoginDenied, SysErrorFtpProtocol
    }

    RemotePath getHomePath() //throw SysError
    {
        if (easyHandle_)
        {
            const char* homePathCurl = nullptr; //not owned
            /*CURLcode rc =*/ ::curl_easy_getinfo(easyHandle_, CURLINFO_FTP_ENTRY_PATH, &homePathCurl);

            if (homePathCurl && isAsciiString(homePathCurl))
                return sanitizeRemotePath(homePathCurl);

            //home path with non-ASCII chars: libcurl issues PWD right after login *before* server was set up for UTF8
            //=> start new FTP session and parse PWD *after* UTF8 is enabled:
            ::curl_easy_cleanup(std::exchange(easyHandle_, nullptr));
        }

        const std::string pwdBuf = runSingleFtpCommand("PWD", true /*requestUtf8*/); //throw SysError, SysErrorFtpProtocol
        return sanitizeRemotePath(serverToUtfEncoding(parsePwdResponse(pwdBuf))); //throw SysError
    }

    const FtpFeatures& getFeatures() //throw SysError
    {
        if (!features_)
            //*: ignore error if server does not support/allow FEAT
            features_ = parseFeatResponse(runSingleFtpCommand("*FEAT", false /*requestUtf8*/)); //throw SysError, (SysErrorFtpProtocol)
        return *features_;
    }

    void initUtf8() //throw SysError, SysErrorFtpProtocol
    {
        /*  some RFC-2640-non-compliant servers require UTF8 to be explicitly enabled, e.g. Microsoft FTP Service
            "OPTS UTF8 ON" needs to be activated each time libcurl internally creates a new session         */
        if (std::optional<curl_socket_t> currentSocket = getActiveSocket()) //throw SysError
            if (*currentSocket == utf8RequestedSocket_) //caveat: a non-UTF8-enabled session might already exist, e.g. from a previous FEAT
                return;

        //"prefix the command with an asterisk to make libcurl continue even if the command fails"
        const std::string optsBuf = runSingleFtpCommand("*OPTS UTF8 ON", false /*requestUtf8*/); //throw SysError, (SysErrorFtpProtocol)

        //get *last* FTP status code
        int ftpStatusCode = 0;
        for (const std::string_view line : splitFtpResponse(optsBuf))
            if (line.size() >= 4 &&
                isDigit(line[0]) &&
                isDigit(line[1]) &&
                isDigit(line[2]) &&
                line[3] == ' ')
                ftpStatusCode = stringTo<int>(line.substr(0, 3));

        socketUsesUtf8_ = ftpStatusCode == 200 || //"200 Always in UTF8 mode."  "200 UTF8 set to on"
                          ftpStatusCode == 202;   //"202 UTF8 mode is always enabled."

        //make sure our Unicode-enabled session is still there (== libcurl behaves as we expect)
        if (std::optional<curl_socket_t> currentSocket = getActiveSocket()) //throw SysError
            utf8RequestedSocket_ = *currentSocket; //remember what we did
        else
            throw SysError("Curl failed to cache FTP session."); //why is libcurl not caching the session???
    }

    std::optional<curl_socket_t> getActiveSocket() //throw SysError
    {
        if (easyHandle_)
        {
            curl_socket_t currentSocket = 0;
            const CURLcode rc = ::curl_easy_getinfo(easyHandle_, CURLINFO_ACTIVESOCKET, &currentSocket);
            if (rc != CURLE_OK)
                throw SysError(formatSystemError("curl_easy_getinfo(CURLINFO_ACTIVESOCKET)", formatCurlStatusCode(rc), ::curl_easy_strerror(rc)));
            if (currentSocket != CURL_SOCKET_BAD)
                return currentSocket;
        }
        return {};
    }

    bool supportsUtf8() //throw SysError
    {
        if (getFeatures().utf8) //throw SysError
            return true;

        initUtf8(); //vsFTPd: supports UTF8 via "OPTS UTF8 ON", even if "UTF8" is missing from "FEAT"
        return socketUsesUtf8_;
    }

    std::string serverToUtfEncoding(std::string_view str) //throw SysError
    {
        if (isAsciiString(str)) //fast path
            return std::string(str);

        switch (encoding_)
        {
            case ServerEncoding::unknown:
                //"UTF-8 encodings contain enough internal structure that it is always, in practice, possible to determine whether a UTF-8 or raw encoding has been used"
                encoding_ = supportsUtf8() || isValidUtf(str) ? ServerEncoding::utf8 : ServerEncoding::ansi; //throw SysError
                return serverToUtfEncoding(str); //throw SysError

            case ServerEncoding::utf8:
                if (!isValidUtf(str))
                    throw SysError("Invalid character encoding: " + std::string(str) + " Expected: [UTF-8]");
                return std::string(str);

            case ServerEncoding::ansi:
                return ansiToUtfEncoding(str); //throw SysError
        }
        throw SysError("Unknown server encoding.");
    }

    std::string utfToServerEncoding(std::string_view str) //throw SysError
    {
        if (isAsciiString(str)) //fast path
            return std::string(str);

        switch (encoding_)
        {
            case ServerEncoding::unknown:
                if (!supportsUtf8()) //throw SysError
                    throw SysError("Failed to auto-detect character encoding: " + std::string(str)); //might be ANSI or UTF8 with non-compliant server...

                encoding_ = ServerEncoding::utf8;
                return utfToServerEncoding(str); //throw SysError

            case ServerEncoding::utf8:
                if (!isValidUtf(str))
                    throw SysError("Invalid character encoding: " + std::string(str) + " Expected: [UTF-8]");
                return std::string(str);

            case ServerEncoding::ansi:
                return utfToAnsiEncoding(str); //throw SysError
        }
        throw SysError("Unknown server encoding.");
    }

    std::string getServerPathInternal(const RemotePath& itemPath) //throw SysError
    {
        const std::string serverPath = getServerPath(itemPath);

        if (itemPath.value.empty()) //endless recursion caveat!! utfToServerEncoding() transitively depends on getServerPathInternal()
            return serverPath;

        return utfToServerEncoding(serverPath); //throw SysError
    }

    std::string getCurlUrlPath(const RemotePath& itemPath, bool isDir) //throw SysError
    {
        std::string curlRelPath; //libcurl expects encoded paths (except for '/' char!!!) => bug: https://github.com/curl/curl/pull/4423

        split(getServerPathInternal(itemPath), //throw SysError
              '/', [&](std::string_view comp)
        {
            if (!comp.empty())
            {
                char* compFmt = ::curl_easy_escape(easyHandle_, comp.data(), static_cast<int>(comp.size()));
                if (!compFmt)
                    throw SysError(formatSystemError("curl_easy_escape(" + std::string(comp) + ')', "", "Conversion failure"));
                RFS_ON_SCOPE_EXIT(::curl_free(compFmt));

                if (!curlRelPath.empty())
                    curlRelPath += '/';
                curlRelPath += compFmt;
            }
        });

        /*  1. CURLFTPMETHOD_NOCWD requires absolute paths to unconditionally skip CWDs: https://github.com/curl/curl/pull/4382
            2. use // because /%2f had bugs                                                                  */
        std::string path = std::string(ftpPrefix) + "//" + server_ + "//" + curlRelPath;

        if (isDir && !endsWith(path, '/')) //curl-FTP needs directory paths to end with a slash
            path += '/';
        return path;
    }

    std::string getDisplayPath(const RemotePath& itemPath) const
    {
        std::string displayPath = std::string(ftpPrefix) + "//";
        if (!username_.empty())
            displayPath += username_ + '@';
        displayPath += server_;
        if (!itemPath.value.empty())
            displayPath += getServerPath(itemPath);
        return displayPath;
    }

    const bool useTls_;
    std::string server_;
    uint16_t port_ = 0;
    std::string username_;
    std::string password_;
    std::chrono::seconds connectTimeout_{10};
    std::chrono::seconds responseTimeout_{10};
    TransferMode transferMode_ = TransferMode::binary;
    bool passiveMode_ = true;

    CURL* easyHandle_ = nullptr;
    int replyCode_ = 0;
    RemotePath workingDir_;

    curl_socket_t utf8RequestedSocket_ = 0;
    bool socketUsesUtf8_ = false;
    ServerEncoding encoding_ = ServerEncoding::unknown;
    std::optional<FtpFeatures> features_;
};
}


std::unique_ptr<ProtocolClient> rfs::createFtpClient(bool useTls)
{
    return std::make_unique<FtpClient>(useTls);
}
