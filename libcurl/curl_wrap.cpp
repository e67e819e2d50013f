// *****************************************************************************
// * This file is part of the RemoteFs project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include "curl_wrap.h"
#include <rfs/thread.h>

using namespace rfs;


namespace
{
Protected<int> curlInitLevel; //support interleaving initialization calls from multiple sessions
}


void rfs::libcurlInit()
{
    curlInitLevel.access([](int& initLevel)
    {
        assert(initLevel >= 0);
        if (++initLevel != 1)
            return;

        try
        {
            ASSERT_SYSERROR(::curl_global_init(CURL_GLOBAL_DEFAULT /*= CURL_GLOBAL_SSL|CURL_GLOBAL_WIN32*/) == CURLE_OK);
        }
        catch (const SysError& e) { logExtraError("Error during libcurl initialization.\n\n" + e.toString()); }
    });
}


void rfs::libcurlTearDown()
{
    curlInitLevel.access([](int& initLevel)
    {
        assert(initLevel >= 1);
        if (--initLevel != 0)
            return;

        ::curl_global_cleanup();
    });
}


std::string rfs::formatCurlStatusCode(CURLcode sc)
{
    switch (sc) //the codes relevant for FTP (+ FTPS) sessions
    {
            RFS_CHECK_CASE_FOR_CONSTANT(CURLE_OK);
            RFS_CHECK_CASE_FOR_CONSTANT(CURLE_UNSUPPORTED_PROTOCOL);
            RFS_CHECK_CASE_FOR_CONSTANT(CURLE_FAILED_INIT);
            RFS_CHECK_CASE_FOR_CONSTANT(CURLE_URL_MALFORMAT);
            RFS_CHECK_CASE_FOR_CONSTANT(CURLE_NOT_BUILT_IN);
            RFS_CHECK_CASE_FOR_CONSTANT(CURLE_COULDNT_RESOLVE_PROXY);
            RFS_CHECK_CASE_FOR_CONSTANT(CURLE_COULDNT_RESOLVE_HOST);
            RFS_CHECK_CASE_FOR_CONSTANT(CURLE_COULDNT_CONNECT);
            RFS_CHECK_CASE_FOR_CONSTANT(CURLE_WEIRD_SERVER_REPLY);
            RFS_CHECK_CASE_FOR_CONSTANT(CURLE_REMOTE_ACCESS_DENIED);
            RFS_CHECK_CASE_FOR_CONSTANT(CURLE_FTP_ACCEPT_FAILED);
            RFS_CHECK_CASE_FOR_CONSTANT(CURLE_FTP_WEIRD_PASS_REPLY);
            RFS_CHECK_CASE_FOR_CONSTANT(CURLE_FTP_ACCEPT_TIMEOUT);
            RFS_CHECK_CASE_FOR_CONSTANT(CURLE_FTP_WEIRD_PASV_REPLY);
            RFS_CHECK_CASE_FOR_CONSTANT(CURLE_FTP_WEIRD_227_FORMAT);
            RFS_CHECK_CASE_FOR_CONSTANT(CURLE_FTP_CANT_GET_HOST);
            RFS_CHECK_CASE_FOR_CONSTANT(CURLE_FTP_COULDNT_SET_TYPE);
            RFS_CHECK_CASE_FOR_CONSTANT(CURLE_PARTIAL_FILE);
            RFS_CHECK_CASE_FOR_CONSTANT(CURLE_FTP_COULDNT_RETR_FILE);
            RFS_CHECK_CASE_FOR_CONSTANT(CURLE_QUOTE_ERROR);
            RFS_CHECK_CASE_FOR_CONSTANT(CURLE_WRITE_ERROR);
            RFS_CHECK_CASE_FOR_CONSTANT(CURLE_UPLOAD_FAILED);
            RFS_CHECK_CASE_FOR_CONSTANT(CURLE_READ_ERROR);
            RFS_CHECK_CASE_FOR_CONSTANT(CURLE_OUT_OF_MEMORY);
            RFS_CHECK_CASE_FOR_CONSTANT(CURLE_OPERATION_TIMEDOUT);
            RFS_CHECK_CASE_FOR_CONSTANT(CURLE_FTP_PORT_FAILED);
            RFS_CHECK_CASE_FOR_CONSTANT(CURLE_FTP_COULDNT_USE_REST);
            RFS_CHECK_CASE_FOR_CONSTANT(CURLE_RANGE_ERROR);
            RFS_CHECK_CASE_FOR_CONSTANT(CURLE_SSL_CONNECT_ERROR);
            RFS_CHECK_CASE_FOR_CONSTANT(CURLE_BAD_DOWNLOAD_RESUME);
            RFS_CHECK_CASE_FOR_CONSTANT(CURLE_ABORTED_BY_CALLBACK);
            RFS_CHECK_CASE_FOR_CONSTANT(CURLE_BAD_FUNCTION_ARGUMENT);
            RFS_CHECK_CASE_FOR_CONSTANT(CURLE_INTERFACE_FAILED);
            RFS_CHECK_CASE_FOR_CONSTANT(CURLE_UNKNOWN_OPTION);
            RFS_CHECK_CASE_FOR_CONSTANT(CURLE_GOT_NOTHING);
            RFS_CHECK_CASE_FOR_CONSTANT(CURLE_SEND_ERROR);
            RFS_CHECK_CASE_FOR_CONSTANT(CURLE_RECV_ERROR);
            RFS_CHECK_CASE_FOR_CONSTANT(CURLE_SSL_CERTPROBLEM);
            RFS_CHECK_CASE_FOR_CONSTANT(CURLE_SSL_CIPHER);
            RFS_CHECK_CASE_FOR_CONSTANT(CURLE_PEER_FAILED_VERIFICATION);
            RFS_CHECK_CASE_FOR_CONSTANT(CURLE_USE_SSL_FAILED);
            RFS_CHECK_CASE_FOR_CONSTANT(CURLE_SEND_FAIL_REWIND);
            RFS_CHECK_CASE_FOR_CONSTANT(CURLE_LOGIN_DENIED);
            RFS_CHECK_CASE_FOR_CONSTANT(CURLE_REMOTE_DISK_FULL);
            RFS_CHECK_CASE_FOR_CONSTANT(CURLE_REMOTE_FILE_EXISTS);
            RFS_CHECK_CASE_FOR_CONSTANT(CURLE_REMOTE_FILE_NOT_FOUND);
            RFS_CHECK_CASE_FOR_CONSTANT(CURLE_SSL_SHUTDOWN_FAILED);
            RFS_CHECK_CASE_FOR_CONSTANT(CURLE_AGAIN);
            RFS_CHECK_CASE_FOR_CONSTANT(CURLE_FTP_PRET_FAILED);
            RFS_CHECK_CASE_FOR_CONSTANT(CURLE_FTP_BAD_FILE_LIST);
            RFS_CHECK_CASE_FOR_CONSTANT(CURLE_NO_CONNECTION_AVAILABLE);

        default:
            break;
    }
    return replaceCpy("Curl status %x", "%x", numberTo<std::string>(static_cast<int>(sc)));
}
