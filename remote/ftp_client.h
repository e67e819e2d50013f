// *****************************************************************************
// * This file is part of the RemoteFs project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef FTP_CLIENT_H_3390174528816620
#define FTP_CLIENT_H_3390174528816620

#include "protocol_client.h"


namespace rfs
{
/*  libcurl-based FTP(S) client: one easy handle per client => libcurl keeps the control connection alive between commands

    - paths are sent absolute (CURLFTPMETHOD_NOCWD), the working directory is tracked client-side and verified with CWD
    - streams returned by retrieve() use the client's connection: destroy them before issuing further commands!  */
std::unique_ptr<ProtocolClient> createFtpClient(bool useTls);
}

#endif //FTP_CLIENT_H_3390174528816620
