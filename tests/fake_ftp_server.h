// *****************************************************************************
// * This file is part of the RemoteFs project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef FAKE_FTP_SERVER_H_8127704536619025
#define FAKE_FTP_SERVER_H_8127704536619025

#include <map>
#include <mutex>
#include <remote/connection_settings.h>
#include <remote/protocol_client.h>


namespace rfs::test
{
enum class ConnectFailure
{
    none,
    timeout,
    refused,
    unknownHost,
};


/*  in-memory FTP server shared by all FakeProtocolClients of one test; thread-safe
    paths are server paths: "/" or "/a/b"
    every command is recorded as "<VERB> <path>", e.g. "DELE /a/f1"                       */
class FakeFtpServer
{
public:
    FakeFtpServer();

    void addFolder(const std::string& serverPath); //creates missing parents
    void addFile(const std::string& serverPath, const std::string& content, time_t modTime = 1000000000); //
    void removeItem(const std::string& serverPath); //including children

    bool exists(const std::string& serverPath);
    bool isFolder(const std::string& serverPath);
    std::optional<std::string> getContent(const std::string& serverPath);

    std::vector<std::string> getCommands(); //in execution order
    std::vector<std::string> getCommands(const std::string& verb); //only "verb"
    void clearCommands();

    size_t getActiveConnections();
    size_t getPeakConnections();
    size_t getTotalConnections();

    //failure injection
    void setConnectFailure(ConnectFailure failure);
    void setLoginReplyCode(int replyCode); //0: accept login
    void setFailingDelete(const std::string& serverPath);
    void setFailDisconnect(bool fail);
    void setFailingRetrieve(const std::string& serverPath); //RETR rejected: SysError
    void setFailingRead(const std::string& serverPath, size_t failAfterBytes); //transfer aborted mid-stream: FileError
    void setOnStore(const std::function<void(const std::string& serverPath)>& onStore); //runs before the upload, outside the server lock

    ProtocolClientFactory makeClientFactory();

private:
    friend class FakeProtocolClient;

    struct Node
    {
        bool isFolder = false;
        std::string content;
        time_t modTime = 0;
    };

    //all with mutex_ held:
    std::vector<std::string> getChildNames(const std::string& folderPath) const;
    void eraseSubTree(const std::string& serverPath);
    void record(const std::string& command) { commands_.push_back(command); }

    std::mutex mutex_;
    std::map<std::string, Node> items_;
    std::vector<std::string> commands_;

    size_t activeConnections_ = 0;
    size_t peakConnections_ = 0;
    size_t totalConnections_ = 0;

    ConnectFailure connectFailure_ = ConnectFailure::none;
    int loginReplyCode_ = 0;
    std::string failingDeletePath_;
    bool failDisconnect_ = false;
    std::string failingRetrievePath_;
    std::string failingReadPath_;
    size_t failReadAfterBytes_ = 0;
    std::function<void(const std::string& serverPath)> onStore_;
};


inline
ConnectionSettings makeTestSettings()
{
    ConnectionSettings settings;
    settings.server   = "ftp.example.com";
    settings.username = "tester";
    settings.password = "secret";
    return settings;
}
}

#endif //FAKE_FTP_SERVER_H_8127704536619025
