// *****************************************************************************
// * This file is part of the RemoteFs project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include "fake_ftp_server.h"
#include <algorithm>
#include <iterator>

using namespace rfs;
using namespace rfs::test;


namespace
{
std::string normalize(const std::string& workingDir, const std::string& path)
{
    if (startsWith(path, '/'))
        return getServerPath(sanitizeRemotePath(path));
    return getServerPath(sanitizeRemotePath(workingDir + '/' + path));
}


std::string getParent(const std::string& serverPath) //server root: "/"
{
    if (const std::optional<RemotePath> parentPath = getParentPath(sanitizeRemotePath(serverPath)))
        return getServerPath(*parentPath);
    return "/";
}


class FakeDownloadStream : public InputStream
{
public:
    FakeDownloadStream(FakeFtpServer& server, const std::string& serverPath, std::optional<size_t> failAfterBytes) :
        server_(server), serverPath_(serverPath), failAfterBytes_(failAfterBytes) {}

    size_t getBlockSize() override { return 16 * 1024; }

    size_t tryRead(void* buffer, size_t bytesToRead) override //throw FileError, ErrorItemNotFound
    {
        if (!content_) //like FTP: missing files are reported once the transfer starts
        {
            content_ = server_.getContent(serverPath_);
            if (!content_)
                throw ErrorItemNotFound(replaceCpy("Cannot read file %x.", "%x", fmtPath(serverPath_)), formatSystemError("RETR", "550", "File not found."));
        }
        if (failAfterBytes_ && pos_ >= *failAfterBytes_)
            throw FileError(replaceCpy("Cannot read file %x.", "%x", fmtPath(serverPath_)), formatSystemError("RETR", "426", "Connection closed; transfer aborted."));

        size_t junkSize = std::min(bytesToRead, content_->size() - pos_);
        if (failAfterBytes_)
            junkSize = std::min(junkSize, *failAfterBytes_ - pos_);
        std::memcpy(buffer, content_->data() + pos_, junkSize);
        pos_ += junkSize;
        return junkSize;
    }

private:
    FakeFtpServer& server_;
    const std::string serverPath_;
    const std::optional<size_t> failAfterBytes_;
    std::optional<std::string> content_;
    size_t pos_ = 0;
};
}


namespace rfs::test
{
class FakeProtocolClient : public ProtocolClient
{
public:
    explicit FakeProtocolClient(FakeFtpServer& server) : server_(server) {}

    ~FakeProtocolClient()
    {
        if (connected_)
        {
            std::lock_guard dummy(server_.mutex_);
            --server_.activeConnections_;
        }
    }

    void connect(const std::string& server, uint16_t port, std::chrono::seconds connectTimeout) override //throw SysError
    {
        std::lock_guard dummy(server_.mutex_);
        server_.record("CONNECT " + server + ':' + numberTo<std::string>(port));
        switch (server_.connectFailure_)
        {
            case ConnectFailure::timeout:
                throw SysErrorTimeout(formatSystemError("connect", "CURLE_OPERATION_TIMEDOUT", "Connection timed out after " + numberTo<std::string>(connectTimeout.count()) + " seconds."));
            case ConnectFailure::refused:
                throw SysErrorConnectionRefused(formatSystemError("connect", "CURLE_COULDNT_CONNECT", "Connection refused."));
            case ConnectFailure::unknownHost:
                throw SysErrorUnknownHost(formatSystemError("connect", "CURLE_COULDNT_RESOLVE_HOST", "Could not resolve host: " + server));
            case ConnectFailure::none:
                break;
        }
        connected_ = true;
        ++server_.totalConnections_;
        ++server_.activeConnections_;
        server_.peakConnections_ = std::max(server_.peakConnections_, server_.activeConnections_);
    }

    bool login(const std::string& username, const std::string& password) override
    {
        std::lock_guard dummy(server_.mutex_);
        server_.record("USER " + username);
        if (server_.loginReplyCode_ != 0)
            return setReply(server_.loginReplyCode_, false);
        return setReply(230, true);
    }

    void disconnect() override //throw SysError
    {
        std::lock_guard dummy(server_.mutex_);
        server_.record("QUIT");
        if (connected_)
        {
            connected_ = false;
            --server_.activeConnections_;
        }
        if (server_.failDisconnect_)
            throw SysError(formatSystemError("QUIT", "CURLE_SEND_ERROR", "Connection reset by peer."));
    }

    int getReplyCode() const override { return replyCode_; }

    void setTransferMode(TransferMode mode) override {}
    void setPassiveMode(bool passive) override {}
    void setResponseTimeout(std::chrono::seconds timeout) override {}

    bool sendNoOp() override
    {
        std::lock_guard dummy(server_.mutex_);
        server_.record("NOOP");
        return setReply(200, connected_);
    }

    std::unique_ptr<InputStream> retrieve(const std::string& serverPath) override
    {
        const std::string itemPath = normalize(workingDir_, serverPath);
        std::optional<size_t> failAfterBytes;
        {
            std::lock_guard dummy(server_.mutex_);
            server_.record("RETR " + itemPath);

            if (itemPath == server_.failingRetrievePath_)
                throw SysError(formatSystemError("RETR", "425", "Can't open data connection."));

            if (itemPath == server_.failingReadPath_)
                failAfterBytes = server_.failReadAfterBytes_;
        }
        return std::make_unique<FakeDownloadStream>(server_, itemPath, failAfterBytes);
    }

    void store(const std::string& serverPath, const std::function<size_t(void* buffer, size_t bytesToRead)>& readBlock, bool append) override //throw SysError, X
    {
        const std::string itemPath = normalize(workingDir_, serverPath);
        std::function<void(const std::string& serverPath)> onStore;
        {
            std::lock_guard dummy(server_.mutex_);
            server_.record((append ? "APPE " : "STOR ") + itemPath);
            onStore = server_.onStore_;

            auto itParent = server_.items_.find(getParent(itemPath));
            if (itParent == server_.items_.end() || !itParent->second.isFolder)
            {
                replyCode_ = 553;
                throw SysErrorFtpProtocol(formatSystemError("STOR", "553", "Requested action not taken."), 553);
            }
        }
        if (onStore)
            onStore(itemPath);

        std::string content;
        std::vector<char> buffer(4096);
        for (;;)
        {
            const size_t bytesRead = readBlock(buffer.data(), buffer.size()); //throw X
            content.append(buffer.data(), bytesRead);
            if (bytesRead == 0)
                break;
        }

        std::lock_guard dummy(server_.mutex_);
        FakeFtpServer::Node& node = server_.items_[itemPath];
        if (append)
            node.content += content;
        else
            node.content = content;
        node.modTime = 1100000000;
        replyCode_ = 226;
    }

    std::vector<NativeEntry> listEntries(const std::string& serverPath) override //throw SysError
    {
        const std::string folderPath = normalize(workingDir_, serverPath);

        std::lock_guard dummy(server_.mutex_);
        server_.record("MLSD " + folderPath);

        auto it = server_.items_.find(folderPath);
        if (it == server_.items_.end() || !it->second.isFolder)
        {
            replyCode_ = 550;
            throw SysErrorFtpProtocol(formatSystemError("MLSD", "550", "Directory not found."), 550);
        }

        std::vector<NativeEntry> output{{ItemType::folder, "."}, {ItemType::folder, ".."}};
        for (const std::string& childName : server_.getChildNames(folderPath))
        {
            const FakeFtpServer::Node& child = server_.items_.at(appendName(folderPath, childName));
            output.push_back({child.isFolder ? ItemType::folder : ItemType::file, childName,
                              child.isFolder ? 0 : child.content.size(), child.modTime});
        }
        replyCode_ = 226;
        return output;
    }

    bool deleteFile(const std::string& serverPath) override
    {
        const std::string itemPath = normalize(workingDir_, serverPath);

        std::lock_guard dummy(server_.mutex_);
        server_.record("DELE " + itemPath);

        auto it = server_.items_.find(itemPath);
        if (it == server_.items_.end() || it->second.isFolder || itemPath == server_.failingDeletePath_)
            return setReply(550, false);

        server_.items_.erase(it);
        return setReply(250, true);
    }

    bool makeDirectory(const std::string& serverPath) override
    {
        const std::string itemPath = normalize(workingDir_, serverPath);

        std::lock_guard dummy(server_.mutex_);
        server_.record("MKD " + itemPath);

        auto itParent = server_.items_.find(getParent(itemPath));
        if (server_.items_.contains(itemPath) || itParent == server_.items_.end() || !itParent->second.isFolder)
            return setReply(550, false);

        server_.items_[itemPath].isFolder = true;
        return setReply(257, true);
    }

    bool removeDirectory(const std::string& serverPath) override
    {
        const std::string itemPath = normalize(workingDir_, serverPath);

        std::lock_guard dummy(server_.mutex_);
        server_.record("RMD " + itemPath);

        auto it = server_.items_.find(itemPath);
        if (it == server_.items_.end() || !it->second.isFolder || itemPath == "/" || !server_.getChildNames(itemPath).empty())
            return setReply(550, false);

        server_.items_.erase(it);
        return setReply(250, true);
    }

    bool rename(const std::string& serverPathFrom, const std::string& serverPathTo) override
    {
        const std::string pathFrom = normalize(workingDir_, serverPathFrom);
        const std::string pathTo   = normalize(workingDir_, serverPathTo);

        std::lock_guard dummy(server_.mutex_);
        server_.record("RNFR " + pathFrom);
        server_.record("RNTO " + pathTo);

        if (!server_.items_.contains(pathFrom) || server_.items_.contains(pathTo) || !server_.items_.contains(getParent(pathTo)))
            return setReply(553, false);

        std::map<std::string, FakeFtpServer::Node> moved;
        for (auto it = server_.items_.begin(); it != server_.items_.end();)
            if (it->first == pathFrom || startsWith(it->first, pathFrom + '/'))
            {
                moved.emplace(pathTo + it->first.substr(pathFrom.size()), it->second);
                it = server_.items_.erase(it);
            }
            else
                ++it;
        server_.items_.merge(moved);
        return setReply(250, true);
    }

    bool changeWorkingDirectory(const std::string& serverPath) override
    {
        const std::string folderPath = normalize(workingDir_, serverPath);

        std::lock_guard dummy(server_.mutex_);
        server_.record("CWD " + folderPath);

        auto it = server_.items_.find(folderPath);
        if (it == server_.items_.end() || !it->second.isFolder)
            return setReply(550, false);

        workingDir_ = folderPath;
        return setReply(250, true);
    }

    bool changeToParentDirectory() override
    {
        std::lock_guard dummy(server_.mutex_);
        server_.record("CDUP");
        workingDir_ = getParent(workingDir_);
        return setReply(200, true);
    }

    std::string printWorkingDirectory() override
    {
        std::lock_guard dummy(server_.mutex_);
        server_.record("PWD");
        replyCode_ = 257;
        return workingDir_;
    }

private:
    static std::string appendName(const std::string& folderPath, const std::string& itemName)
    {
        return folderPath == "/" ? '/' + itemName : folderPath + '/' + itemName;
    }

    bool setReply(int replyCode, bool result)
    {
        replyCode_ = replyCode;
        return result;
    }

    FakeFtpServer& server_;
    bool connected_ = false;
    int replyCode_ = 0;
    std::string workingDir_ = "/"; //server home
};
}


FakeFtpServer::FakeFtpServer()
{
    items_["/"].isFolder = true;
}


void FakeFtpServer::addFolder(const std::string& serverPath)
{
    const std::string folderPath = normalize("/", serverPath);
    if (folderPath != "/")
        addFolder(getParent(folderPath));

    std::lock_guard dummy(mutex_);
    items_[folderPath].isFolder = true;
}


void FakeFtpServer::addFile(const std::string& serverPath, const std::string& content, time_t modTime)
{
    const std::string filePath = normalize("/", serverPath);
    addFolder(getParent(filePath));

    std::lock_guard dummy(mutex_);
    items_[filePath] = Node{false, content, modTime};
}


void FakeFtpServer::removeItem(const std::string& serverPath)
{
    std::lock_guard dummy(mutex_);
    eraseSubTree(normalize("/", serverPath));
}


bool FakeFtpServer::exists(const std::string& serverPath)
{
    std::lock_guard dummy(mutex_);
    return items_.contains(normalize("/", serverPath));
}


bool FakeFtpServer::isFolder(const std::string& serverPath)
{
    std::lock_guard dummy(mutex_);
    auto it = items_.find(normalize("/", serverPath));
    return it != items_.end() && it->second.isFolder;
}


std::optional<std::string> FakeFtpServer::getContent(const std::string& serverPath)
{
    std::lock_guard dummy(mutex_);
    auto it = items_.find(normalize("/", serverPath));
    if (it == items_.end() || it->second.isFolder)
        return {};
    return it->second.content;
}


std::vector<std::string> FakeFtpServer::getCommands()
{
    std::lock_guard dummy(mutex_);
    return commands_;
}


std::vector<std::string> FakeFtpServer::getCommands(const std::string& verb)
{
    std::lock_guard dummy(mutex_);
    std::vector<std::string> output;
    std::copy_if(commands_.begin(), commands_.end(), std::back_inserter(output),
                 [&](const std::string& cmd) { return startsWith(cmd, verb + ' ') || cmd == verb; });
    return output;
}


void FakeFtpServer::clearCommands()
{
    std::lock_guard dummy(mutex_);
    commands_.clear();
}


size_t FakeFtpServer::getActiveConnections() { std::lock_guard dummy(mutex_); return activeConnections_; }
size_t FakeFtpServer::getPeakConnections  () { std::lock_guard dummy(mutex_); return peakConnections_; }
size_t FakeFtpServer::getTotalConnections () { std::lock_guard dummy(mutex_); return totalConnections_; }

void FakeFtpServer::setConnectFailure(ConnectFailure failure) { std::lock_guard dummy(mutex_); connectFailure_ = failure; }
void FakeFtpServer::setLoginReplyCode(int replyCode) { std::lock_guard dummy(mutex_); loginReplyCode_ = replyCode; }
void FakeFtpServer::setFailingDelete(const std::string& serverPath) { std::lock_guard dummy(mutex_); failingDeletePath_ = normalize("/", serverPath); }
void FakeFtpServer::setFailDisconnect(bool fail) { std::lock_guard dummy(mutex_); failDisconnect_ = fail; }
void FakeFtpServer::setFailingRetrieve(const std::string& serverPath) { std::lock_guard dummy(mutex_); failingRetrievePath_ = normalize("/", serverPath); }

void FakeFtpServer::setFailingRead(const std::string& serverPath, size_t failAfterBytes)
{
    std::lock_guard dummy(mutex_);
    failingReadPath_ = normalize("/", serverPath);
    failReadAfterBytes_ = failAfterBytes;
}

void FakeFtpServer::setOnStore(const std::function<void(const std::string& serverPath)>& onStore)
{
    std::lock_guard dummy(mutex_);
    onStore_ = onStore;
}


ProtocolClientFactory FakeFtpServer::makeClientFactory()
{
    return [this] { return std::make_unique<FakeProtocolClient>(*this); };
}


std::vector<std::string> FakeFtpServer::getChildNames(const std::string& folderPath) const
{
    const std::string prefix = folderPath == "/" ? "/" : folderPath + '/';

    std::vector<std::string> childNames;
    for (auto it = items_.upper_bound(prefix); it != items_.end() && startsWith(it->first, prefix); ++it)
        if (!contains(std::string_view(it->first).substr(prefix.size()), '/'))
            childNames.push_back(it->first.substr(prefix.size()));
    return childNames;
}


void FakeFtpServer::eraseSubTree(const std::string& serverPath)
{
    for (auto it = items_.begin(); it != items_.end();)
        if (it->first == serverPath || startsWith(it->first, serverPath == "/" ? "/" : serverPath + '/'))
        {
            if (it->first == "/")
                ++it; //root stays
            else
                it = items_.erase(it);
        }
        else
            ++it;
}
