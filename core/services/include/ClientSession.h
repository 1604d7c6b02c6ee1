#pragma once

#include "AuthService.h"
#include "ClientSettings.h"
#include "Connection.h"
#include "Correlator.h"
#include "DirectoryService.h"
#include "FileService.h"
#include "FriendService.h"
#include "LocalFileAccess.h"
#include "SQLiteHandler.h"
#include "SQLiteTaskStore.h"
#include "TransferScheduler.h"

#include <memory>

namespace ChatStorage {

/**
 * @brief Everything one signed-in client needs, built from ClientSettings.
 *
 * Owns the control connection with its Correlator and request services,
 * the task database and the TransferScheduler. Transfers use the control
 * host with the upload/download ports.
 */
class ClientSession {
public:
    explicit ClientSession(ClientSettings settings);
    ~ClientSession();

    ClientSession(const ClientSession&) = delete;
    ClientSession& operator=(const ClientSession&) = delete;

    /// Open the task database and restore unfinished transfers as paused
    VoidResult openStore();

    /// Connect the control channel
    VoidResult connect();

    /// Stop transfers and disconnect. Called by the destructor.
    void close();

    /// Queue an upload for the signed-in user
    Result<std::string> upload(const std::string& localPath, int64_t targetDirId);

    /// Queue a download of a remote file to destinationPath
    Result<std::string> download(int64_t fileId, const std::string& fileName, const std::string& destinationPath,
                                 uint64_t fileSize = 0);

    AuthService& auth() { return *auth_; }
    FriendService& friends() { return *friends_; }
    DirectoryService& directories() { return *directories_; }
    FileService& files() { return *files_; }
    Connection& connection() { return *connection_; }

    /// Valid after openStore()
    TransferScheduler& transfers();
    bool storeOpen() const { return scheduler_ != nullptr; }

    const ClientSettings& settings() const { return settings_; }

private:
    ClientSettings settings_;

    std::unique_ptr<Connection> connection_;
    std::unique_ptr<Correlator> correlator_;
    std::unique_ptr<AuthService> auth_;
    std::unique_ptr<FriendService> friends_;
    std::unique_ptr<DirectoryService> directories_;
    std::unique_ptr<FileService> files_;

    std::unique_ptr<SQLiteHandler> database_;
    std::unique_ptr<SQLiteTaskStore> store_;
    LocalFileAccess fileAccess_;
    std::unique_ptr<TransferScheduler> scheduler_;
};

} // namespace ChatStorage
