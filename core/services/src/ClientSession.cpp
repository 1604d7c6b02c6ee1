#include "ClientSession.h"
#include "Logger.h"

#include <stdexcept>

namespace ChatStorage {

ClientSession::ClientSession(ClientSettings settings)
    : settings_(std::move(settings)),
      connection_(std::make_unique<Connection>(settings_.control)),
      correlator_(std::make_unique<Correlator>(*connection_)),
      auth_(std::make_unique<AuthService>(*correlator_)),
      friends_(std::make_unique<FriendService>(*correlator_)),
      directories_(std::make_unique<DirectoryService>(*correlator_)),
      files_(std::make_unique<FileService>(*correlator_)) {
    const auto timeout = std::chrono::milliseconds(settings_.requestTimeoutMs);
    auth_->setTimeout(timeout);
    friends_->setTimeout(timeout);
    directories_->setTimeout(timeout);
    files_->setTimeout(timeout);
}

ClientSession::~ClientSession() {
    close();
}

VoidResult ClientSession::openStore() {
    if (scheduler_) {
        return Ok();
    }
    auto database = std::make_unique<SQLiteHandler>();
    auto opened = database->initialize(settings_.dbPath);
    if (!opened) {
        return opened;
    }
    database_ = std::move(database);
    store_ = std::make_unique<SQLiteTaskStore>(database_.get());

    SchedulerOptions options = settings_.scheduler;
    options.host = settings_.host;
    scheduler_ = std::make_unique<TransferScheduler>(options, *store_, fileAccess_);

    auto restored = scheduler_->restore();
    if (!restored) {
        return restored.error();
    }
    return Ok();
}

VoidResult ClientSession::connect() {
    return connection_->connect(settings_.host, settings_.controlPort);
}

void ClientSession::close() {
    if (scheduler_) {
        scheduler_->shutdown();
    }
    if (connection_) {
        connection_->disconnect();
    }
}

TransferScheduler& ClientSession::transfers() {
    if (!scheduler_) {
        throw std::logic_error("ClientSession::transfers() before openStore()");
    }
    return *scheduler_;
}

Result<std::string> ClientSession::upload(const std::string& localPath, int64_t targetDirId) {
    if (!scheduler_) {
        return Error{ErrorCode::InvalidArgument, "task store is not open", "ClientSession"};
    }
    if (!fileAccess_.exists(localPath)) {
        return Error{ErrorCode::FileNotFound, localPath, "ClientSession"};
    }

    int64_t userId = 0;
    std::string userName;
    if (auto user = auth_->currentUser()) {
        userId = user->userId;
        userName = user->userName;
    }

    TransferTask task = TransferTask::makeUpload(fileAccess_.makeReference(localPath), targetDirId, userId);
    task.userName = userName;
    auto size = fileAccess_.size(task.localPath);
    if (size) {
        task.totalSize = size.value();
    }

    auto submitted = scheduler_->submit(task);
    if (!submitted) {
        return submitted.error();
    }
    return task.taskId;
}

Result<std::string> ClientSession::download(int64_t fileId, const std::string& fileName,
                                            const std::string& destinationPath, uint64_t fileSize) {
    if (!scheduler_) {
        return Error{ErrorCode::InvalidArgument, "task store is not open", "ClientSession"};
    }

    int64_t userId = 0;
    std::string userName;
    if (auto user = auth_->currentUser()) {
        userId = user->userId;
        userName = user->userName;
    }

    TransferTask task = TransferTask::makeDownload(fileId, fileName, fileAccess_.makeReference(destinationPath),
                                                   fileSize, userId);
    task.userName = userName;

    auto submitted = scheduler_->submit(task);
    if (!submitted) {
        return submitted.error();
    }
    return task.taskId;
}

} // namespace ChatStorage
