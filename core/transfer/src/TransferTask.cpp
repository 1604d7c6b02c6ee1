#include "TransferTask.h"
#include "Constants.h"

#include <chrono>
#include <filesystem>
#include <uuid/uuid.h>

namespace ChatStorage {

const char* transferStatusName(TransferStatus status) {
    switch (status) {
        case TransferStatus::Waiting: return "waiting";
        case TransferStatus::Active: return "active";
        case TransferStatus::Paused: return "paused";
        case TransferStatus::Failed: return "failed";
        case TransferStatus::Completed: return "completed";
    }
    return "unknown";
}

const char* transferDirectionName(TransferDirection direction) {
    return direction == TransferDirection::Upload ? "upload" : "download";
}

std::optional<TransferStatus> transferStatusFromInt(int value) {
    if (value < static_cast<int>(TransferStatus::Waiting) || value > static_cast<int>(TransferStatus::Completed)) {
        return std::nullopt;
    }
    return static_cast<TransferStatus>(value);
}

std::string TransferTask::persistedMarker() const {
    if (direction == TransferDirection::Download) {
        return std::string(config::DOWNLOAD_MARKER_PREFIX) + std::to_string(remoteFileId);
    }
    return fingerprint;
}

bool TransferTask::applyDownloadMarker(const std::string& marker) {
    const std::string prefix = config::DOWNLOAD_MARKER_PREFIX;
    if (marker.compare(0, prefix.size(), prefix) != 0) {
        return false;
    }
    try {
        remoteFileId = std::stoll(marker.substr(prefix.size()));
    } catch (const std::exception&) {
        return false;
    }
    direction = TransferDirection::Download;
    fingerprint.clear();
    return true;
}

void TransferTask::setTransferred(uint64_t bytes) {
    transferredBytes = bytes;
    if (totalSize > 0) {
        progress = static_cast<double>(bytes) / static_cast<double>(totalSize);
        if (progress > 1.0) progress = 1.0;
    } else {
        progress = 0.0;
    }
}

TransferTask TransferTask::makeUpload(const std::string& localPath, int64_t targetDirId, int64_t userId) {
    TransferTask task;
    task.taskId = generateTaskId();
    task.direction = TransferDirection::Upload;
    task.localPath = localPath;
    task.fileReference = localPath;
    task.fileName = std::filesystem::path(localPath).filename().string();
    task.targetDirId = targetDirId;
    task.userId = userId;
    task.createdAt = nowMillis();
    return task;
}

TransferTask TransferTask::makeDownload(int64_t remoteFileId, const std::string& fileName,
                                        const std::string& destinationPath, uint64_t fileSize, int64_t userId) {
    TransferTask task;
    task.taskId = generateTaskId();
    task.direction = TransferDirection::Download;
    task.remoteFileId = remoteFileId;
    task.fileName = fileName;
    task.localPath = destinationPath;
    task.fileReference = destinationPath;
    task.totalSize = fileSize;
    task.userId = userId;
    task.createdAt = nowMillis();
    return task;
}

std::string TransferTask::generateTaskId() {
    uuid_t uuid;
    uuid_generate(uuid);
    char str[37];
    uuid_unparse_lower(uuid, str);
    return std::string(str);
}

int64_t TransferTask::nowMillis() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

} // namespace ChatStorage
