#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace ChatStorage {

enum class TransferDirection {
    Upload,
    Download
};

/// Persisted as the integer value; do not renumber
enum class TransferStatus {
    Waiting = 0,
    Active = 1,
    Paused = 2,
    Failed = 3,
    Completed = 4
};

const char* transferStatusName(TransferStatus status);
const char* transferDirectionName(TransferDirection direction);
std::optional<TransferStatus> transferStatusFromInt(int value);

/**
 * @brief One upload or download tracked by the TransferScheduler.
 *
 * fileReference is what gets persisted and resolved back to localPath by
 * IFileAccess on recovery. Downloads have no content fingerprint; their
 * persisted fingerprint column holds DOWNLOAD_FILE_ID_<remoteFileId>.
 */
struct TransferTask {
    std::string taskId;
    TransferDirection direction{TransferDirection::Upload};
    std::string fileName;
    std::string localPath;
    std::string fileReference;
    int64_t targetDirId{0};
    int64_t remoteFileId{0};
    int64_t userId{0};
    std::string userName;
    uint64_t totalSize{0};
    uint64_t transferredBytes{0};
    double progress{0.0};
    TransferStatus status{TransferStatus::Waiting};
    std::string fingerprint;
    std::string errorMessage;
    int64_t createdAt{0};

    /// Value stored in the fingerprint column
    std::string persistedMarker() const;

    /// Fills direction/remoteFileId from a stored marker; false if it is not a download marker
    bool applyDownloadMarker(const std::string& marker);

    void setTransferred(uint64_t bytes);

    static TransferTask makeUpload(const std::string& localPath, int64_t targetDirId, int64_t userId);
    static TransferTask makeDownload(int64_t remoteFileId, const std::string& fileName,
                                     const std::string& destinationPath, uint64_t fileSize, int64_t userId);

    /// Random UUID (libuuid), lower-case
    static std::string generateTaskId();
    static int64_t nowMillis();
};

} // namespace ChatStorage
