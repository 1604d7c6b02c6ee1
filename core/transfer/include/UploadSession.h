#pragma once

#include "Correlator.h"
#include "IFileAccess.h"
#include "ResponseEnvelope.h"
#include "TransferProgress.h"
#include "TransferTask.h"

#include <atomic>

namespace ChatStorage {

/**
 * @brief Resumable upload of one task over a dedicated transfer connection.
 *
 * Handshake: ResumeCheck -> ResumeAck ("new" or "resume"); on "new" a Meta
 * frame must be acknowledged with status "ready". Data is streamed from the
 * agreed offset in chunk-sized Data frames, then End must be acknowledged
 * with status "success".
 */
class UploadSession {
public:
    UploadSession(Correlator& correlator, IFileAccess& files, TransferOptions options);

    /**
     * @brief Run the upload to completion, cancellation or failure.
     *
     * Updates task.totalSize, task.fingerprint and the transferred bytes.
     * Cancellation yields ErrorCode::Cancelled.
     */
    VoidResult run(TransferTask& task, const std::atomic<bool>& cancelled, TransferObserver* observer);

    /// Identifier the server uses for this upload (its echo or our own)
    const std::string& serverTaskId() const { return serverTaskId_; }

private:
    Result<uint64_t> negotiateOffset(const TransferTask& task, uint64_t fileSize);
    VoidResult streamData(TransferTask& task, uint64_t offset, uint64_t fileSize,
                          const std::atomic<bool>& cancelled, ProgressReporter& reporter);
    VoidResult finish();

    Json::Value describeFile(const TransferTask& task, uint64_t fileSize) const;

    Correlator& correlator_;
    IFileAccess& files_;
    TransferOptions options_;
    std::string serverTaskId_;
};

/// Lower-case extension without the dot, empty when there is none
std::string fileExtension(const std::string& fileName);

} // namespace ChatStorage
