#pragma once

#include "Correlator.h"
#include "IFileAccess.h"
#include "ResponseEnvelope.h"
#include "TransferProgress.h"
#include "TransferTask.h"
#include "WriteQueue.h"

#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>

namespace ChatStorage {

/**
 * @brief Resumable download of one task over a dedicated transfer connection.
 *
 * The request carries the on-disk size of the partial file as startOffset.
 * The server answers with Meta/Ack carrying fileSize, we reply Ack
 * {status:"ready"} and Data frames follow until End. Data goes through a
 * WriteQueue so a slow disk pushes back on the socket instead of stalling
 * in the receive thread.
 */
class DownloadSession {
public:
    DownloadSession(Correlator& correlator, IFileAccess& files, TransferOptions options);

    /**
     * @brief Run the download to completion, cancellation or failure.
     *
     * Updates task.totalSize and the transferred bytes. Cancellation yields
     * ErrorCode::Cancelled, inactivity longer than idleTimeoutMs yields Timeout.
     */
    VoidResult run(TransferTask& task, const std::atomic<bool>& cancelled, TransferObserver* observer);

private:
    class Sink;

    Correlator& correlator_;
    IFileAccess& files_;
    TransferOptions options_;
};

} // namespace ChatStorage
