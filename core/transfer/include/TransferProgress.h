#pragma once

#include "Constants.h"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

namespace ChatStorage {

/// Tunables shared by UploadSession and DownloadSession
struct TransferOptions {
    std::size_t chunkSize{config::TRANSFER_CHUNK_SIZE};
    int progressIntervalMs{config::PROGRESS_INTERVAL_MS};
    int requestTimeoutMs{config::REQUEST_TIMEOUT_MS};
    int idleTimeoutMs{config::TRANSFER_IDLE_TIMEOUT_MS};
    std::size_t writeHighWater{config::WRITE_HIGH_WATER};
    std::size_t writeLowWater{config::WRITE_LOW_WATER};
};

/**
 * @brief Receives throttled progress from a running transfer.
 *
 * Called on the thread running the session, never on a receive thread.
 */
class TransferObserver {
public:
    virtual ~TransferObserver() = default;
    virtual void onProgress(uint64_t transferredBytes, uint64_t totalBytes, const std::string& speed) = 0;
};

/**
 * @brief Throttles progress reports and derives a speed string.
 *
 * Speed is measured over the bytes moved since the previous report.
 */
class ProgressReporter {
public:
    ProgressReporter(TransferObserver* observer, int intervalMs, uint64_t startBytes);

    /// Reports when the interval elapsed, or unconditionally with force
    void update(uint64_t transferredBytes, uint64_t totalBytes, bool force = false);

    /// "512 B/s", "12.5 KB/s", "3.2 MB/s"
    static std::string formatSpeed(double bytesPerSecond);

private:
    TransferObserver* observer_;
    std::chrono::milliseconds interval_;
    std::chrono::steady_clock::time_point lastReport_;
    uint64_t lastBytes_;
    std::string lastSpeed_;
};

} // namespace ChatStorage
