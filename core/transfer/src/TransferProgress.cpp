#include "TransferProgress.h"

#include <cstdio>

namespace ChatStorage {

ProgressReporter::ProgressReporter(TransferObserver* observer, int intervalMs, uint64_t startBytes)
    : observer_(observer),
      interval_(intervalMs),
      lastReport_(std::chrono::steady_clock::now()),
      lastBytes_(startBytes),
      lastSpeed_(formatSpeed(0.0)) {}

void ProgressReporter::update(uint64_t transferredBytes, uint64_t totalBytes, bool force) {
    auto now = std::chrono::steady_clock::now();
    auto elapsed = now - lastReport_;
    if (!force && elapsed < interval_) {
        return;
    }

    double seconds = std::chrono::duration<double>(elapsed).count();
    if (seconds > 0.0) {
        uint64_t delta = transferredBytes > lastBytes_ ? transferredBytes - lastBytes_ : 0;
        lastSpeed_ = formatSpeed(static_cast<double>(delta) / seconds);
    }
    lastReport_ = now;
    lastBytes_ = transferredBytes;

    if (observer_) {
        observer_->onProgress(transferredBytes, totalBytes, lastSpeed_);
    }
}

std::string ProgressReporter::formatSpeed(double bytesPerSecond) {
    char buffer[32];
    if (bytesPerSecond < 1024.0) {
        std::snprintf(buffer, sizeof(buffer), "%.0f B/s", bytesPerSecond);
    } else if (bytesPerSecond < 1024.0 * 1024.0) {
        std::snprintf(buffer, sizeof(buffer), "%.1f KB/s", bytesPerSecond / 1024.0);
    } else {
        std::snprintf(buffer, sizeof(buffer), "%.1f MB/s", bytesPerSecond / 1024.0 / 1024.0);
    }
    return buffer;
}

} // namespace ChatStorage
