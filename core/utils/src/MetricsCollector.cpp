#include "MetricsCollector.h"
#include <sstream>
#include <iomanip>
#include <fstream>
#include <unistd.h>

namespace ChatStorage {

    MetricsCollector::MetricsCollector()
        : startTime_(std::chrono::system_clock::now()) {
    }

    MetricsCollector& MetricsCollector::instance() {
        static MetricsCollector instance;
        return instance;
    }

    // Connection metrics
    void MetricsCollector::recordFrameSent(uint64_t bytes) {
        connectionMetrics_.framesSent++;
        connectionMetrics_.bytesSent += bytes;
    }

    void MetricsCollector::recordFrameReceived(uint64_t bytes) {
        connectionMetrics_.framesReceived++;
        connectionMetrics_.bytesReceived += bytes;
    }

    void MetricsCollector::incrementFramesDiscarded(uint64_t count) { connectionMetrics_.framesDiscarded += count; }
    void MetricsCollector::incrementConnectsSucceeded() { connectionMetrics_.connectsSucceeded++; }
    void MetricsCollector::incrementReconnectAttempts() { connectionMetrics_.reconnectAttempts++; }
    void MetricsCollector::incrementConnectionsFailed() { connectionMetrics_.connectionsFailed++; }
    void MetricsCollector::incrementExchangesTimedOut() { connectionMetrics_.exchangesTimedOut++; }
    void MetricsCollector::incrementUnexpectedFrames() { connectionMetrics_.unexpectedFrames++; }

    // Transfer metrics
    void MetricsCollector::addBytesUploaded(uint64_t bytes) { transferMetrics_.bytesUploaded += bytes; }
    void MetricsCollector::addBytesDownloaded(uint64_t bytes) { transferMetrics_.bytesDownloaded += bytes; }
    void MetricsCollector::incrementTransfersCompleted() { transferMetrics_.transfersCompleted++; }
    void MetricsCollector::incrementTransfersFailed() { transferMetrics_.transfersFailed++; }
    void MetricsCollector::incrementTransfersPaused() { transferMetrics_.transfersPaused++; }
    void MetricsCollector::incrementBackpressurePauses() { transferMetrics_.backpressurePauses++; }

    void MetricsCollector::updateWriteQueueDepth(uint64_t bytes) {
        updatePeak(transferMetrics_.peakWriteQueueBytes, bytes);
    }

    void MetricsCollector::updateMemoryUsage(uint64_t usageMB) {
        updatePeak(transferMetrics_.peakMemoryUsageMB, usageMB);
    }

    void MetricsCollector::updatePeak(std::atomic<uint64_t>& peak, uint64_t value) {
        uint64_t current = peak.load();
        while (value > current && !peak.compare_exchange_weak(current, value)) {
        }
    }

    uint64_t MetricsCollector::sampleResidentMemoryMB() {
        // /proc/self/statm: size resident shared text lib data dt (in pages)
        std::ifstream statm("/proc/self/statm");
        uint64_t size = 0;
        uint64_t resident = 0;
        if (!(statm >> size >> resident)) {
            return 0;
        }
        long pageSize = sysconf(_SC_PAGESIZE);
        if (pageSize <= 0) {
            return 0;
        }
        return resident * static_cast<uint64_t>(pageSize) / (1024 * 1024);
    }

    ConnectionMetricsSnapshot MetricsCollector::getConnectionMetrics() const {
        ConnectionMetricsSnapshot snapshot;
        snapshot.framesSent = connectionMetrics_.framesSent.load();
        snapshot.framesReceived = connectionMetrics_.framesReceived.load();
        snapshot.bytesSent = connectionMetrics_.bytesSent.load();
        snapshot.bytesReceived = connectionMetrics_.bytesReceived.load();
        snapshot.framesDiscarded = connectionMetrics_.framesDiscarded.load();
        snapshot.connectsSucceeded = connectionMetrics_.connectsSucceeded.load();
        snapshot.reconnectAttempts = connectionMetrics_.reconnectAttempts.load();
        snapshot.connectionsFailed = connectionMetrics_.connectionsFailed.load();
        snapshot.exchangesTimedOut = connectionMetrics_.exchangesTimedOut.load();
        snapshot.unexpectedFrames = connectionMetrics_.unexpectedFrames.load();
        return snapshot;
    }

    TransferMetricsSnapshot MetricsCollector::getTransferMetrics() const {
        TransferMetricsSnapshot snapshot;
        snapshot.bytesUploaded = transferMetrics_.bytesUploaded.load();
        snapshot.bytesDownloaded = transferMetrics_.bytesDownloaded.load();
        snapshot.transfersCompleted = transferMetrics_.transfersCompleted.load();
        snapshot.transfersFailed = transferMetrics_.transfersFailed.load();
        snapshot.transfersPaused = transferMetrics_.transfersPaused.load();
        snapshot.backpressurePauses = transferMetrics_.backpressurePauses.load();
        snapshot.peakWriteQueueBytes = transferMetrics_.peakWriteQueueBytes.load();
        snapshot.peakMemoryUsageMB = transferMetrics_.peakMemoryUsageMB.load();
        return snapshot;
    }

    std::string MetricsCollector::getMetricsSummary() const {
        std::stringstream ss;

        auto uptime = getUptime();
        auto hours = std::chrono::duration_cast<std::chrono::hours>(uptime).count();
        auto minutes = std::chrono::duration_cast<std::chrono::minutes>(uptime % std::chrono::hours(1)).count();

        ss << "=== ChatStorage Metrics Summary ===" << std::endl;
        ss << "Uptime: " << hours << "h " << minutes << "m" << std::endl << std::endl;

        ss << "--- Connection Metrics ---" << std::endl;
        ss << "  Frames Sent: " << connectionMetrics_.framesSent.load() << std::endl;
        ss << "  Frames Received: " << connectionMetrics_.framesReceived.load() << std::endl;
        ss << "  Frames Discarded: " << connectionMetrics_.framesDiscarded.load() << std::endl;
        ss << "  Connects: " << connectionMetrics_.connectsSucceeded.load() << std::endl;
        ss << "  Reconnect Attempts: " << connectionMetrics_.reconnectAttempts.load() << std::endl;
        ss << "  Connections Failed: " << connectionMetrics_.connectionsFailed.load() << std::endl;
        ss << "  Exchanges Timed Out: " << connectionMetrics_.exchangesTimedOut.load() << std::endl;
        ss << "  Unexpected Frames: " << connectionMetrics_.unexpectedFrames.load() << std::endl << std::endl;

        ss << "--- Transfer Metrics ---" << std::endl;
        double uploadMB = transferMetrics_.bytesUploaded.load() / (1024.0 * 1024.0);
        double downloadMB = transferMetrics_.bytesDownloaded.load() / (1024.0 * 1024.0);
        ss << std::fixed << std::setprecision(2);
        ss << "  Uploaded: " << uploadMB << " MB" << std::endl;
        ss << "  Downloaded: " << downloadMB << " MB" << std::endl;
        ss << "  Transfers Completed: " << transferMetrics_.transfersCompleted.load() << std::endl;
        ss << "  Transfers Failed: " << transferMetrics_.transfersFailed.load() << std::endl;
        ss << "  Transfers Paused: " << transferMetrics_.transfersPaused.load() << std::endl;
        ss << "  Backpressure Pauses: " << transferMetrics_.backpressurePauses.load() << std::endl;
        ss << "  Peak Write Queue: " << transferMetrics_.peakWriteQueueBytes.load() / 1024 << " KB" << std::endl;
        ss << "  Peak Memory Usage: " << transferMetrics_.peakMemoryUsageMB.load() << " MB" << std::endl;

        return ss.str();
    }

    void MetricsCollector::reset() {
        connectionMetrics_.framesSent = 0;
        connectionMetrics_.framesReceived = 0;
        connectionMetrics_.bytesSent = 0;
        connectionMetrics_.bytesReceived = 0;
        connectionMetrics_.framesDiscarded = 0;
        connectionMetrics_.connectsSucceeded = 0;
        connectionMetrics_.reconnectAttempts = 0;
        connectionMetrics_.connectionsFailed = 0;
        connectionMetrics_.exchangesTimedOut = 0;
        connectionMetrics_.unexpectedFrames = 0;

        transferMetrics_.bytesUploaded = 0;
        transferMetrics_.bytesDownloaded = 0;
        transferMetrics_.transfersCompleted = 0;
        transferMetrics_.transfersFailed = 0;
        transferMetrics_.transfersPaused = 0;
        transferMetrics_.backpressurePauses = 0;
        transferMetrics_.peakWriteQueueBytes = 0;
        transferMetrics_.peakMemoryUsageMB = 0;

        startTime_ = std::chrono::system_clock::now();
    }

    std::chrono::seconds MetricsCollector::getUptime() const {
        auto now = std::chrono::system_clock::now();
        return std::chrono::duration_cast<std::chrono::seconds>(now - startTime_);
    }

} // namespace ChatStorage
