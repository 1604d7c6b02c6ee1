#pragma once

#include <string>
#include <atomic>
#include <chrono>
#include <cstdint>

namespace ChatStorage {

    // Snapshot structs for returning metrics (non-atomic)
    struct ConnectionMetricsSnapshot {
        uint64_t framesSent{0};
        uint64_t framesReceived{0};
        uint64_t bytesSent{0};
        uint64_t bytesReceived{0};
        uint64_t framesDiscarded{0};
        uint64_t connectsSucceeded{0};
        uint64_t reconnectAttempts{0};
        uint64_t connectionsFailed{0};
        uint64_t exchangesTimedOut{0};
        uint64_t unexpectedFrames{0};
    };

    struct TransferMetricsSnapshot {
        uint64_t bytesUploaded{0};
        uint64_t bytesDownloaded{0};
        uint64_t transfersCompleted{0};
        uint64_t transfersFailed{0};
        uint64_t transfersPaused{0};
        uint64_t backpressurePauses{0};
        uint64_t peakWriteQueueBytes{0};
        uint64_t peakMemoryUsageMB{0};
    };

    // Internal structs with atomics
    struct ConnectionMetrics {
        std::atomic<uint64_t> framesSent{0};
        std::atomic<uint64_t> framesReceived{0};
        std::atomic<uint64_t> bytesSent{0};
        std::atomic<uint64_t> bytesReceived{0};
        std::atomic<uint64_t> framesDiscarded{0};
        std::atomic<uint64_t> connectsSucceeded{0};
        std::atomic<uint64_t> reconnectAttempts{0};
        std::atomic<uint64_t> connectionsFailed{0};
        std::atomic<uint64_t> exchangesTimedOut{0};
        std::atomic<uint64_t> unexpectedFrames{0};
    };

    struct TransferMetrics {
        std::atomic<uint64_t> bytesUploaded{0};
        std::atomic<uint64_t> bytesDownloaded{0};
        std::atomic<uint64_t> transfersCompleted{0};
        std::atomic<uint64_t> transfersFailed{0};
        std::atomic<uint64_t> transfersPaused{0};
        std::atomic<uint64_t> backpressurePauses{0};
        std::atomic<uint64_t> peakWriteQueueBytes{0};
        std::atomic<uint64_t> peakMemoryUsageMB{0};
    };

    /**
     * @brief Process-wide counters for the client engine.
     *
     * Counters are observational only; nothing in the engine reads them back
     * to make a control decision.
     */
    class MetricsCollector {
    public:
        static MetricsCollector& instance();

        // Connection metrics
        void recordFrameSent(uint64_t bytes);
        void recordFrameReceived(uint64_t bytes);
        void incrementFramesDiscarded(uint64_t count = 1);
        void incrementConnectsSucceeded();
        void incrementReconnectAttempts();
        void incrementConnectionsFailed();
        void incrementExchangesTimedOut();
        void incrementUnexpectedFrames();

        // Transfer metrics
        void addBytesUploaded(uint64_t bytes);
        void addBytesDownloaded(uint64_t bytes);
        void incrementTransfersCompleted();
        void incrementTransfersFailed();
        void incrementTransfersPaused();
        void incrementBackpressurePauses();
        void updateWriteQueueDepth(uint64_t bytes);
        void updateMemoryUsage(uint64_t usageMB);

        ConnectionMetricsSnapshot getConnectionMetrics() const;
        TransferMetricsSnapshot getTransferMetrics() const;

        std::string getMetricsSummary() const;

        void reset();

        std::chrono::seconds getUptime() const;

        /// Resident set size of this process in MB, 0 when unavailable
        static uint64_t sampleResidentMemoryMB();

    private:
        MetricsCollector();
        ~MetricsCollector() = default;

        ConnectionMetrics connectionMetrics_;
        TransferMetrics transferMetrics_;

        std::chrono::system_clock::time_point startTime_;

        static void updatePeak(std::atomic<uint64_t>& peak, uint64_t value);
    };

} // namespace ChatStorage
