#pragma once

#include "Result.h"
#include "Constants.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <ostream>
#include <string>
#include <thread>
#include <vector>

namespace ChatStorage {

/**
 * @brief Asynchronous sequential writer for downloaded chunks.
 *
 * enqueue() returns as soon as the chunk is buffered. Once pending bytes
 * reach the high-water mark intake is paused, and enqueue() blocks in short
 * cancellation-aware waits until the writer drains the queue down to the
 * low-water mark.
 *
 * Queue depth and process RSS are sampled every few seconds for the debug
 * log and MetricsCollector only.
 */
class WriteQueue {
public:
    WriteQueue(std::unique_ptr<std::ostream> out,
               std::size_t highWater,
               std::size_t lowWater,
               std::string label);
    ~WriteQueue();

    WriteQueue(const WriteQueue&) = delete;
    WriteQueue& operator=(const WriteQueue&) = delete;

    /**
     * @brief Buffer one chunk for writing.
     *
     * Fails with Cancelled when the flag is raised while waiting, with the
     * writer's FileIOError once a write failed, and with Cancelled after close().
     */
    VoidResult enqueue(std::vector<uint8_t> chunk, const std::atomic<bool>& cancelled);

    /// Wait until everything queued is written and flushed to the stream
    VoidResult flush(std::chrono::milliseconds timeout);

    /// Stop the writer, dropping unwritten chunks. Idempotent.
    void close();

    std::size_t pendingBytes() const;
    uint64_t writtenBytes() const { return written_.load(); }
    bool intakePaused() const;

private:
    void writerLoop();
    void sampleDiagnostics();

    std::unique_ptr<std::ostream> out_;
    const std::size_t highWater_;
    const std::size_t lowWater_;
    const std::string label_;

    mutable std::mutex mutex_;
    std::condition_variable dataCv_;
    std::condition_variable spaceCv_;
    std::deque<std::vector<uint8_t>> chunks_;
    std::size_t pendingBytes_{0};
    bool writing_{false};
    bool intakePaused_{false};
    bool stopping_{false};
    std::optional<Error> writeError_;

    std::atomic<uint64_t> written_{0};
    std::chrono::steady_clock::time_point lastDiagnostics_;

    std::thread writer_;
};

} // namespace ChatStorage
