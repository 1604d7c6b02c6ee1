#include "WriteQueue.h"
#include "Logger.h"
#include "LoggerMacros.h"
#include "MetricsCollector.h"

namespace ChatStorage {

WriteQueue::WriteQueue(std::unique_ptr<std::ostream> out,
                       std::size_t highWater,
                       std::size_t lowWater,
                       std::string label)
    : out_(std::move(out)),
      highWater_(highWater),
      lowWater_(lowWater < highWater ? lowWater : highWater / 2),
      label_(std::move(label)),
      lastDiagnostics_(std::chrono::steady_clock::now()) {
    writer_ = std::thread(&WriteQueue::writerLoop, this);
}

WriteQueue::~WriteQueue() {
    close();
}

void WriteQueue::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_ && !writer_.joinable()) {
            return;
        }
        stopping_ = true;
    }
    dataCv_.notify_all();
    spaceCv_.notify_all();
    if (writer_.joinable() && writer_.get_id() != std::this_thread::get_id()) {
        writer_.join();
    }
}

VoidResult WriteQueue::enqueue(std::vector<uint8_t> chunk, const std::atomic<bool>& cancelled) {
    const std::size_t size = chunk.size();
    std::unique_lock<std::mutex> lock(mutex_);

    // Wait-and-recheck until the writer drained below the low-water mark
    while (intakePaused_ && !stopping_ && !writeError_) {
        if (cancelled.load()) {
            return Error{ErrorCode::Cancelled, "cancelled while write queue was full", "WriteQueue"};
        }
        spaceCv_.wait_for(lock, std::chrono::milliseconds(config::WAIT_SLICE_MS));
    }

    if (writeError_) {
        return *writeError_;
    }
    if (stopping_) {
        return Error{ErrorCode::Cancelled, "write queue closed", "WriteQueue"};
    }
    if (cancelled.load()) {
        return Error{ErrorCode::Cancelled, "cancelled", "WriteQueue"};
    }

    chunks_.push_back(std::move(chunk));
    pendingBytes_ += size;
    MetricsCollector::instance().updateWriteQueueDepth(pendingBytes_);

    if (!intakePaused_ && pendingBytes_ >= highWater_) {
        intakePaused_ = true;
        MetricsCollector::instance().incrementBackpressurePauses();
        LOG_DEBUG_COMP_IF(label_ + ": intake paused at " + std::to_string(pendingBytes_) + " bytes", "WriteQueue");
    }
    lock.unlock();
    dataCv_.notify_one();
    return Ok();
}

VoidResult WriteQueue::flush(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    bool drained = spaceCv_.wait_for(lock, timeout, [this]() {
        return (chunks_.empty() && !writing_) || writeError_.has_value() || stopping_;
    });
    if (writeError_) {
        return *writeError_;
    }
    if (!drained) {
        return Error{ErrorCode::Timeout, label_ + ": " + std::to_string(pendingBytes_) + " bytes still queued",
                     "WriteQueue"};
    }
    if (!chunks_.empty() || writing_) {
        return Error{ErrorCode::Cancelled, "write queue closed before flush", "WriteQueue"};
    }

    out_->flush();
    if (!out_->good()) {
        writeError_ = Error{ErrorCode::FileIOError, label_ + ": flush failed", "WriteQueue"};
        return *writeError_;
    }
    return Ok();
}

std::size_t WriteQueue::pendingBytes() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pendingBytes_;
}

bool WriteQueue::intakePaused() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return intakePaused_;
}

void WriteQueue::writerLoop() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (true) {
        dataCv_.wait_for(lock, std::chrono::milliseconds(config::WAIT_SLICE_MS), [this]() {
            return stopping_ || !chunks_.empty();
        });

        auto now = std::chrono::steady_clock::now();
        if (now - lastDiagnostics_ >= std::chrono::milliseconds(config::DIAGNOSTICS_INTERVAL_MS)) {
            lastDiagnostics_ = now;
            lock.unlock();
            sampleDiagnostics();
            lock.lock();
        }

        if (stopping_) {
            break;
        }
        if (chunks_.empty() || writeError_) {
            continue;
        }

        std::vector<uint8_t> chunk = std::move(chunks_.front());
        chunks_.pop_front();
        writing_ = true;
        lock.unlock();

        out_->write(reinterpret_cast<const char*>(chunk.data()), static_cast<std::streamsize>(chunk.size()));
        bool good = out_->good();

        lock.lock();
        writing_ = false;
        pendingBytes_ -= chunk.size();
        if (good) {
            written_ += chunk.size();
        } else {
            writeError_ = Error{ErrorCode::FileIOError, label_ + ": disk write failed", "WriteQueue"};
            Logger::instance().log(LogLevel::ERROR, writeError_->message, "WriteQueue");
        }

        if (intakePaused_ && pendingBytes_ <= lowWater_) {
            intakePaused_ = false;
            LOG_DEBUG_COMP_IF(label_ + ": intake resumed at " + std::to_string(pendingBytes_) + " bytes",
                              "WriteQueue");
        }
        spaceCv_.notify_all();
    }
    spaceCv_.notify_all();
}

void WriteQueue::sampleDiagnostics() {
    std::size_t pending = pendingBytes();
    uint64_t rssMB = MetricsCollector::sampleResidentMemoryMB();

    auto& metrics = MetricsCollector::instance();
    metrics.updateWriteQueueDepth(pending);
    metrics.updateMemoryUsage(rssMB);

    LOG_DEBUG_COMP_IF(label_ + ": queue " + std::to_string(pending / 1024) + " KB, written " +
                      std::to_string(written_.load() / 1024) + " KB, rss " + std::to_string(rssMB) + " MB",
                      "WriteQueue");
}

} // namespace ChatStorage
