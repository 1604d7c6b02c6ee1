#include "DownloadSession.h"
#include "Logger.h"
#include "LoggerMacros.h"
#include "MetricsCollector.h"

namespace ChatStorage {

namespace {

int64_t announcedSize(const Envelope& envelope) {
    if (envelope.raw.isObject() && envelope.raw.isMember("fileSize")) {
        return jsonInt64(envelope.raw["fileSize"], -1);
    }
    if (envelope.data.isObject() && envelope.data.isMember("fileSize")) {
        return jsonInt64(envelope.data["fileSize"], -1);
    }
    return -1;
}

} // namespace

/**
 * Runs on the receive thread. Data frames block in WriteQueue::enqueue while
 * intake is paused, which stops socket reads and lets TCP flow control slow
 * the server down.
 */
class DownloadSession::Sink : public StreamSink {
public:
    Sink(Correlator& correlator, std::shared_ptr<WriteQueue> queue, const std::atomic<bool>& cancelled,
         std::string taskId)
        : correlator_(correlator),
          queue_(std::move(queue)),
          cancelled_(cancelled),
          taskId_(std::move(taskId)),
          lastActivity_(std::chrono::steady_clock::now()) {}

    SinkAction onFrame(const Frame& frame) override {
        touch();
        switch (frame.type) {
            case FrameType::Data:
                return onData(frame);
            case FrameType::End: {
                LOG_DEBUG_COMP_IF("End frame for task " + taskId_, "DownloadSession");
                std::lock_guard<std::mutex> lock(mutex_);
                ended_ = true;
                cv_.notify_all();
                return SinkAction::Done;
            }
            default:
                handleControl(frame);
                return SinkAction::Continue;
        }
    }

    void onEnd(const Error& reason) override {
        fail(Error{ErrorCode::ConnectionLost, reason.message, "DownloadSession"});
    }

    /// Meta / Ack / FileResponse, from the sink or from the request exchange
    void handleControl(const Frame& frame) {
        auto envelope = parseEnvelope(frame);
        if (!envelope) {
            Logger::instance().log(LogLevel::WARN, "Ignoring unparsable " + std::string(frameTypeName(frame.type)) +
                                   " frame: " + envelope.error().message, "DownloadSession");
            return;
        }

        if (frame.type == FrameType::FileResponse) {
            if (!envelope->ok || envelope->code != 200) {
                fail(envelope->toError());
            }
            return;
        }

        if (!envelope->ok) {
            fail(envelope->toError());
            return;
        }

        int64_t size = announcedSize(envelope.value());
        if (size < 0) {
            return;
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            totalSize_ = static_cast<uint64_t>(size);
            sizeKnown_ = true;
            if (readySent_) {
                return;
            }
            readySent_ = true;
        }

        Json::Value ready;
        ready["taskId"] = taskId_;
        ready["status"] = "ready";
        auto sent = correlator_.send(makeJsonFrame(FrameType::Ack, ready));
        if (!sent) {
            fail(Error{ErrorCode::ConnectionLost, "ready ack not sent: " + sent.error().message, "DownloadSession"});
            return;
        }
        LOG_DEBUG_COMP_IF("Ready ack sent for task " + taskId_ + ", size " + std::to_string(size), "DownloadSession");
    }

    void fail(const Error& error) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!error_) {
            error_ = error;
        }
        cv_.notify_all();
    }

    /// Wait up to one slice for a state change
    void waitSlice() {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait_for(lock, std::chrono::milliseconds(config::WAIT_SLICE_MS),
                     [this]() { return ended_ || error_.has_value(); });
    }

    std::optional<Error> error() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return error_;
    }

    bool ended() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return ended_;
    }

    std::optional<uint64_t> totalSize() const {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!sizeKnown_) return std::nullopt;
        return totalSize_;
    }

    uint64_t received() const { return received_.load(); }

    std::chrono::steady_clock::duration idleFor() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return std::chrono::steady_clock::now() - lastActivity_;
    }

private:
    SinkAction onData(const Frame& frame) {
        if (error().has_value()) {
            // Swallow the rest of the stream until the session tears down
            return SinkAction::Continue;
        }
        const std::size_t size = frame.payload.size();
        auto queued = queue_->enqueue(frame.payload, cancelled_);
        if (!queued) {
            fail(queued.error());
            return SinkAction::Continue;
        }
        received_ += size;
        MetricsCollector::instance().addBytesDownloaded(size);
        touch();
        return SinkAction::Continue;
    }

    void touch() {
        std::lock_guard<std::mutex> lock(mutex_);
        lastActivity_ = std::chrono::steady_clock::now();
    }

    Correlator& correlator_;
    std::shared_ptr<WriteQueue> queue_;
    const std::atomic<bool>& cancelled_;
    const std::string taskId_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool ended_{false};
    bool readySent_{false};
    bool sizeKnown_{false};
    uint64_t totalSize_{0};
    std::optional<Error> error_;
    std::chrono::steady_clock::time_point lastActivity_;
    std::atomic<uint64_t> received_{0};
};

DownloadSession::DownloadSession(Correlator& correlator, IFileAccess& files, TransferOptions options)
    : correlator_(correlator), files_(files), options_(options) {}

VoidResult DownloadSession::run(TransferTask& task, const std::atomic<bool>& cancelled, TransferObserver* observer) {
    auto& logger = Logger::instance();

    // Resume from what is really on disk, not from the persisted counter
    uint64_t offset = 0;
    if (files_.exists(task.localPath)) {
        auto onDisk = files_.size(task.localPath);
        if (!onDisk) {
            return onDisk.error();
        }
        offset = onDisk.value();
    }
    if (task.totalSize > 0 && offset > task.totalSize) {
        logger.log(LogLevel::WARN, "Partial file " + task.localPath + " is larger than the remote file, restarting",
                   "DownloadSession");
        offset = 0;
    }
    task.setTransferred(offset);

    if (cancelled.load()) {
        return Error{ErrorCode::Cancelled, "cancelled before request", "DownloadSession"};
    }

    auto out = files_.openForWriteAt(task.localPath, offset);
    if (!out) {
        return out.error();
    }

    auto queue = std::make_shared<WriteQueue>(std::move(out.value()), options_.writeHighWater,
                                              options_.writeLowWater, "download " + task.taskId);
    auto sink = std::make_shared<Sink>(correlator_, queue, cancelled, task.taskId);
    correlator_.registerStreamSink({FrameType::Data, FrameType::End, FrameType::Ack, FrameType::Meta,
                                    FrameType::FileResponse}, sink);

    // Closing the queue first releases a receive thread blocked on intake
    struct Teardown {
        Correlator& correlator;
        std::shared_ptr<Sink> sink;
        std::shared_ptr<WriteQueue> queue;
        ~Teardown() {
            queue->close();
            correlator.unregisterStreamSink(sink);
        }
    } teardown{correlator_, sink, queue};

    logger.log(LogLevel::INFO, "Downloading file " + std::to_string(task.remoteFileId) + " to " + task.localPath +
               " from offset " + std::to_string(offset), "DownloadSession");

    Json::Value request;
    request["fileId"] = static_cast<Json::Int64>(task.remoteFileId);
    request["taskId"] = task.taskId;
    request["startOffset"] = static_cast<Json::UInt64>(offset);

    auto reply = correlator_.sendAndAwait(makeJsonFrame(FrameType::Meta, request),
                                          {FrameType::Meta, FrameType::Ack, FrameType::FileResponse},
                                          std::chrono::milliseconds(options_.requestTimeoutMs));
    if (!reply) {
        return reply.error();
    }
    sink->handleControl(reply.value());

    ProgressReporter reporter(observer, options_.progressIntervalMs, offset);
    const auto idleLimit = std::chrono::milliseconds(options_.idleTimeoutMs);

    while (true) {
        if (cancelled.load()) {
            return Error{ErrorCode::Cancelled, "cancelled at " + std::to_string(offset + sink->received()),
                         "DownloadSession"};
        }
        if (auto error = sink->error()) {
            return *error;
        }
        if (sink->ended()) {
            break;
        }
        if (sink->idleFor() > idleLimit) {
            return Error{ErrorCode::Timeout, "no data for " + std::to_string(options_.idleTimeoutMs) + " ms",
                         "DownloadSession"};
        }

        if (auto total = sink->totalSize()) {
            task.totalSize = *total;
        }
        task.setTransferred(offset + sink->received());
        reporter.update(task.transferredBytes, task.totalSize);

        sink->waitSlice();
    }

    auto flushed = queue->flush(idleLimit);
    if (!flushed) {
        return flushed;
    }

    const uint64_t onDisk = offset + queue->writtenBytes();
    if (auto total = sink->totalSize()) {
        task.totalSize = *total;
        if (onDisk != *total) {
            return Error{ErrorCode::InvalidResponse, "received " + std::to_string(onDisk) + " of " +
                         std::to_string(*total) + " bytes before end frame", "DownloadSession"};
        }
    }

    task.setTransferred(onDisk);
    reporter.update(onDisk, task.totalSize, true);
    logger.log(LogLevel::INFO, "Download of " + task.fileName + " complete (" + std::to_string(onDisk) + " bytes)",
               "DownloadSession");
    return Ok();
}

} // namespace ChatStorage
