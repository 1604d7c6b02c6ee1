#include "TransferScheduler.h"
#include "Correlator.h"
#include "DownloadSession.h"
#include "Logger.h"
#include "MetricsCollector.h"
#include "UploadSession.h"

#include <algorithm>

namespace ChatStorage {

class TransferScheduler::ProgressForwarder : public TransferObserver {
public:
    ProgressForwarder(TransferScheduler& scheduler, std::string taskId)
        : scheduler_(scheduler), taskId_(std::move(taskId)) {}

    void onProgress(uint64_t transferredBytes, uint64_t totalBytes, const std::string& speed) override {
        scheduler_.onExecutionProgress(taskId_, transferredBytes, totalBytes, speed);
    }

private:
    TransferScheduler& scheduler_;
    std::string taskId_;
};

TransferScheduler::TransferScheduler(SchedulerOptions options, ITaskStore& store, IFileAccess& files)
    : options_(std::move(options)),
      store_(store),
      files_(files),
      pool_(static_cast<std::size_t>(std::max(1, options_.maxConcurrent))) {
    if (options_.maxConcurrent < 1) {
        options_.maxConcurrent = 1;
    }
}

TransferScheduler::~TransferScheduler() {
    shutdown();
}

void TransferScheduler::setTaskListener(TaskListener listener) {
    std::lock_guard<std::mutex> lock(listenerMutex_);
    listener_ = std::move(listener);
}

void TransferScheduler::notify(const TransferTask& task, const std::string& speed) {
    TaskListener listener;
    {
        std::lock_guard<std::mutex> lock(listenerMutex_);
        listener = listener_;
    }
    if (listener) {
        listener(task, speed);
    }
}

void TransferScheduler::persist(const TransferTask& task) {
    auto saved = store_.save(task);
    if (!saved) {
        Logger::instance().log(LogLevel::ERROR, "Failed to persist task " + task.taskId + ": " +
                               saved.error().toString(), "TransferScheduler");
    }
}

VoidResult TransferScheduler::submit(TransferTask task) {
    if (task.taskId.empty()) {
        return Error{ErrorCode::InvalidArgument, "task without id", "TransferScheduler"};
    }
    bool known = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (shuttingDown_) {
            return Error{ErrorCode::InvalidArgument, "scheduler is shut down", "TransferScheduler"};
        }
        if (tasks_.count(task.taskId) > 0) {
            known = true;
        }
    }
    if (known) {
        return resume(task.taskId);
    }

    if (task.fileReference.empty()) {
        task.fileReference = files_.makeReference(task.localPath);
    }
    task.status = TransferStatus::Waiting;
    task.errorMessage.clear();
    auto saved = store_.save(task);
    if (!saved) {
        return saved;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        Entry entry;
        entry.task = task;
        if (!tasks_.emplace(task.taskId, std::move(entry)).second) {
            return Ok();
        }
        queue_.push_back(task.taskId);
    }

    Logger::instance().log(LogLevel::INFO, "Queued " + std::string(transferDirectionName(task.direction)) + " " +
                           task.fileName + " (" + task.taskId + ")", "TransferScheduler");
    notify(task, "");
    pump();
    return Ok();
}

VoidResult TransferScheduler::pause(const std::string& taskId) {
    TransferTask snapshot;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = tasks_.find(taskId);
        if (it == tasks_.end()) {
            return Error{ErrorCode::InvalidArgument, "unknown task " + taskId, "TransferScheduler"};
        }
        Entry& entry = it->second;
        if (entry.running) {
            entry.cancelFlag->store(true);
            entry.requeue = false;
        } else if (entry.task.status == TransferStatus::Waiting) {
            queue_.erase(std::remove(queue_.begin(), queue_.end(), taskId), queue_.end());
        } else {
            return Ok();
        }
        entry.task.status = TransferStatus::Paused;
        snapshot = entry.task;
    }

    Logger::instance().log(LogLevel::INFO, "Paused " + snapshot.fileName + " (" + taskId + ")", "TransferScheduler");
    auto updated = store_.updateStatus(taskId, TransferStatus::Paused);
    if (!updated) {
        Logger::instance().log(LogLevel::ERROR, updated.error().toString(), "TransferScheduler");
    }
    notify(snapshot, "");
    idleCv_.notify_all();
    return Ok();
}

VoidResult TransferScheduler::resume(const std::string& taskId) {
    TransferTask snapshot;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (shuttingDown_) {
            return Error{ErrorCode::InvalidArgument, "scheduler is shut down", "TransferScheduler"};
        }
        auto it = tasks_.find(taskId);
        if (it == tasks_.end()) {
            return Error{ErrorCode::InvalidArgument, "unknown task " + taskId, "TransferScheduler"};
        }
        Entry& entry = it->second;
        if (entry.task.status == TransferStatus::Completed || entry.task.status == TransferStatus::Waiting ||
            entry.task.status == TransferStatus::Active) {
            return Ok();
        }

        entry.task.status = TransferStatus::Waiting;
        entry.task.errorMessage.clear();
        if (entry.running) {
            // Still stopping; finish() queues it again
            entry.requeue = true;
        } else {
            queue_.push_back(taskId);
        }
        snapshot = entry.task;
    }

    Logger::instance().log(LogLevel::INFO, "Resumed " + snapshot.fileName + " (" + taskId + ")", "TransferScheduler");
    auto updated = store_.updateStatus(taskId, TransferStatus::Waiting);
    if (!updated) {
        Logger::instance().log(LogLevel::ERROR, updated.error().toString(), "TransferScheduler");
    }
    notify(snapshot, "");
    pump();
    return Ok();
}

VoidResult TransferScheduler::cancel(const std::string& taskId) {
    TransferTask snapshot;
    bool running = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = tasks_.find(taskId);
        if (it == tasks_.end()) {
            return Error{ErrorCode::InvalidArgument, "unknown task " + taskId, "TransferScheduler"};
        }
        Entry& entry = it->second;
        running = entry.running;
        if (running) {
            entry.cancelFlag->store(true);
            entry.forget = true;
            entry.requeue = false;
            entry.task.status = TransferStatus::Paused;
            snapshot = entry.task;
        } else {
            queue_.erase(std::remove(queue_.begin(), queue_.end(), taskId), queue_.end());
            snapshot = entry.task;
            tasks_.erase(it);
        }
    }

    Logger::instance().log(LogLevel::INFO, "Cancelled " + snapshot.fileName + " (" + taskId + ")",
                           "TransferScheduler");
    if (!running) {
        auto removed = store_.remove(taskId);
        if (!removed) {
            return removed;
        }
        idleCv_.notify_all();
    }
    // A running task's record is deleted once its execution has stopped
    notify(snapshot, "");
    return Ok();
}

std::vector<TransferTask> TransferScheduler::getAllTasks() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<TransferTask> all;
    all.reserve(tasks_.size());
    for (const auto& [id, entry] : tasks_) {
        all.push_back(entry.task);
    }
    std::sort(all.begin(), all.end(), [](const TransferTask& a, const TransferTask& b) {
        return a.createdAt < b.createdAt;
    });
    return all;
}

std::optional<TransferTask> TransferScheduler::getTask(const std::string& taskId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tasks_.find(taskId);
    if (it == tasks_.end()) {
        return std::nullopt;
    }
    return it->second.task;
}

Result<std::size_t> TransferScheduler::restore() {
    auto& logger = Logger::instance();
    auto pending = store_.fetchPending();
    if (!pending) {
        return pending.error();
    }

    std::size_t restored = 0;
    for (TransferTask& task : pending.value()) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (tasks_.count(task.taskId)) {
                continue;
            }
        }

        auto resolved = files_.resolveReference(task.fileReference);
        if (!resolved) {
            logger.log(LogLevel::WARN, "Skipping task " + task.taskId + ": " + resolved.error().message,
                       "TransferScheduler");
            continue;
        }
        task.localPath = resolved.value();

        if (task.direction == TransferDirection::Upload) {
            if (!files_.exists(task.localPath)) {
                logger.log(LogLevel::WARN, "Skipping upload " + task.taskId + ": " + task.localPath + " is gone",
                           "TransferScheduler");
                continue;
            }
        } else {
            uint64_t onDisk = 0;
            if (files_.exists(task.localPath)) {
                auto size = files_.size(task.localPath);
                if (size) {
                    onDisk = size.value();
                }
            }
            task.setTransferred(onDisk);
        }

        task.status = TransferStatus::Paused;
        persist(task);

        {
            std::lock_guard<std::mutex> lock(mutex_);
            Entry entry;
            entry.task = task;
            tasks_.emplace(task.taskId, std::move(entry));
        }
        notify(task, "");
        ++restored;
    }

    logger.log(LogLevel::INFO, "Restored " + std::to_string(restored) + " unfinished transfer(s) as paused",
               "TransferScheduler");
    return restored;
}

VoidResult TransferScheduler::clearCompleted() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto it = tasks_.begin(); it != tasks_.end();) {
            if (it->second.task.status == TransferStatus::Completed && !it->second.running) {
                it = tasks_.erase(it);
            } else {
                ++it;
            }
        }
    }
    return store_.removeCompleted();
}

std::size_t TransferScheduler::activeCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return active_;
}

std::size_t TransferScheduler::queuedCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

bool TransferScheduler::waitIdle(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    return idleCv_.wait_for(lock, timeout, [this]() { return active_ == 0 && queue_.empty(); });
}

void TransferScheduler::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (shuttingDown_) {
            return;
        }
        shuttingDown_ = true;
        queue_.clear();
        for (auto& [id, entry] : tasks_) {
            if (entry.running) {
                entry.cancelFlag->store(true);
                entry.requeue = false;
            }
        }
    }
    pool_.shutdown();
    idleCv_.notify_all();
}

void TransferScheduler::pump() {
    std::vector<std::pair<TransferTask, std::shared_ptr<std::atomic<bool>>>> starts;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (shuttingDown_) {
            return;
        }
        while (active_ < static_cast<std::size_t>(options_.maxConcurrent) && !queue_.empty()) {
            std::string id = queue_.front();
            queue_.pop_front();

            auto it = tasks_.find(id);
            if (it == tasks_.end() || it->second.running || it->second.task.status != TransferStatus::Waiting) {
                continue;
            }
            Entry& entry = it->second;
            entry.running = true;
            entry.requeue = false;
            entry.cancelFlag = std::make_shared<std::atomic<bool>>(false);
            entry.task.status = TransferStatus::Active;
            ++active_;
            starts.emplace_back(entry.task, entry.cancelFlag);
        }
    }

    for (auto& start : starts) {
        const TransferTask& task = start.first;
        auto updated = store_.updateStatus(task.taskId, TransferStatus::Active);
        if (!updated) {
            Logger::instance().log(LogLevel::ERROR, updated.error().toString(), "TransferScheduler");
        }
        notify(task, "");

        auto flag = start.second;
        pool_.enqueue([this, task, flag]() {
            execute(task.taskId, task, flag);
        });
    }
}

void TransferScheduler::execute(const std::string& taskId, TransferTask task,
                                std::shared_ptr<std::atomic<bool>> cancelFlag) {
    const bool upload = task.direction == TransferDirection::Upload;

    ConnectionOptions connectionOptions = options_.connection;
    connectionOptions.name = std::string(transferDirectionName(task.direction)) + ":" + taskId.substr(0, 8);
    connectionOptions.heartbeatIntervalMs = 0;
    connectionOptions.maxReconnectAttempts = 0;

    Connection connection(connectionOptions);
    VoidResult outcome;
    {
        Correlator correlator(connection);
        auto connected = connection.connect(options_.host, upload ? options_.uploadPort : options_.downloadPort);
        if (!connected) {
            outcome = connected;
        } else {
            ProgressForwarder forwarder(*this, taskId);
            if (upload) {
                UploadSession session(correlator, files_, options_.transfer);
                outcome = session.run(task, *cancelFlag, &forwarder);
            } else {
                DownloadSession session(correlator, files_, options_.transfer);
                outcome = session.run(task, *cancelFlag, &forwarder);
            }
        }
        // Joins the receive thread before the Correlator goes away
        connection.disconnect();
    }

    finish(taskId, task, outcome, cancelFlag->load());
}

void TransferScheduler::onExecutionProgress(const std::string& taskId, uint64_t transferred, uint64_t total,
                                            const std::string& speed) {
    TransferTask snapshot;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = tasks_.find(taskId);
        if (it == tasks_.end()) {
            return;
        }
        it->second.task.totalSize = total;
        it->second.task.setTransferred(transferred);
        snapshot = it->second.task;
    }

    auto updated = store_.updateProgress(taskId, snapshot.transferredBytes, snapshot.progress);
    if (!updated) {
        Logger::instance().log(LogLevel::WARN, updated.error().toString(), "TransferScheduler");
    }
    notify(snapshot, speed);
}

void TransferScheduler::finish(const std::string& taskId, const TransferTask& result, const VoidResult& outcome,
                               bool wasCancelled) {
    auto& logger = Logger::instance();
    auto& metrics = MetricsCollector::instance();

    TransferTask snapshot;
    bool forget = false;
    bool found = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        --active_;
        auto it = tasks_.find(taskId);
        if (it != tasks_.end()) {
            found = true;
            Entry& entry = it->second;
            entry.running = false;
            entry.task.totalSize = result.totalSize;
            entry.task.setTransferred(result.transferredBytes);
            if (!result.fingerprint.empty()) {
                entry.task.fingerprint = result.fingerprint;
            }

            if (entry.forget) {
                forget = true;
                snapshot = entry.task;
                tasks_.erase(it);
            } else {
                if (outcome.ok()) {
                    entry.task.status = TransferStatus::Completed;
                    entry.task.setTransferred(entry.task.totalSize);
                    entry.task.progress = 1.0;
                    entry.task.errorMessage.clear();
                } else if (wasCancelled || outcome.error().code == ErrorCode::Cancelled) {
                    entry.task.status = TransferStatus::Paused;
                } else {
                    entry.task.status = TransferStatus::Failed;
                    entry.task.errorMessage = outcome.error().toString();
                }

                if (entry.requeue && entry.task.status != TransferStatus::Completed && !shuttingDown_) {
                    entry.task.status = TransferStatus::Waiting;
                    queue_.push_back(taskId);
                }
                entry.requeue = false;
                snapshot = entry.task;
            }
        }
    }
    idleCv_.notify_all();

    if (!found) {
        pump();
        return;
    }

    if (forget) {
        auto removed = store_.remove(taskId);
        if (!removed) {
            logger.log(LogLevel::ERROR, removed.error().toString(), "TransferScheduler");
        }
        logger.log(LogLevel::INFO, "Forgot cancelled task " + taskId, "TransferScheduler");
    } else {
        persist(snapshot);
        switch (snapshot.status) {
            case TransferStatus::Completed:
                metrics.incrementTransfersCompleted();
                logger.log(LogLevel::INFO, "Completed " + snapshot.fileName + " (" + taskId + ")",
                           "TransferScheduler");
                break;
            case TransferStatus::Failed:
                metrics.incrementTransfersFailed();
                logger.log(LogLevel::ERROR, "Failed " + snapshot.fileName + " (" + taskId + "): " +
                           snapshot.errorMessage, "TransferScheduler");
                break;
            default:
                metrics.incrementTransfersPaused();
                logger.log(LogLevel::INFO, "Stopped " + snapshot.fileName + " at " +
                           std::to_string(snapshot.transferredBytes) + " bytes", "TransferScheduler");
                break;
        }
        notify(snapshot, "");
    }

    pump();
}

} // namespace ChatStorage
