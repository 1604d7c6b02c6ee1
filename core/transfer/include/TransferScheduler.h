#pragma once

#include "Connection.h"
#include "IFileAccess.h"
#include "ITaskStore.h"
#include "Result.h"
#include "ThreadPool.h"
#include "TransferProgress.h"
#include "TransferTask.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace ChatStorage {

struct SchedulerOptions {
    std::string host{config::DEFAULT_SERVER_HOST};
    int uploadPort{config::DEFAULT_UPLOAD_PORT};
    int downloadPort{config::DEFAULT_DOWNLOAD_PORT};
    int maxConcurrent{config::MAX_CONCURRENT_TRANSFERS};
    /// Template for per-execution connections; heartbeat and auto-reconnect are forced off
    ConnectionOptions connection;
    TransferOptions transfer;
};

/**
 * @brief Owns every known transfer task and runs at most maxConcurrent of
 *        them at a time, in submission order.
 *
 * Each execution gets its own Connection to the upload or download port
 * and runs on the scheduler's ThreadPool. A paused task keeps its slot
 * until its execution has actually returned, so two executions of the same
 * task never overlap.
 *
 * Every status change is persisted through the ITaskStore; progress is
 * persisted at the sessions' throttled reporting interval.
 */
class TransferScheduler {
public:
    /// Status or progress change; speed is empty for pure status changes
    using TaskListener = std::function<void(const TransferTask& task, const std::string& speed)>;

    TransferScheduler(SchedulerOptions options, ITaskStore& store, IFileAccess& files);
    ~TransferScheduler();

    TransferScheduler(const TransferScheduler&) = delete;
    TransferScheduler& operator=(const TransferScheduler&) = delete;

    /// New task ids are persisted as waiting and queued; known ids are resumed
    VoidResult submit(TransferTask task);

    /// Stop a running task or dequeue a waiting one; it becomes paused
    VoidResult pause(const std::string& taskId);

    /// Queue a paused or failed task again
    VoidResult resume(const std::string& taskId);

    /// Pause, then forget the task and delete its persisted record
    VoidResult cancel(const std::string& taskId);

    std::vector<TransferTask> getAllTasks() const;
    std::optional<TransferTask> getTask(const std::string& taskId) const;

    /**
     * @brief Load every persisted task that is not completed, as paused.
     *
     * Nothing is resumed automatically. Tasks whose file reference no longer
     * resolves are skipped with a warning.
     * @return number of tasks restored
     */
    Result<std::size_t> restore();

    /// Drop completed tasks from memory and from the store
    VoidResult clearCompleted();

    void setTaskListener(TaskListener listener);

    std::size_t activeCount() const;
    std::size_t queuedCount() const;

    /// Wait until nothing is running or queued
    bool waitIdle(std::chrono::milliseconds timeout);

    /// Cancel running executions, drop the queue and join the workers
    void shutdown();

private:
    struct Entry {
        TransferTask task;
        std::shared_ptr<std::atomic<bool>> cancelFlag;
        bool running{false};
        bool requeue{false};
        bool forget{false};
    };

    class ProgressForwarder;

    void pump();
    void execute(const std::string& taskId, TransferTask task, std::shared_ptr<std::atomic<bool>> cancelFlag);
    void finish(const std::string& taskId, const TransferTask& result, const VoidResult& outcome,
                bool wasCancelled);
    void onExecutionProgress(const std::string& taskId, uint64_t transferred, uint64_t total,
                             const std::string& speed);

    void persist(const TransferTask& task);
    void notify(const TransferTask& task, const std::string& speed);

    SchedulerOptions options_;
    ITaskStore& store_;
    IFileAccess& files_;

    mutable std::mutex mutex_;
    std::condition_variable idleCv_;
    std::map<std::string, Entry> tasks_;
    std::deque<std::string> queue_;
    std::size_t active_{0};
    bool shuttingDown_{false};

    std::mutex listenerMutex_;
    TaskListener listener_;

    ThreadPool pool_;
};

} // namespace ChatStorage
