#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <future>
#include <mutex>
#include <thread>
#include <vector>

namespace ChatStorage {

    /**
     * @brief Fixed set of workers draining a FIFO of jobs.
     *
     * TransferScheduler runs each transfer execution as one job, so the
     * worker count is the transfer concurrency limit.
     */
    class ThreadPool {
    public:
        /// threadCount of 0 is treated as 1
        explicit ThreadPool(std::size_t threadCount);
        ~ThreadPool();

        ThreadPool(const ThreadPool&) = delete;
        ThreadPool& operator=(const ThreadPool&) = delete;

        /**
         * @brief Queue a job behind the ones already waiting.
         * @return future that becomes ready when the job finishes and carries
         *         its exception. After shutdown() the job is dropped and the
         *         future reports std::future_errc::broken_promise.
         */
        template<typename F>
        std::future<void> enqueue(F&& job) {
            std::packaged_task<void()> task(std::forward<F>(job));
            std::future<void> done = task.get_future();
            submit(std::move(task));
            return done;
        }

        /// Stop intake, run what is already queued, join the workers. Idempotent.
        void shutdown();

        std::size_t size() const { return workers_.size(); }

    private:
        void submit(std::packaged_task<void()> task);
        void runWorker();

        std::vector<std::thread> workers_;
        std::deque<std::packaged_task<void()>> jobs_;
        std::mutex mutex_;
        std::condition_variable wake_;
        bool closed_{false};
    };

} // namespace ChatStorage
