#include "ThreadPool.h"
#include "Logger.h"

namespace ChatStorage {

    ThreadPool::ThreadPool(std::size_t threadCount) {
        const std::size_t count = threadCount == 0 ? 1 : threadCount;
        workers_.reserve(count);
        for (std::size_t i = 0; i < count; ++i) {
            workers_.emplace_back(&ThreadPool::runWorker, this);
        }
    }

    ThreadPool::~ThreadPool() {
        shutdown();
    }

    void ThreadPool::shutdown() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_) {
                return;
            }
            closed_ = true;
        }
        wake_.notify_all();
        for (auto& worker : workers_) {
            worker.join();
        }
    }

    void ThreadPool::submit(std::packaged_task<void()> task) {
        std::unique_lock<std::mutex> lock(mutex_);
        if (closed_) {
            lock.unlock();
            // Destroying the unrun task breaks its promise
            Logger::instance().log(LogLevel::WARN, "Job dropped: pool is shut down", "ThreadPool");
            return;
        }
        jobs_.push_back(std::move(task));
        lock.unlock();
        wake_.notify_one();
    }

    void ThreadPool::runWorker() {
        std::unique_lock<std::mutex> lock(mutex_);
        while (true) {
            wake_.wait(lock, [this]() { return closed_ || !jobs_.empty(); });
            if (jobs_.empty()) {
                return;
            }
            std::packaged_task<void()> job = std::move(jobs_.front());
            jobs_.pop_front();

            lock.unlock();
            job();
            lock.lock();
        }
    }

} // namespace ChatStorage
