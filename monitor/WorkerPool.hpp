#pragma once

#include <atomic>
#include <condition_variable>
#include <functional>
#include <future>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace lanwatch::monitor
{
    // Fixed set of threads draining one job queue.
    class WorkerPool
    {
    private:
        std::vector<std::thread> threads_;
        std::mutex queue_mutex_;
        std::condition_variable queue_cv_;
        std::queue<std::function<void()>> job_queue_;
        std::atomic<bool> running_;
        size_t thread_count_;

        void ProcessLoop();

    public:
        explicit WorkerPool(size_t thread_count);
        ~WorkerPool();

        WorkerPool(const WorkerPool &) = delete;
        WorkerPool &operator=(const WorkerPool &) = delete;

        void Start();
        // Finishes queued jobs, then joins.
        void Stop();

        size_t ThreadCount() const { return thread_count_; }

        // The future carries any exception the job threw. Throws std::runtime_error when stopped.
        std::future<void> Submit(std::function<void()> job);
    };
}
