#include "WorkerPool.hpp"

#include <iostream>
#include <memory>
#include <stdexcept>

namespace lanwatch::monitor
{
    WorkerPool::WorkerPool(size_t thread_count)
        : running_(false), thread_count_(thread_count == 0 ? 1 : thread_count)
    {
    }

    WorkerPool::~WorkerPool()
    {
        Stop();
    }

    void WorkerPool::Start()
    {
        if (running_)
            return;

        running_ = true;
        for (size_t i = 0; i < thread_count_; ++i)
            threads_.emplace_back(&WorkerPool::ProcessLoop, this);
    }

    void WorkerPool::Stop()
    {
        if (!running_)
            return;

        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            running_ = false;
        }
        queue_cv_.notify_all();

        for (auto &t : threads_)
        {
            if (t.joinable())
                t.join();
        }
        threads_.clear();
    }

    std::future<void> WorkerPool::Submit(std::function<void()> job)
    {
        auto task = std::make_shared<std::packaged_task<void()>>(std::move(job));
        std::future<void> result = task->get_future();

        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            if (!running_)
                throw std::runtime_error("worker pool is not running");
            job_queue_.push([task]()
                            { (*task)(); });
        }
        queue_cv_.notify_one();
        return result;
    }

    void WorkerPool::ProcessLoop()
    {
        while (true)
        {
            std::function<void()> current_job;

            {
                std::unique_lock<std::mutex> lock(queue_mutex_);

                queue_cv_.wait(lock, [this]
                               { return !job_queue_.empty() || !running_; });

                if (!running_ && job_queue_.empty())
                    break;

                current_job = std::move(job_queue_.front());
                job_queue_.pop();
            }

            try
            {
                current_job();
            }
            catch (const std::exception &e)
            {
                std::cerr << "[Worker] Job failed: " << e.what() << "\n";
            }
        }
    }
}
