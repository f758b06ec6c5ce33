#include "worker_pool.hpp"
#include "fpanel/core/log.hpp"
#include <exception>

namespace fpanel {

WorkerPool::WorkerPool(size_t thread_count)
{
    if (thread_count == 0)
        thread_count = 1;

    workers_.reserve(thread_count);
    for (size_t i = 0; i < thread_count; ++i)
    {
        workers_.emplace_back(&WorkerPool::worker_loop, this);
    }
    LOG_DEBUG("Worker pool started with {} threads", thread_count);
}

WorkerPool::~WorkerPool()
{
    shutdown();
}

bool WorkerPool::submit(Job job)
{
    {
        std::lock_guard lock(mutex_);
        if (shutting_down_)
        {
            LOG_WARN("Worker pool is shutting down, job rejected");
            return false;
        }
        jobs_.push(std::move(job));
    }
    job_cv_.notify_one();
    return true;
}

void WorkerPool::shutdown()
{
    {
        std::lock_guard lock(mutex_);
        if (shutting_down_ && workers_.empty())
            return;
        shutting_down_ = true;
    }
    job_cv_.notify_all();

    for (auto& worker : workers_)
    {
        if (worker.joinable())
            worker.join();
    }
    workers_.clear();
    LOG_DEBUG("Worker pool stopped");
}

void WorkerPool::worker_loop()
{
    while (true)
    {
        Job job;
        {
            std::unique_lock lock(mutex_);
            job_cv_.wait(lock, [this] { return shutting_down_ || !jobs_.empty(); });

            // Drain the queue before exiting so accepted jobs always run
            if (jobs_.empty())
                break;

            job = std::move(jobs_.front());
            jobs_.pop();
        }

        try
        {
            job();
        }
        catch (std::exception const& e)
        {
            LOG_ERROR("Unhandled exception in worker job: {}", e.what());
        }
    }
}

} // namespace fpanel
