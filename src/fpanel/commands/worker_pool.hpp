#pragma once

#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace fpanel {

/**
 * @brief Fixed set of threads running queued jobs in FIFO order.
 *
 * shutdown() (also run by the destructor) lets queued jobs finish, then joins
 * every worker. Jobs submitted after shutdown are rejected.
 */
class WorkerPool
{
public:
    using Job = std::function<void()>;

    explicit WorkerPool(size_t thread_count);
    ~WorkerPool();

    WorkerPool(WorkerPool const&) = delete;
    WorkerPool& operator=(WorkerPool const&) = delete;

    /// Returns false when the pool is shutting down and the job was dropped.
    bool submit(Job job);
    void shutdown();
    size_t size() const { return workers_.size(); }

private:
    std::vector<std::thread> workers_;
    std::queue<Job> jobs_;
    std::mutex mutex_;
    std::condition_variable job_cv_;
    bool shutting_down_ = false;

    void worker_loop();
};

} // namespace fpanel
