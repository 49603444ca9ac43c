#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace codebox::utils {

// Fixed number of threads draining a bounded task queue. TrySubmit refuses
// work once the queue holds max_pending tasks; the pool never grows.
class WorkerPool {
public:
    using Task = std::function<void()>;

    WorkerPool(std::size_t threads, std::size_t max_pending);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    bool TrySubmit(Task task);
    void Stop();

    std::size_t ThreadCount() const { return workers_.size(); }
    std::size_t Pending() const;

private:
    void WorkerLoop();

    std::size_t max_pending_;
    std::queue<Task> tasks_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::vector<std::thread> workers_;
    std::atomic<bool> running_{true};
};

}  // namespace codebox::utils
