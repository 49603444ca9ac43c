#pragma once

#include <atomic>
#include <cstddef>
#include <functional>
#include <list>
#include <memory>
#include <thread>

namespace codebox::utils {

// One thread per task with a cap on how many are alive at once. Finished
// threads are joined on the next TryLaunch or Size call. Owned and driven by
// a single thread.
class ThreadGroup {
public:
    using Task = std::function<void()>;

    explicit ThreadGroup(std::size_t max_threads);
    ~ThreadGroup();

    ThreadGroup(const ThreadGroup&) = delete;
    ThreadGroup& operator=(const ThreadGroup&) = delete;

    // False when max_threads are still running; the task is not started.
    bool TryLaunch(Task task);
    void JoinAll();

    std::size_t Size();

private:
    struct Entry {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };

    void ReapFinished();

    std::size_t max_threads_;
    std::list<Entry> threads_;
};

}  // namespace codebox::utils
