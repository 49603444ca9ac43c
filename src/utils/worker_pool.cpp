#include "utils/worker_pool.hpp"

#include <exception>
#include <iostream>

namespace codebox::utils {

WorkerPool::WorkerPool(std::size_t threads, std::size_t max_pending)
    : max_pending_(max_pending) {
    if (threads == 0) {
        threads = 1;
    }
    workers_.reserve(threads);
    for (std::size_t i = 0; i < threads; ++i) {
        workers_.emplace_back([this] { WorkerLoop(); });
    }
}

WorkerPool::~WorkerPool() {
    Stop();
}

bool WorkerPool::TrySubmit(Task task) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_ || tasks_.size() >= max_pending_) {
            return false;
        }
        tasks_.push(std::move(task));
    }
    cv_.notify_one();
    return true;
}

std::size_t WorkerPool::Pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tasks_.size();
}

void WorkerPool::Stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_) {
            return;
        }
        running_ = false;
    }
    cv_.notify_all();
    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

void WorkerPool::WorkerLoop() {
    while (true) {
        Task task;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this] { return !running_ || !tasks_.empty(); });
            if (tasks_.empty()) {
                return;
            }
            task = std::move(tasks_.front());
            tasks_.pop();
        }
        try {
            task();
        } catch (const std::exception& ex) {
            std::cerr << "[pool] task failed: " << ex.what() << std::endl;
        }
    }
}

}  // namespace codebox::utils
