#include "utils/thread_group.hpp"

#include <exception>
#include <iostream>

namespace codebox::utils {

ThreadGroup::ThreadGroup(std::size_t max_threads)
    : max_threads_(max_threads == 0 ? 1 : max_threads) {}

ThreadGroup::~ThreadGroup() {
    JoinAll();
}

bool ThreadGroup::TryLaunch(Task task) {
    ReapFinished();
    if (threads_.size() >= max_threads_) {
        return false;
    }
    auto done = std::make_shared<std::atomic<bool>>(false);
    std::thread thread([task = std::move(task), done] {
        try {
            task();
        } catch (const std::exception& ex) {
            std::cerr << "[threads] task failed: " << ex.what() << std::endl;
        }
        done->store(true);
    });
    threads_.push_back(Entry{std::move(thread), std::move(done)});
    return true;
}

void ThreadGroup::JoinAll() {
    for (auto& entry : threads_) {
        if (entry.thread.joinable()) {
            entry.thread.join();
        }
    }
    threads_.clear();
}

std::size_t ThreadGroup::Size() {
    ReapFinished();
    return threads_.size();
}

void ThreadGroup::ReapFinished() {
    for (auto it = threads_.begin(); it != threads_.end();) {
        if (it->done->load()) {
            if (it->thread.joinable()) {
                it->thread.join();
            }
            it = threads_.erase(it);
        } else {
            ++it;
        }
    }
}

}  // namespace codebox::utils
