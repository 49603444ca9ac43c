#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "utils/worker_pool.hpp"

namespace codebox::sandbox {

struct ProcessOutcome {
    int exit_code = -1;
    bool timed_out = false;
    std::string stdout_text;
    std::string stderr_text;
    std::chrono::milliseconds elapsed{0};
};

struct CollectorOptions {
    std::chrono::milliseconds drain_join_timeout{1000};
    std::size_t max_output_bytes = 1024 * 1024;
    std::chrono::milliseconds poll_interval{20};
};

// Launches a child, feeds and closes its stdin, and drains stdout and
// stderr on two pool tasks while the calling thread waits for exit against
// the deadline. On expiry the child is SIGKILLed, then on_timeout runs.
class OutputCollector {
public:
    OutputCollector(utils::WorkerPool& pool, CollectorOptions options = {});

    // Throws execution::SystemError when the child cannot be started or the
    // drain tasks cannot be scheduled.
    ProcessOutcome Run(const std::vector<std::string>& argv,
                       const std::optional<std::string>& stdin_text,
                       std::chrono::milliseconds timeout,
                       const std::function<void()>& on_timeout = {}) const;

    static constexpr const char* kTruncatedMarker = "[output truncated]\n";

private:
    utils::WorkerPool& pool_;
    CollectorOptions options_;
};

}  // namespace codebox::sandbox
