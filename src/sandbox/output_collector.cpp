#include "sandbox/output_collector.hpp"

#include <boost/process.hpp>
#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <future>
#include <iostream>
#include <memory>
#include <mutex>
#include <thread>
#include <sys/wait.h>
#include <unistd.h>

#include "execution/execution_types.hpp"

namespace codebox::sandbox {
namespace bp = boost::process;
namespace {

struct DrainState {
    explicit DrainState(bp::pipe&& source) : pipe(std::move(source)) {}

    bp::pipe pipe;
    std::mutex mutex;
    std::string text;
    bool truncated = false;
    std::promise<void> done;

    void Append(const char* data, std::size_t size, std::size_t limit) {
        std::lock_guard<std::mutex> lock(mutex);
        const std::size_t avail = text.size() < limit ? limit - text.size() : 0;
        const std::size_t take = std::min(size, avail);
        text.append(data, take);
        if (take < size) {
            truncated = true;
        }
    }

    // Line-delimited view: every line, the last one included, ends in '\n'.
    std::string Snapshot() {
        std::lock_guard<std::mutex> lock(mutex);
        std::string result = text;
        if (!result.empty() && result.back() != '\n') {
            result.push_back('\n');
        }
        if (truncated) {
            result += OutputCollector::kTruncatedMarker;
        }
        return result;
    }
};

void Drain(DrainState& state, std::size_t limit) {
    char chunk[4096];
    try {
        while (true) {
            const auto n = state.pipe.read(chunk, static_cast<int>(sizeof(chunk)));
            if (n <= 0) {
                break;
            }
            state.Append(chunk, static_cast<std::size_t>(n), limit);
        }
    } catch (const std::system_error& ex) {
        std::cerr << "[collector] pipe read failed: " << ex.what() << std::endl;
    }
    state.done.set_value();
}

void IgnoreSigpipe() {
    static std::once_flag once;
    std::call_once(once, [] { std::signal(SIGPIPE, SIG_IGN); });
}

int DecodeStatus(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return -1;
}

// Close-on-exec so a concurrently spawned child cannot inherit another
// request's pipe ends and keep them open.
bp::pipe MakePipe() {
    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) != 0) {
        throw execution::SystemError(std::string("cannot create pipe: ") + std::strerror(errno));
    }
    return bp::pipe(fds[0], fds[1]);
}

using ExecutablePath = decltype(bp::search_path(std::string()));

ExecutablePath ResolveExecutable(const std::string& name) {
    if (name.find('/') != std::string::npos) {
        return ExecutablePath(name);
    }
    return bp::search_path(name);
}

}  // namespace

OutputCollector::OutputCollector(utils::WorkerPool& pool, CollectorOptions options)
    : pool_(pool)
    , options_(options) {
    IgnoreSigpipe();
}

ProcessOutcome OutputCollector::Run(const std::vector<std::string>& argv,
                                    const std::optional<std::string>& stdin_text,
                                    std::chrono::milliseconds timeout,
                                    const std::function<void()>& on_timeout) const {
    if (argv.empty()) {
        throw execution::SystemError("empty command line");
    }
    const auto executable = ResolveExecutable(argv.front());
    if (executable.empty()) {
        throw execution::SystemError("executable not found: " + argv.front());
    }
    const std::vector<std::string> args(argv.begin() + 1, argv.end());

    ProcessOutcome outcome{};
    const auto started = std::chrono::steady_clock::now();

    bp::pipe stdin_pipe = MakePipe();
    bp::pipe stdout_pipe = MakePipe();
    bp::pipe stderr_pipe = MakePipe();
    bp::group group;
    bp::child child_process;
    try {
        child_process = bp::child(
            executable,
            bp::args(args),
            bp::std_in < stdin_pipe,
            bp::std_out > stdout_pipe,
            bp::std_err > stderr_pipe,
            group);
    } catch (const bp::process_error& ex) {
        throw execution::SystemError(std::string("failed to start ") + argv.front() + ": " + ex.what());
    }
    const pid_t pid = child_process.id();

    auto out_state = std::make_shared<DrainState>(std::move(stdout_pipe));
    auto err_state = std::make_shared<DrainState>(std::move(stderr_pipe));
    auto out_done = out_state->done.get_future();
    auto err_done = err_state->done.get_future();
    const auto limit = options_.max_output_bytes;
    const bool scheduled =
        pool_.TrySubmit([out_state, limit] { Drain(*out_state, limit); }) &&
        pool_.TrySubmit([err_state, limit] { Drain(*err_state, limit); });
    if (!scheduled) {
        // One drain may already be queued; killing the child closes both
        // pipes so it finishes on its own.
        std::error_code ec;
        group.terminate(ec);
        int status = 0;
        ::waitpid(pid, &status, 0);
        throw execution::SystemError("output drain pool is saturated");
    }

    // stdin is expected to be small (the engine caps it); it is written in
    // full and then closed so the child sees EOF instead of blocking.
    if (stdin_text && !stdin_text->empty()) {
        try {
            const char* data = stdin_text->data();
            std::size_t remaining = stdin_text->size();
            while (remaining > 0) {
                const auto written = stdin_pipe.write(data, static_cast<int>(remaining));
                if (written <= 0) {
                    break;
                }
                data += written;
                remaining -= static_cast<std::size_t>(written);
            }
        } catch (const std::system_error& ex) {
            std::cerr << "[collector] stdin not fully delivered: " << ex.what() << std::endl;
        }
    }
    stdin_pipe.close();

    const auto deadline = started + timeout;
    int status = 0;
    bool finished = false;
    bool wait_failed = false;
    while (std::chrono::steady_clock::now() < deadline) {
        const auto waited = ::waitpid(pid, &status, WNOHANG);
        if (waited == pid) {
            finished = true;
            break;
        }
        if (waited < 0) {
            if (errno == EINTR) {
                continue;
            }
            std::cerr << "[collector] waitpid failed for pid " << pid << ": "
                      << std::strerror(errno) << std::endl;
            wait_failed = true;
            break;
        }
        std::this_thread::sleep_for(options_.poll_interval);
    }

    // Killing the whole group also takes out descendants that would keep
    // the pipes open after the direct child is gone.
    std::error_code kill_ec;
    if (finished) {
        outcome.exit_code = DecodeStatus(status);
        group.terminate(kill_ec);
    } else if (wait_failed) {
        group.terminate(kill_ec);
    } else {
        outcome.timed_out = true;
        group.terminate(kill_ec);
        if (::waitpid(pid, &status, 0) == pid) {
            outcome.exit_code = DecodeStatus(status);
        }
        if (on_timeout) {
            on_timeout();
        }
    }
    if (kill_ec && kill_ec.value() != ESRCH) {
        std::cerr << "[collector] failed to kill process group " << pid << ": "
                  << kill_ec.message() << std::endl;
    }

    const auto join_deadline = std::chrono::steady_clock::now() + options_.drain_join_timeout;
    if (out_done.wait_until(join_deadline) != std::future_status::ready) {
        std::cerr << "[collector] stdout drain did not finish in time" << std::endl;
    }
    if (err_done.wait_until(join_deadline) != std::future_status::ready) {
        std::cerr << "[collector] stderr drain did not finish in time" << std::endl;
    }
    outcome.stdout_text = out_state->Snapshot();
    outcome.stderr_text = err_state->Snapshot();
    outcome.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    return outcome;
}

}  // namespace codebox::sandbox
