#include "sandbox/container_runner.hpp"

#include <boost/process.hpp>
#include <filesystem>
#include <iostream>
#include <sstream>
#include <unistd.h>

#include "utils/common.hpp"

namespace codebox::sandbox {
namespace bp = boost::process;
namespace {

std::string FormatCpus(double cpus) {
    std::ostringstream oss;
    oss << cpus;
    return oss.str();
}

}  // namespace

ContainerRunner::ContainerRunner(config::SandboxConfig config, const OutputCollector& collector)
    : config_(std::move(config))
    , collector_(collector) {}

std::string ContainerRunner::ContainerName(const execution::Workspace& workspace, Phase phase) {
    return "codebox-" + workspace.id + (phase == Phase::kCompile ? "-compile" : "-run");
}

std::string ContainerRunner::ContainerUser() const {
    if (!config_.user.empty()) {
        return config_.user;
    }
    const auto uid = ::geteuid();
    if (uid == 0) {
        return "nobody";
    }
    return std::to_string(uid) + ":" + std::to_string(::getegid());
}

std::vector<std::string> ContainerRunner::BuildInvocation(const execution::Workspace& workspace,
                                                          const execution::LanguageProfile& profile,
                                                          const std::vector<std::string>& command,
                                                          const std::string& container_name) const {
    const auto host_dir = std::filesystem::absolute(workspace.dir).string();
    std::vector<std::string> argv = {
        config_.runtime,
        "run",
        "--rm",
        "-i",
        "--name", container_name,
        "--network=none",
        "--memory=" + std::to_string(config_.memory_mb) + "m",
        "--cpus=" + FormatCpus(config_.cpus),
        "--pids-limit=" + std::to_string(config_.pids_limit),
        "--user=" + ContainerUser(),
        "--read-only",
        "--tmpfs=" + config_.tmpfs,
        "-v", host_dir + ":" + config_.container_workdir,
        "-w", config_.container_workdir,
        profile.image
    };
    argv.insert(argv.end(), command.begin(), command.end());
    return argv;
}

execution::ExecutionResult ContainerRunner::Compile(const execution::Workspace& workspace,
                                                    const execution::LanguageProfile& profile,
                                                    std::chrono::seconds timeout) {
    return Launch(workspace, profile, profile.compile_command, std::nullopt, timeout, Phase::kCompile);
}

execution::ExecutionResult ContainerRunner::Run(const execution::Workspace& workspace,
                                                const execution::LanguageProfile& profile,
                                                const std::optional<std::string>& stdin_text,
                                                std::chrono::seconds timeout) {
    return Launch(workspace, profile, profile.run_command, stdin_text, timeout, Phase::kRun);
}

execution::ExecutionResult ContainerRunner::Launch(const execution::Workspace& workspace,
                                                   const execution::LanguageProfile& profile,
                                                   const std::vector<std::string>& command,
                                                   const std::optional<std::string>& stdin_text,
                                                   std::chrono::seconds timeout,
                                                   Phase phase) {
    const auto name = ContainerName(workspace, phase);
    const auto argv = BuildInvocation(workspace, profile, command, name);
    std::cerr << "[sandbox] " << (phase == Phase::kCompile ? "compile" : "run")
              << " container=" << name << " image=" << profile.image
              << " cmd=" << utils::Join(command, " ") << std::endl;

    const auto outcome = collector_.Run(
        argv,
        stdin_text,
        std::chrono::duration_cast<std::chrono::milliseconds>(timeout),
        [this, name] { KillContainer(name); });

    if (outcome.timed_out) {
        std::cerr << "[sandbox] container=" << name << " killed after " << timeout.count() << "s" << std::endl;
    }
    return ResultClassifier::Classify(outcome, phase, config_.runtime);
}

// Killing the client does not stop the container, so the runtime is asked
// to kill it by name; --rm then removes it.
void ContainerRunner::KillContainer(const std::string& container_name) const {
    const auto runtime = bp::search_path(config_.runtime);
    if (runtime.empty()) {
        std::cerr << "[sandbox] cannot kill " << container_name << ": runtime not found" << std::endl;
        return;
    }
    std::error_code ec;
    bp::child killer(runtime, "kill", container_name, bp::std_out > bp::null, bp::std_err > bp::null, ec);
    if (ec) {
        std::cerr << "[sandbox] cannot kill " << container_name << ": " << ec.message() << std::endl;
        return;
    }
    if (!killer.wait_for(std::chrono::seconds(config_.kill_timeout_s), ec)) {
        killer.terminate(ec);
        std::cerr << "[sandbox] kill of " << container_name << " did not finish in time" << std::endl;
        return;
    }
    if (killer.exit_code() != 0) {
        std::cerr << "[sandbox] kill of " << container_name << " exited with "
                  << killer.exit_code() << std::endl;
    }
}

ContainerRuntimeProbe::ContainerRuntimeProbe(std::string runtime, std::chrono::seconds cache_ttl)
    : runtime_(std::move(runtime))
    , cache_ttl_(cache_ttl) {}

bool ContainerRuntimeProbe::IsRuntimeAvailable() {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto now = std::chrono::steady_clock::now();
    if (cached_ && now - checked_at_ < cache_ttl_) {
        return *cached_;
    }
    cached_ = Probe();
    checked_at_ = now;
    if (!*cached_) {
        std::cerr << "[sandbox] container runtime '" << runtime_ << "' is not available" << std::endl;
    }
    return *cached_;
}

bool ContainerRuntimeProbe::Probe() const {
    const auto runtime = bp::search_path(runtime_);
    if (runtime.empty()) {
        return false;
    }
    std::error_code ec;
    bp::child version(runtime, "--version", bp::std_out > bp::null, bp::std_err > bp::null, ec);
    if (ec) {
        return false;
    }
    if (!version.wait_for(std::chrono::seconds(5), ec)) {
        version.terminate(ec);
        return false;
    }
    return !ec && version.exit_code() == 0;
}

}  // namespace codebox::sandbox
