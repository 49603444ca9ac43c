#include "engine/execution_engine.hpp"

#include <algorithm>
#include <cstdint>
#include <exception>
#include <iostream>

#include "utils/common.hpp"

namespace codebox::engine {

using execution::ExecutionRequest;
using execution::ExecutionResult;

namespace {

constexpr std::size_t kAuditErrorChars = 200;

}  // namespace

ExecutionEngine::ExecutionEngine(config::ExecutionConfig config,
                                 const execution::LanguageProfileRegistry& registry,
                                 const execution::SecurityValidator& validator,
                                 const execution::WorkspaceManager& workspaces,
                                 sandbox::SandboxRunner& runner,
                                 sandbox::RuntimeProbe& probe,
                                 execution::AuditSink& audit)
    : config_(std::move(config))
    , registry_(registry)
    , validator_(validator)
    , workspaces_(workspaces)
    , runner_(runner)
    , probe_(probe)
    , audit_(audit) {}

ExecutionEngine::Slot::~Slot() {
    engine_.ReleaseSlot();
}

std::optional<std::string> ExecutionEngine::Validate(const ExecutionRequest& request) const {
    if (auto violation = validator_.Validate(request.source_code)) {
        return violation;
    }
    if (request.stdin_text && utils::Utf8Length(*request.stdin_text) > config_.max_stdin_length) {
        return std::string("Input exceeds maximum length limit");
    }
    return std::nullopt;
}

int ExecutionEngine::ResolveTimeout(const std::optional<int>& requested) const {
    if (!requested || *requested <= 0) {
        return config_.default_timeout_s;
    }
    return std::min(*requested, config_.max_timeout_s);
}

ExecutionResult ExecutionEngine::Execute(const ExecutionRequest& request) {
    const auto started = std::chrono::steady_clock::now();
    ExecutionResult result{};

    if (!config_.enabled) {
        result = ExecutionResult::SystemFailure("Code execution is disabled");
    } else if (auto violation = Validate(request)) {
        std::cerr << "[engine] rejected " << execution::ToString(request.language)
                  << " submission: " << *violation << std::endl;
        result = ExecutionResult::SecurityViolation(*violation);
    } else {
        try {
            result = ExecuteAdmitted(request, ResolveTimeout(request.timeout_seconds));
        } catch (const std::exception& ex) {
            std::cerr << "[engine] execution failed: " << ex.what() << std::endl;
            result = ExecutionResult::SystemFailure(ex.what());
        }
    }

    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started).count();
    result.execution_time_ms = std::max<std::int64_t>(0, elapsed);
    Audit(request, result);
    return result;
}

ExecutionResult ExecutionEngine::ExecuteAdmitted(const ExecutionRequest& request, int timeout_s) {
    if (!probe_.IsRuntimeAvailable()) {
        return ExecutionResult::SystemFailure("Container runtime is not available");
    }
    if (!AcquireSlot()) {
        std::cerr << "[engine] rejecting request, " << ActiveExecutions() << " executions in flight" << std::endl;
        return ExecutionResult::SystemFailure(kCapacityExhaustedMessage);
    }
    Slot slot(*this);

    const auto& profile = registry_.Resolve(request.language);
    execution::ScopedWorkspace workspace(workspaces_);
    workspaces_.WriteSource(workspace.Get(), request.source_code, profile);

    const auto timeout = std::chrono::seconds(timeout_s);
    if (profile.NeedsCompile()) {
        auto compiled = runner_.Compile(workspace.Get(), profile, timeout);
        if (!compiled.Success()) {
            return compiled;
        }
    }
    return runner_.Run(workspace.Get(), profile, request.stdin_text, timeout);
}

bool ExecutionEngine::AcquireSlot() {
    const auto limit = static_cast<std::size_t>(std::max(1, config_.max_concurrent));
    std::unique_lock<std::mutex> lock(slots_mutex_);
    const bool admitted = slots_cv_.wait_for(
        lock,
        std::chrono::milliseconds(std::max(0, config_.admission_wait_ms)),
        [this, limit] { return active_ < limit; });
    if (!admitted) {
        return false;
    }
    ++active_;
    return true;
}

void ExecutionEngine::ReleaseSlot() {
    {
        std::lock_guard<std::mutex> lock(slots_mutex_);
        --active_;
    }
    slots_cv_.notify_one();
}

std::size_t ExecutionEngine::ActiveExecutions() const {
    std::lock_guard<std::mutex> lock(slots_mutex_);
    return active_;
}

void ExecutionEngine::Audit(const ExecutionRequest& request, const ExecutionResult& result) {
    execution::AuditEntry entry{};
    entry.language = execution::ToString(request.language);
    entry.success = result.Success();
    entry.execution_time_ms = result.execution_time_ms;
    entry.status = execution::ToString(result.status);
    if (!result.Success()) {
        entry.error = utils::Truncate(result.error, kAuditErrorChars);
    }
    try {
        audit_.Record(entry);
    } catch (const std::exception& ex) {
        std::cerr << "[engine] audit sink failed: " << ex.what() << std::endl;
    }
}

bool ExecutionEngine::IsRuntimeAvailable() {
    return probe_.IsRuntimeAvailable();
}

std::string ExecutionEngine::ServiceStatus() {
    if (!config_.enabled) {
        return "Code execution is disabled";
    }
    if (!probe_.IsRuntimeAvailable()) {
        return "Container runtime is not available";
    }
    return "Code execution service is ready";
}

std::vector<execution::Language> ExecutionEngine::SupportedLanguages() const {
    return registry_.Languages();
}

}  // namespace codebox::engine
