#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "config/config_schema.hpp"
#include "execution/audit_sink.hpp"
#include "execution/execution_types.hpp"
#include "execution/language_profiles.hpp"
#include "execution/security_validator.hpp"
#include "execution/workspace.hpp"
#include "sandbox/sandbox_runner.hpp"

namespace codebox::engine {

constexpr const char* kCapacityExhaustedMessage = "Execution capacity exhausted, try again later";

// Drives one request end to end: screening, workspace, optional compile,
// run, classification, cleanup and audit. Execute never throws; every
// failure comes back as a classified result.
class ExecutionEngine {
public:
    ExecutionEngine(config::ExecutionConfig config,
                    const execution::LanguageProfileRegistry& registry,
                    const execution::SecurityValidator& validator,
                    const execution::WorkspaceManager& workspaces,
                    sandbox::SandboxRunner& runner,
                    sandbox::RuntimeProbe& probe,
                    execution::AuditSink& audit);

    execution::ExecutionResult Execute(const execution::ExecutionRequest& request);

    // Screening only; nothing is written or launched.
    std::optional<std::string> Validate(const execution::ExecutionRequest& request) const;

    std::string ServiceStatus();
    bool IsRuntimeAvailable();
    std::vector<execution::Language> SupportedLanguages() const;

    // Absent or non-positive -> default; above the ceiling -> ceiling.
    int ResolveTimeout(const std::optional<int>& requested) const;

    std::size_t ActiveExecutions() const;

private:
    class Slot {
    public:
        explicit Slot(ExecutionEngine& engine) : engine_(engine) {}
        ~Slot();
        Slot(const Slot&) = delete;
        Slot& operator=(const Slot&) = delete;

    private:
        ExecutionEngine& engine_;
    };

    execution::ExecutionResult ExecuteAdmitted(const execution::ExecutionRequest& request, int timeout_s);
    bool AcquireSlot();
    void ReleaseSlot();
    void Audit(const execution::ExecutionRequest& request, const execution::ExecutionResult& result);

    config::ExecutionConfig config_;
    const execution::LanguageProfileRegistry& registry_;
    const execution::SecurityValidator& validator_;
    const execution::WorkspaceManager& workspaces_;
    sandbox::SandboxRunner& runner_;
    sandbox::RuntimeProbe& probe_;
    execution::AuditSink& audit_;

    mutable std::mutex slots_mutex_;
    std::condition_variable slots_cv_;
    std::size_t active_ = 0;
};

}  // namespace codebox::engine
