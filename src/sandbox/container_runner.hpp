#pragma once

#include <chrono>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "config/config_schema.hpp"
#include "sandbox/output_collector.hpp"
#include "sandbox/result_classifier.hpp"
#include "sandbox/sandbox_runner.hpp"

namespace codebox::sandbox {

// Runs compile and run steps in a throwaway container: no network, capped
// memory/CPU/pids, unprivileged user, read-only root with a scratch /tmp,
// and the workspace as the only bind mount and working directory.
class ContainerRunner : public SandboxRunner {
public:
    ContainerRunner(config::SandboxConfig config, const OutputCollector& collector);

    execution::ExecutionResult Compile(const execution::Workspace& workspace,
                                       const execution::LanguageProfile& profile,
                                       std::chrono::seconds timeout) override;

    execution::ExecutionResult Run(const execution::Workspace& workspace,
                                   const execution::LanguageProfile& profile,
                                   const std::optional<std::string>& stdin_text,
                                   std::chrono::seconds timeout) override;

    std::vector<std::string> BuildInvocation(const execution::Workspace& workspace,
                                             const execution::LanguageProfile& profile,
                                             const std::vector<std::string>& command,
                                             const std::string& container_name) const;

    static std::string ContainerName(const execution::Workspace& workspace, Phase phase);

    // The configured user, else the engine's own uid:gid so that anything
    // the program leaves in the workspace stays removable by the engine.
    std::string ContainerUser() const;

private:
    execution::ExecutionResult Launch(const execution::Workspace& workspace,
                                      const execution::LanguageProfile& profile,
                                      const std::vector<std::string>& command,
                                      const std::optional<std::string>& stdin_text,
                                      std::chrono::seconds timeout,
                                      Phase phase);
    void KillContainer(const std::string& container_name) const;

    config::SandboxConfig config_;
    const OutputCollector& collector_;
};

// Asks the runtime for its version; the answer is cached for cache_ttl so a
// burst of requests does not spawn one probe each.
class ContainerRuntimeProbe : public RuntimeProbe {
public:
    ContainerRuntimeProbe(std::string runtime, std::chrono::seconds cache_ttl);

    bool IsRuntimeAvailable() override;

private:
    bool Probe() const;

    std::string runtime_;
    std::chrono::seconds cache_ttl_;
    std::mutex mutex_;
    std::optional<bool> cached_;
    std::chrono::steady_clock::time_point checked_at_{};
};

}  // namespace codebox::sandbox
