#pragma once

#include <chrono>
#include <optional>
#include <string>

#include "execution/execution_types.hpp"
#include "execution/language_profiles.hpp"
#include "execution/workspace.hpp"

namespace codebox::sandbox {

class SandboxRunner {
public:
    virtual ~SandboxRunner() = default;

    // Only called for profiles with a compile step. SUCCESS means the run
    // step may proceed.
    virtual execution::ExecutionResult Compile(const execution::Workspace& workspace,
                                               const execution::LanguageProfile& profile,
                                               std::chrono::seconds timeout) = 0;

    virtual execution::ExecutionResult Run(const execution::Workspace& workspace,
                                           const execution::LanguageProfile& profile,
                                           const std::optional<std::string>& stdin_text,
                                           std::chrono::seconds timeout) = 0;
};

class RuntimeProbe {
public:
    virtual ~RuntimeProbe() = default;
    virtual bool IsRuntimeAvailable() = 0;
};

}  // namespace codebox::sandbox
