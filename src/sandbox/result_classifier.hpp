#pragma once

#include <string>

#include "execution/execution_types.hpp"
#include "sandbox/output_collector.hpp"

namespace codebox::sandbox {

enum class Phase {
    kCompile,
    kRun
};

// Exit status the container runtime client uses for its own failures
// (daemon unreachable, image pull error). A sandboxed program may exit with
// it too, so it only counts as a runtime failure alongside the client's own
// diagnostic on stderr.
constexpr int kRuntimeFailureExitCode = 125;

class ResultClassifier {
public:
    static execution::ExecutionResult Classify(const ProcessOutcome& outcome,
                                               Phase phase,
                                               const std::string& runtime = "docker");

    // True when stderr starts with "<runtime>: " or carries a daemon or
    // image-pull message.
    static bool IsRuntimeDiagnostic(const std::string& stderr_text, const std::string& runtime);
};

}  // namespace codebox::sandbox
