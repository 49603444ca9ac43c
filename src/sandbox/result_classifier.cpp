#include "sandbox/result_classifier.hpp"

namespace codebox::sandbox {

using execution::ExecutionResult;

bool ResultClassifier::IsRuntimeDiagnostic(const std::string& stderr_text, const std::string& runtime) {
    const auto slash = runtime.find_last_of('/');
    const auto name = slash == std::string::npos ? runtime : runtime.substr(slash + 1);
    if (!name.empty() && stderr_text.rfind(name + ": ", 0) == 0) {
        return true;
    }
    return stderr_text.find("Unable to find image") != std::string::npos ||
           stderr_text.find("Error response from daemon") != std::string::npos;
}

ExecutionResult ResultClassifier::Classify(const ProcessOutcome& outcome,
                                           Phase phase,
                                           const std::string& runtime) {
    if (outcome.timed_out) {
        auto result = ExecutionResult::TimedOut(outcome.stdout_text);
        result.exit_code = outcome.exit_code;
        return result;
    }
    if (outcome.exit_code == kRuntimeFailureExitCode &&
        IsRuntimeDiagnostic(outcome.stderr_text, runtime)) {
        auto result = ExecutionResult::SystemFailure(outcome.stderr_text);
        result.exit_code = outcome.exit_code;
        return result;
    }
    if (outcome.exit_code == 0) {
        if (phase == Phase::kCompile) {
            return ExecutionResult::Succeeded(std::string(), outcome.stderr_text, 0);
        }
        return ExecutionResult::Succeeded(outcome.stdout_text, outcome.stderr_text, 0);
    }
    if (phase == Phase::kCompile) {
        auto result = ExecutionResult::CompilationFailed(
            outcome.stderr_text.empty() ? outcome.stdout_text : outcome.stderr_text);
        result.exit_code = outcome.exit_code;
        return result;
    }
    return ExecutionResult::RuntimeFailed(
        outcome.stderr_text.empty() ? outcome.stdout_text : outcome.stderr_text,
        outcome.stdout_text,
        outcome.exit_code);
}

}  // namespace codebox::sandbox
