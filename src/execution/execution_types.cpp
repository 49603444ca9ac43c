#include "execution/execution_types.hpp"

#include "utils/common.hpp"

namespace codebox::execution {

const char* ToString(Language language) {
    switch (language) {
        case Language::kJava: return "java";
        case Language::kPython: return "python";
        case Language::kJavaScript: return "javascript";
        case Language::kCpp: return "cpp";
    }
    return "unknown";
}

std::optional<Language> ParseLanguage(const std::string& value) {
    const auto lowered = utils::ToLower(value);
    if (lowered == "java") {
        return Language::kJava;
    }
    if (lowered == "python" || lowered == "py") {
        return Language::kPython;
    }
    if (lowered == "javascript" || lowered == "js" || lowered == "node") {
        return Language::kJavaScript;
    }
    if (lowered == "cpp" || lowered == "c++") {
        return Language::kCpp;
    }
    return std::nullopt;
}

const std::vector<Language>& AllLanguages() {
    static const std::vector<Language> kLanguages = {
        Language::kJava,
        Language::kPython,
        Language::kJavaScript,
        Language::kCpp
    };
    return kLanguages;
}

const char* ToString(ExecutionStatus status) {
    switch (status) {
        case ExecutionStatus::kSuccess: return "SUCCESS";
        case ExecutionStatus::kCompilationError: return "COMPILATION_ERROR";
        case ExecutionStatus::kRuntimeError: return "RUNTIME_ERROR";
        case ExecutionStatus::kTimeout: return "TIMEOUT";
        case ExecutionStatus::kSecurityViolation: return "SECURITY_VIOLATION";
        case ExecutionStatus::kSystemError: return "SYSTEM_ERROR";
    }
    return "SYSTEM_ERROR";
}

ExecutionResult ExecutionResult::Succeeded(std::string output, std::string error, int exit_code) {
    ExecutionResult result{};
    result.status = ExecutionStatus::kSuccess;
    result.output = std::move(output);
    result.error = std::move(error);
    result.exit_code = exit_code;
    return result;
}

ExecutionResult ExecutionResult::CompilationFailed(std::string compiler_output) {
    ExecutionResult result{};
    result.status = ExecutionStatus::kCompilationError;
    result.compilation_error = std::move(compiler_output);
    result.error = "Compilation failed";
    return result;
}

ExecutionResult ExecutionResult::RuntimeFailed(std::string error, std::string output, int exit_code) {
    ExecutionResult result{};
    result.status = ExecutionStatus::kRuntimeError;
    result.error = std::move(error);
    result.output = std::move(output);
    result.exit_code = exit_code;
    return result;
}

ExecutionResult ExecutionResult::TimedOut(std::string partial_output) {
    ExecutionResult result{};
    result.status = ExecutionStatus::kTimeout;
    result.output = std::move(partial_output);
    result.error = "Code execution timed out";
    return result;
}

ExecutionResult ExecutionResult::SecurityViolation(const std::string& details) {
    ExecutionResult result{};
    result.status = ExecutionStatus::kSecurityViolation;
    result.error = "Security violation: " + details;
    return result;
}

ExecutionResult ExecutionResult::SystemFailure(const std::string& details) {
    ExecutionResult result{};
    result.status = ExecutionStatus::kSystemError;
    result.error = "System error: " + details;
    return result;
}

}  // namespace codebox::execution
