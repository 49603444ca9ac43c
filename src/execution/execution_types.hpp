#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace codebox::execution {

enum class Language {
    kJava,
    kPython,
    kJavaScript,
    kCpp
};

const char* ToString(Language language);
std::optional<Language> ParseLanguage(const std::string& value);
const std::vector<Language>& AllLanguages();

enum class ExecutionStatus {
    kSuccess,
    kCompilationError,
    kRuntimeError,
    kTimeout,
    kSecurityViolation,
    kSystemError
};

const char* ToString(ExecutionStatus status);

struct ExecutionRequest {
    Language language = Language::kPython;
    std::string source_code;
    std::optional<std::string> stdin_text;
    std::optional<int> timeout_seconds;
};

struct ExecutionResult {
    ExecutionStatus status = ExecutionStatus::kSystemError;
    std::string output;
    std::string error;
    std::string compilation_error;
    int exit_code = -1;
    std::int64_t execution_time_ms = 0;
    std::chrono::system_clock::time_point executed_at = std::chrono::system_clock::now();

    bool Success() const { return status == ExecutionStatus::kSuccess; }

    static ExecutionResult Succeeded(std::string output, std::string error, int exit_code);
    static ExecutionResult CompilationFailed(std::string compiler_output);
    static ExecutionResult RuntimeFailed(std::string error, std::string output, int exit_code);
    static ExecutionResult TimedOut(std::string partial_output);
    static ExecutionResult SecurityViolation(const std::string& details);
    static ExecutionResult SystemFailure(const std::string& details);
};

// Infrastructure failure inside the engine: workspace I/O, process launch,
// missing language profile. Converted to SYSTEM_ERROR at the engine boundary.
class SystemError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

}  // namespace codebox::execution
