#include "execution/hint_advisor.hpp"

#include "utils/common.hpp"

namespace codebox::execution {
namespace {

constexpr std::size_t kExcerptChars = 100;

bool Contains(const std::string& haystack, const char* needle) {
    return haystack.find(needle) != std::string::npos;
}

}  // namespace

std::string HintAdvisor::HintFor(const ExecutionResult& result, Language language) {
    switch (result.status) {
        case ExecutionStatus::kSuccess:
            return "Code executed successfully! No hints needed.";
        case ExecutionStatus::kCompilationError:
            return CompilationHint(result.compilation_error, language);
        case ExecutionStatus::kRuntimeError:
            return RuntimeHint(result.error);
        case ExecutionStatus::kTimeout:
            return "Your code is taking too long to execute. Check for infinite loops or optimize your algorithm.";
        case ExecutionStatus::kSecurityViolation:
            return "Your code contains potentially unsafe operations. Stick to basic programming constructs for learning.";
        case ExecutionStatus::kSystemError:
            break;
    }
    return "Something went wrong. Check your code syntax and logic.";
}

std::string HintAdvisor::CompilationHint(const std::string& error, Language language) {
    if (error.empty()) {
        return "Check your code syntax.";
    }
    const auto lowered = utils::ToLower(error);
    if (Contains(lowered, "cannot find symbol")) {
        return "Variable or method not found. Check spelling and make sure you've declared all variables.";
    }
    if (Contains(lowered, "expected")) {
        return "Syntax error detected. Check for missing semicolons, brackets, or parentheses.";
    }
    if (Contains(lowered, "class") && language == Language::kJava) {
        return "Java class issues. Make sure your class name matches the filename and is properly structured.";
    }
    return "Compilation error: " + utils::Truncate(error, kExcerptChars) + "...";
}

std::string HintAdvisor::RuntimeHint(const std::string& error) {
    if (error.empty()) {
        return "Runtime error occurred. Check your program logic.";
    }
    const auto lowered = utils::ToLower(error);
    if (Contains(lowered, "nullpointerexception")) {
        return "Null pointer error. Make sure you initialize your variables before using them.";
    }
    if (Contains(lowered, "arrayindexoutofbounds")) {
        return "Array index error. Check that your array indices are within valid bounds.";
    }
    if (Contains(lowered, "dividebyzero") || Contains(lowered, "division by zero")) {
        return "Division by zero error. Make sure you're not dividing by zero in your calculations.";
    }
    return "Runtime error: " + utils::Truncate(error, kExcerptChars) + "...";
}

}  // namespace codebox::execution
