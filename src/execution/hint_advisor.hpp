#pragma once

#include <string>

#include "execution/execution_types.hpp"

namespace codebox::execution {

// Short learner-facing advice derived from a failed result.
class HintAdvisor {
public:
    static std::string HintFor(const ExecutionResult& result, Language language);

private:
    static std::string CompilationHint(const std::string& error, Language language);
    static std::string RuntimeHint(const std::string& error);
};

}  // namespace codebox::execution
