#include "execution/security_validator.hpp"

#include <iostream>

#include "utils/common.hpp"

namespace codebox::execution {

const std::vector<std::string>& SecurityValidator::DefaultPatterns() {
    static const std::vector<std::string> kPatterns = {
        R"(\bRuntime\b)",
        R"(\bProcess\b)",
        R"(\bProcessBuilder\b)",
        R"(\bSystem\.exit\b)",
        R"(\bfile\s*\()",
        R"(\bopen\s*\()",
        R"(\b__import__\b)",
        R"(\beval\b)",
        R"(\bexec\b)",
        R"(\bos\.)",
        R"(\bsubprocess\b)",
        R"(\bsocket\b)",
        R"(\bhttp\b)",
        R"(\burllib\b)",
        R"(\brequests\b)",
        R"(\bchild_process\b)",
        R"(\bsystem\s*\()",
        R"(\bpopen\s*\()",
        R"(\bfork\s*\()",
        R"(\bexecv\w*\s*\()"
    };
    return kPatterns;
}

SecurityValidator::SecurityValidator(std::size_t max_source_length,
                                     const std::vector<std::string>& extra_patterns)
    : max_source_length_(max_source_length) {
    const auto flags = boost::regex::perl | boost::regex::icase;
    for (const auto& pattern : DefaultPatterns()) {
        rules_.push_back(DenyRule{pattern, boost::regex(pattern, flags)});
    }
    for (const auto& pattern : extra_patterns) {
        rules_.push_back(DenyRule{pattern, boost::regex(pattern, flags)});
    }
}

std::optional<std::string> SecurityValidator::Validate(const std::string& source_code) const {
    if (utils::Utf8Length(source_code) > max_source_length_) {
        return std::string("Code exceeds maximum length limit");
    }
    for (const auto& rule : rules_) {
        try {
            if (boost::regex_search(source_code, rule.regex)) {
                return "Potentially unsafe code detected: " + rule.pattern;
            }
        } catch (const boost::regex_error& ex) {
            // The matcher gave up on this input; it is not screened as clean.
            std::cerr << "[security] pattern " << rule.pattern << " aborted: " << ex.what() << std::endl;
            return "Potentially unsafe code detected: " + rule.pattern;
        }
    }
    return std::nullopt;
}

}  // namespace codebox::execution
