#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include <boost/regex.hpp>

namespace codebox::execution {

// Rejects source that mentions process, file, network or dynamic-evaluation
// primitives before anything is spawned. Pattern matching only; the
// container limits are the isolation boundary.
class SecurityValidator {
public:
    // Throws boost::regex_error if an extra pattern does not compile.
    explicit SecurityValidator(std::size_t max_source_length = 10000,
                               const std::vector<std::string>& extra_patterns = {});

    // First violated rule's description, or nullopt when the source passes.
    std::optional<std::string> Validate(const std::string& source_code) const;

    static const std::vector<std::string>& DefaultPatterns();

private:
    struct DenyRule {
        std::string pattern;
        boost::regex regex;
    };

    std::size_t max_source_length_;
    std::vector<DenyRule> rules_;
};

}  // namespace codebox::execution
