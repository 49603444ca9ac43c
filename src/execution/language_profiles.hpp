#pragma once

#include <map>
#include <string>
#include <vector>

#include "config/config_schema.hpp"
#include "execution/execution_types.hpp"

namespace codebox::execution {

struct LanguageProfile {
    Language language = Language::kPython;
    std::string image;
    std::string source_file;
    std::vector<std::string> compile_command;  // empty: interpreted, no compile step
    std::vector<std::string> run_command;
    std::string entry_symbol;  // class name the toolchain requires, empty if none

    bool NeedsCompile() const { return !compile_command.empty(); }
};

// Built once from the built-in table plus configuration overrides and
// read-only afterwards; safe to share across request threads.
class LanguageProfileRegistry {
public:
    LanguageProfileRegistry();
    explicit LanguageProfileRegistry(const std::map<std::string, config::LanguageOverride>& overrides);

    // Throws SystemError when the language has no profile.
    const LanguageProfile& Resolve(Language language) const;
    bool Supports(Language language) const;
    std::vector<Language> Languages() const;

    static std::map<Language, LanguageProfile> BuiltinProfiles();

private:
    std::map<Language, LanguageProfile> profiles_;
};

}  // namespace codebox::execution
