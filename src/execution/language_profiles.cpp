#include "execution/language_profiles.hpp"

#include <iostream>

namespace codebox::execution {

std::map<Language, LanguageProfile> LanguageProfileRegistry::BuiltinProfiles() {
    std::map<Language, LanguageProfile> profiles;
    profiles[Language::kJava] = LanguageProfile{
        Language::kJava,
        "openjdk:21-slim",
        "Main.java",
        {"javac", "Main.java"},
        {"java", "Main"},
        "Main"};
    profiles[Language::kPython] = LanguageProfile{
        Language::kPython,
        "python:3.11-slim",
        "main.py",
        {},
        {"python", "main.py"},
        ""};
    profiles[Language::kJavaScript] = LanguageProfile{
        Language::kJavaScript,
        "node:18-slim",
        "main.js",
        {},
        {"node", "main.js"},
        ""};
    profiles[Language::kCpp] = LanguageProfile{
        Language::kCpp,
        "gcc:latest",
        "main.cpp",
        {"g++", "-o", "main", "main.cpp"},
        {"./main"},
        ""};
    return profiles;
}

LanguageProfileRegistry::LanguageProfileRegistry()
    : profiles_(BuiltinProfiles()) {}

LanguageProfileRegistry::LanguageProfileRegistry(
    const std::map<std::string, config::LanguageOverride>& overrides)
    : profiles_(BuiltinProfiles()) {
    for (const auto& [name, override_entry] : overrides) {
        const auto language = ParseLanguage(name);
        if (!language) {
            std::cerr << "[languages] ignoring override for unknown language: " << name << std::endl;
            continue;
        }
        auto& profile = profiles_[*language];
        if (override_entry.image) {
            profile.image = *override_entry.image;
        }
        if (override_entry.source_file) {
            profile.source_file = *override_entry.source_file;
        }
        if (override_entry.compile) {
            profile.compile_command = *override_entry.compile;
        }
        if (override_entry.run && !override_entry.run->empty()) {
            profile.run_command = *override_entry.run;
        }
        if (override_entry.entry_symbol) {
            profile.entry_symbol = *override_entry.entry_symbol;
        }
    }
}

const LanguageProfile& LanguageProfileRegistry::Resolve(Language language) const {
    auto it = profiles_.find(language);
    if (it == profiles_.end()) {
        throw SystemError(std::string("Unsupported language: ") + ToString(language));
    }
    return it->second;
}

bool LanguageProfileRegistry::Supports(Language language) const {
    return profiles_.count(language) > 0;
}

std::vector<Language> LanguageProfileRegistry::Languages() const {
    std::vector<Language> languages;
    languages.reserve(profiles_.size());
    for (const auto& entry : profiles_) {
        languages.push_back(entry.first);
    }
    return languages;
}

}  // namespace codebox::execution
