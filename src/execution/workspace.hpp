#pragma once

#include <filesystem>
#include <string>

#include "execution/language_profiles.hpp"

namespace codebox::execution {

struct Workspace {
    std::string id;
    std::filesystem::path dir;
};

class WorkspaceManager {
public:
    explicit WorkspaceManager(std::filesystem::path base_dir);

    // Throws SystemError if the base or workspace directory cannot be created.
    Workspace Create() const;
    // Throws SystemError if the source file cannot be written.
    std::filesystem::path WriteSource(const Workspace& workspace,
                                      const std::string& code,
                                      const LanguageProfile& profile) const;
    // Best effort; failures are logged and never thrown.
    void Destroy(const Workspace& workspace) const;

    // Renames the first declared class to entry_symbol unless the source
    // already declares it. Textual, not a parse.
    static std::string ApplyEntrySymbol(const std::string& code, const std::string& entry_symbol);

private:
    std::string NextId() const;

    std::filesystem::path base_dir_;
};

// Owns one workspace for the lifetime of a request. Release depends only on
// the workspace itself, so it runs on every exit path.
class ScopedWorkspace {
public:
    explicit ScopedWorkspace(const WorkspaceManager& manager);
    ~ScopedWorkspace();

    ScopedWorkspace(const ScopedWorkspace&) = delete;
    ScopedWorkspace& operator=(const ScopedWorkspace&) = delete;

    const Workspace& Get() const { return workspace_; }

private:
    const WorkspaceManager& manager_;
    Workspace workspace_;
};

}  // namespace codebox::execution
