#include "execution/workspace.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <fstream>
#include <functional>
#include <iostream>
#include <regex>
#include <thread>

namespace codebox::execution {
namespace {

std::atomic<std::uint64_t> g_sequence{0};

}  // namespace

WorkspaceManager::WorkspaceManager(std::filesystem::path base_dir)
    : base_dir_(std::move(base_dir)) {}

std::string WorkspaceManager::NextId() const {
    const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
    const auto thread_hash = std::hash<std::thread::id>{}(std::this_thread::get_id());
    const auto sequence = g_sequence.fetch_add(1);
    return "exec_" + std::to_string(stamp) + "_" + std::to_string(thread_hash % 100000) +
           "_" + std::to_string(sequence);
}

Workspace WorkspaceManager::Create() const {
    std::error_code ec;
    std::filesystem::create_directories(base_dir_, ec);
    if (ec) {
        throw SystemError("cannot create workspace base " + base_dir_.string() + ": " + ec.message());
    }

    Workspace workspace{};
    workspace.id = NextId();
    workspace.dir = base_dir_ / workspace.id;
    if (!std::filesystem::create_directory(workspace.dir, ec) || ec) {
        throw SystemError("cannot create workspace " + workspace.dir.string() +
                          (ec ? ": " + ec.message() : std::string(": already exists")));
    }
    // The container runs as an unprivileged user that must be able to write
    // compiler artifacts into the bind mount.
    std::filesystem::permissions(workspace.dir, std::filesystem::perms::all,
                                 std::filesystem::perm_options::replace, ec);
    if (ec) {
        Destroy(workspace);
        throw SystemError("cannot set workspace permissions: " + ec.message());
    }
    return workspace;
}

std::string WorkspaceManager::ApplyEntrySymbol(const std::string& code, const std::string& entry_symbol) {
    if (entry_symbol.empty() || code.find("class " + entry_symbol) != std::string::npos) {
        return code;
    }
    static const std::regex kClassDecl(R"(class\s+\w+)");
    return std::regex_replace(code, kClassDecl, "class " + entry_symbol,
                              std::regex_constants::format_first_only);
}

std::filesystem::path WorkspaceManager::WriteSource(const Workspace& workspace,
                                                    const std::string& code,
                                                    const LanguageProfile& profile) const {
    const auto path = workspace.dir / profile.source_file;
    std::ofstream output(path, std::ios::binary | std::ios::trunc);
    if (!output.is_open()) {
        throw SystemError("cannot write source file " + path.string());
    }
    const auto content = ApplyEntrySymbol(code, profile.entry_symbol);
    output << content;
    output.close();
    if (!output) {
        throw SystemError("failed writing source file " + path.string());
    }
    return path;
}

void WorkspaceManager::Destroy(const Workspace& workspace) const {
    if (workspace.dir.empty()) {
        return;
    }
    std::error_code ec;
    std::filesystem::remove_all(workspace.dir, ec);
    if (ec) {
        std::cerr << "[workspace] failed to clean up " << workspace.dir.string()
                  << ": " << ec.message() << std::endl;
    }
}

ScopedWorkspace::ScopedWorkspace(const WorkspaceManager& manager)
    : manager_(manager)
    , workspace_(manager.Create()) {}

ScopedWorkspace::~ScopedWorkspace() {
    manager_.Destroy(workspace_);
}

}  // namespace codebox::execution
