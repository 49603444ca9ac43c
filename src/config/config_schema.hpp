#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace codebox::config {

struct ExecutionConfig {
    bool enabled = true;
    int default_timeout_s = 10;
    int max_timeout_s = 30;
    std::string temp_dir = "/tmp/code-execution";
    std::size_t max_source_length = 10000;
    std::size_t max_stdin_length = 1000;
    std::size_t max_output_bytes = 1024 * 1024;
    int drain_join_ms = 1000;
    int max_concurrent = 4;
    int admission_wait_ms = 5000;
    int probe_cache_s = 30;
};

struct SandboxConfig {
    std::string runtime = "docker";
    int memory_mb = 128;
    double cpus = 0.5;
    int pids_limit = 64;
    // Empty: the engine's own uid:gid, or nobody when the engine is root.
    std::string user;
    std::string container_workdir = "/workspace";
    std::string tmpfs = "/tmp";
    int kill_timeout_s = 5;
};

struct SecurityConfig {
    std::vector<std::string> extra_deny_patterns;
};

struct LoggingConfig {
    std::string level = "info";
};

struct GatewayConfig {
    std::string host = "127.0.0.1";
    int port = 8089;
};

// Partial override of a built-in language profile; unset fields keep the
// built-in value.
struct LanguageOverride {
    std::optional<std::string> image;
    std::optional<std::string> source_file;
    std::optional<std::vector<std::string>> compile;
    std::optional<std::vector<std::string>> run;
    std::optional<std::string> entry_symbol;
};

struct Config {
    ExecutionConfig execution;
    SandboxConfig sandbox;
    SecurityConfig security;
    LoggingConfig logging;
    GatewayConfig gateway;
    std::map<std::string, LanguageOverride> languages;
};

}  // namespace codebox::config
