#include "config/config_loader.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace codebox::config {
namespace {

std::string GetEnv(const char* name) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : std::string();
}

std::filesystem::path GetHomePath() {
    const char* home = std::getenv("HOME");
    return std::filesystem::path(home ? home : ".");
}

std::filesystem::path GetConfigPath() {
    const auto explicit_path = GetEnv("CODEBOX_CONFIG");
    if (!explicit_path.empty()) {
        return explicit_path;
    }
    return GetHomePath() / ".codebox" / "config.json";
}

void ReadString(const nlohmann::json& source, const char* key, std::string& target) {
    if (source.contains(key) && source[key].is_string()) {
        target = source[key].get<std::string>();
    }
}

void ReadInt(const nlohmann::json& source, const char* key, int& target) {
    if (source.contains(key) && source[key].is_number_integer()) {
        target = source[key].get<int>();
    }
}

void ReadSize(const nlohmann::json& source, const char* key, std::size_t& target) {
    if (source.contains(key) && source[key].is_number_unsigned()) {
        target = source[key].get<std::size_t>();
    }
}

void ReadDouble(const nlohmann::json& source, const char* key, double& target) {
    if (source.contains(key) && source[key].is_number()) {
        target = source[key].get<double>();
    }
}

void ReadBool(const nlohmann::json& source, const char* key, bool& target) {
    if (source.contains(key) && source[key].is_boolean()) {
        target = source[key].get<bool>();
    }
}

std::optional<std::vector<std::string>> ReadStringArray(const nlohmann::json& source, const char* key) {
    if (!source.contains(key) || !source[key].is_array()) {
        return std::nullopt;
    }
    std::vector<std::string> items;
    for (const auto& item : source[key]) {
        if (item.is_string()) {
            items.push_back(item.get<std::string>());
        }
    }
    return items;
}

void ApplyLanguageOverride(LanguageOverride& target, const nlohmann::json& source) {
    if (!source.is_object()) {
        return;
    }
    if (source.contains("image") && source["image"].is_string()) {
        target.image = source["image"].get<std::string>();
    }
    if (source.contains("sourceFile") && source["sourceFile"].is_string()) {
        target.source_file = source["sourceFile"].get<std::string>();
    }
    if (source.contains("entrySymbol") && source["entrySymbol"].is_string()) {
        target.entry_symbol = source["entrySymbol"].get<std::string>();
    }
    if (auto compile = ReadStringArray(source, "compile")) {
        target.compile = std::move(compile);
    }
    if (auto run = ReadStringArray(source, "run")) {
        target.run = std::move(run);
    }
}

bool ParseBool(const std::string& value) {
    std::string lowered = value;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return lowered == "1" || lowered == "true" || lowered == "yes" || lowered == "on";
}

int ParseInt(const std::string& value, int fallback) {
    try {
        return std::stoi(value);
    } catch (const std::logic_error&) {
        std::cerr << "[config] ignoring non-integer value: " << value << std::endl;
        return fallback;
    }
}

std::size_t ParseSize(const std::string& value, std::size_t fallback) {
    try {
        return static_cast<std::size_t>(std::stoull(value));
    } catch (const std::logic_error&) {
        std::cerr << "[config] ignoring non-integer value: " << value << std::endl;
        return fallback;
    }
}

double ParseDouble(const std::string& value, double fallback) {
    try {
        return std::stod(value);
    } catch (const std::logic_error&) {
        std::cerr << "[config] ignoring non-numeric value: " << value << std::endl;
        return fallback;
    }
}

std::vector<std::string> SplitList(const std::string& value, char delimiter) {
    std::vector<std::string> items;
    std::stringstream stream(value);
    std::string item;
    while (std::getline(stream, item, delimiter)) {
        if (!item.empty()) {
            items.push_back(item);
        }
    }
    return items;
}

}  // namespace

void ApplyConfigFromJson(Config& config, const nlohmann::json& data) {
    if (!data.is_object()) {
        return;
    }

    if (data.contains("execution") && data["execution"].is_object()) {
        const auto& execution = data["execution"];
        ReadBool(execution, "enabled", config.execution.enabled);
        ReadInt(execution, "timeoutS", config.execution.default_timeout_s);
        ReadInt(execution, "maxTimeoutS", config.execution.max_timeout_s);
        ReadString(execution, "tempDir", config.execution.temp_dir);
        ReadSize(execution, "maxSourceLength", config.execution.max_source_length);
        ReadSize(execution, "maxStdinLength", config.execution.max_stdin_length);
        ReadSize(execution, "maxOutputBytes", config.execution.max_output_bytes);
        ReadInt(execution, "drainJoinMs", config.execution.drain_join_ms);
        ReadInt(execution, "maxConcurrent", config.execution.max_concurrent);
        ReadInt(execution, "admissionWaitMs", config.execution.admission_wait_ms);
        ReadInt(execution, "probeCacheS", config.execution.probe_cache_s);
    }

    if (data.contains("sandbox") && data["sandbox"].is_object()) {
        const auto& sandbox = data["sandbox"];
        ReadString(sandbox, "runtime", config.sandbox.runtime);
        ReadInt(sandbox, "memoryMb", config.sandbox.memory_mb);
        ReadDouble(sandbox, "cpus", config.sandbox.cpus);
        ReadInt(sandbox, "pidsLimit", config.sandbox.pids_limit);
        ReadString(sandbox, "user", config.sandbox.user);
        ReadString(sandbox, "containerWorkdir", config.sandbox.container_workdir);
        ReadString(sandbox, "tmpfs", config.sandbox.tmpfs);
        ReadInt(sandbox, "killTimeoutS", config.sandbox.kill_timeout_s);
    }

    if (data.contains("security") && data["security"].is_object()) {
        if (auto patterns = ReadStringArray(data["security"], "extraDenyPatterns")) {
            config.security.extra_deny_patterns = std::move(*patterns);
        }
    }

    if (data.contains("logging") && data["logging"].is_object()) {
        ReadString(data["logging"], "level", config.logging.level);
    }

    if (data.contains("gateway") && data["gateway"].is_object()) {
        ReadString(data["gateway"], "host", config.gateway.host);
        ReadInt(data["gateway"], "port", config.gateway.port);
    }

    if (data.contains("languages") && data["languages"].is_object()) {
        for (const auto& [name, value] : data["languages"].items()) {
            ApplyLanguageOverride(config.languages[name], value);
        }
    }
}

void ApplyEnvironmentOverrides(Config& config) {
    const auto enabled = GetEnv("CODEBOX_EXECUTION__ENABLED");
    if (!enabled.empty()) {
        config.execution.enabled = ParseBool(enabled);
    }

    const auto timeout = GetEnv("CODEBOX_EXECUTION__TIMEOUT_S");
    if (!timeout.empty()) {
        config.execution.default_timeout_s = ParseInt(timeout, config.execution.default_timeout_s);
    }

    const auto max_timeout = GetEnv("CODEBOX_EXECUTION__MAX_TIMEOUT_S");
    if (!max_timeout.empty()) {
        config.execution.max_timeout_s = ParseInt(max_timeout, config.execution.max_timeout_s);
    }

    const auto temp_dir = GetEnv("CODEBOX_EXECUTION__TEMP_DIR");
    if (!temp_dir.empty()) {
        config.execution.temp_dir = temp_dir;
    }

    const auto max_source = GetEnv("CODEBOX_EXECUTION__MAX_SOURCE_LENGTH");
    if (!max_source.empty()) {
        config.execution.max_source_length = ParseSize(max_source, config.execution.max_source_length);
    }

    const auto max_output = GetEnv("CODEBOX_EXECUTION__MAX_OUTPUT_BYTES");
    if (!max_output.empty()) {
        config.execution.max_output_bytes = ParseSize(max_output, config.execution.max_output_bytes);
    }

    const auto max_concurrent = GetEnv("CODEBOX_EXECUTION__MAX_CONCURRENT");
    if (!max_concurrent.empty()) {
        config.execution.max_concurrent = ParseInt(max_concurrent, config.execution.max_concurrent);
    }

    const auto runtime = GetEnv("CODEBOX_SANDBOX__RUNTIME");
    if (!runtime.empty()) {
        config.sandbox.runtime = runtime;
    }

    const auto memory = GetEnv("CODEBOX_SANDBOX__MEMORY_MB");
    if (!memory.empty()) {
        config.sandbox.memory_mb = ParseInt(memory, config.sandbox.memory_mb);
    }

    const auto cpus = GetEnv("CODEBOX_SANDBOX__CPUS");
    if (!cpus.empty()) {
        config.sandbox.cpus = ParseDouble(cpus, config.sandbox.cpus);
    }

    const auto user = GetEnv("CODEBOX_SANDBOX__USER");
    if (!user.empty()) {
        config.sandbox.user = user;
    }

    const auto deny = GetEnv("CODEBOX_SECURITY__EXTRA_DENY_PATTERNS");
    if (!deny.empty()) {
        config.security.extra_deny_patterns = SplitList(deny, ';');
    }

    const auto level = GetEnv("CODEBOX_LOG_LEVEL");
    if (!level.empty()) {
        config.logging.level = level;
    }

    const auto host = GetEnv("CODEBOX_GATEWAY__HOST");
    if (!host.empty()) {
        config.gateway.host = host;
    }

    const auto port = GetEnv("CODEBOX_GATEWAY__PORT");
    if (!port.empty()) {
        config.gateway.port = ParseInt(port, config.gateway.port);
    }
}

Config LoadConfigFromFile(const std::filesystem::path& path) {
    Config config{};
    if (!std::filesystem::exists(path)) {
        return config;
    }
    try {
        std::ifstream input(path);
        nlohmann::json data;
        input >> data;
        Config parsed{};
        ApplyConfigFromJson(parsed, data);
        config = std::move(parsed);
    } catch (const nlohmann::json::exception& ex) {
        std::cerr << "[config] keeping defaults, failed to parse " << path.string()
                  << ": " << ex.what() << std::endl;
    }
    return config;
}

Config LoadConfig() {
    auto config = LoadConfigFromFile(GetConfigPath());
    ApplyEnvironmentOverrides(config);
    return config;
}

}  // namespace codebox::config
