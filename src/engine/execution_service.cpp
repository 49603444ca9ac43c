#include "engine/execution_service.hpp"

#include <algorithm>

namespace codebox::engine {
namespace {

// Each admitted execution needs exactly two drain tasks at a time.
std::size_t DrainThreads(const config::ExecutionConfig& config) {
    return static_cast<std::size_t>(std::max(1, config.max_concurrent)) * 2;
}

sandbox::CollectorOptions MakeCollectorOptions(const config::ExecutionConfig& config) {
    sandbox::CollectorOptions options{};
    options.drain_join_timeout = std::chrono::milliseconds(config.drain_join_ms);
    options.max_output_bytes = config.max_output_bytes;
    return options;
}

utils::LogConfig MakeLogConfig(const config::LoggingConfig& config) {
    utils::LogConfig log_config{};
    log_config.min_level = utils::ParseLogLevel(config.level, utils::LogLevel::kInfo);
    return log_config;
}

}  // namespace

ExecutionService::ExecutionService(const config::Config& config)
    : registry_(config.languages)
    , validator_(config.execution.max_source_length, config.security.extra_deny_patterns)
    , workspaces_(config.execution.temp_dir)
    , drain_pool_(DrainThreads(config.execution), DrainThreads(config.execution))
    , collector_(drain_pool_, MakeCollectorOptions(config.execution))
    , runner_(config.sandbox, collector_)
    , probe_(config.sandbox.runtime, std::chrono::seconds(config.execution.probe_cache_s))
    , audit_(MakeLogConfig(config.logging))
    , engine_(config.execution, registry_, validator_, workspaces_, runner_, probe_, audit_) {}

}  // namespace codebox::engine
