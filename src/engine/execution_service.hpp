#pragma once

#include "config/config_schema.hpp"
#include "engine/execution_engine.hpp"
#include "sandbox/container_runner.hpp"
#include "sandbox/output_collector.hpp"
#include "utils/worker_pool.hpp"

namespace codebox::engine {

// Wires the production collaborators (container runner, runtime probe, log
// audit sink) around one engine. Members are declared in dependency order.
class ExecutionService {
public:
    explicit ExecutionService(const config::Config& config);

    ExecutionEngine& Engine() { return engine_; }
    const execution::LanguageProfileRegistry& Registry() const { return registry_; }

private:
    execution::LanguageProfileRegistry registry_;
    execution::SecurityValidator validator_;
    execution::WorkspaceManager workspaces_;
    utils::WorkerPool drain_pool_;
    sandbox::OutputCollector collector_;
    sandbox::ContainerRunner runner_;
    sandbox::ContainerRuntimeProbe probe_;
    execution::LogAuditSink audit_;
    ExecutionEngine engine_;
};

}  // namespace codebox::engine
