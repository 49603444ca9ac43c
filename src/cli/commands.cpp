#include <fstream>
#include <iostream>
#include <iterator>
#include <algorithm>
#include <cstddef>
#include <mutex>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>

#include "config/config_loader.hpp"
#include "engine/execution_service.hpp"
#include "execution/hint_advisor.hpp"
#include "execution/wire_format.hpp"
#include "nlohmann/json.hpp"
#include "utils/thread_group.hpp"

namespace {

using codebox::execution::ExecutionRequest;

constexpr int kExitUsage = 2;

std::string Dump(const nlohmann::json& json, int indent = 2) {
    return json.dump(indent, ' ', false, nlohmann::json::error_handler_t::replace);
}

void PrintUsage() {
    std::cout << "Usage:\n"
              << "  codebox_cli exec <language> <file|-> [--stdin <text>] [--stdin-file <path>] [--timeout <s>]\n"
              << "  codebox_cli validate <language> <file|->\n"
              << "  codebox_cli hint <language> <file|-> [--stdin <text>] [--timeout <s>]\n"
              << "  codebox_cli languages\n"
              << "  codebox_cli status\n"
              << "  codebox_cli serve" << std::endl;
}

std::optional<std::string> ReadSource(const std::string& path) {
    if (path == "-") {
        return std::string(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
    }
    std::ifstream input(path, std::ios::binary);
    if (!input.is_open()) {
        return std::nullopt;
    }
    std::ostringstream buffer;
    buffer << input.rdbuf();
    return buffer.str();
}

// Parses "<language> <file|-> [options]" starting at argv[2].
std::optional<ExecutionRequest> ParseRequestArgs(int argc, char** argv) {
    if (argc < 4) {
        PrintUsage();
        return std::nullopt;
    }
    const auto language = codebox::execution::ParseLanguage(argv[2]);
    if (!language) {
        std::cout << "Unsupported language: " << argv[2] << std::endl;
        return std::nullopt;
    }
    auto source = ReadSource(argv[3]);
    if (!source) {
        std::cout << "Cannot read source file: " << argv[3] << std::endl;
        return std::nullopt;
    }

    ExecutionRequest request{};
    request.language = *language;
    request.source_code = std::move(*source);
    for (int i = 4; i < argc; ++i) {
        const std::string flag = argv[i];
        if (i + 1 >= argc) {
            std::cout << "Missing value for " << flag << std::endl;
            return std::nullopt;
        }
        const std::string value = argv[++i];
        if (flag == "--stdin") {
            request.stdin_text = value;
        } else if (flag == "--stdin-file") {
            auto text = ReadSource(value);
            if (!text) {
                std::cout << "Cannot read stdin file: " << value << std::endl;
                return std::nullopt;
            }
            request.stdin_text = std::move(*text);
        } else if (flag == "--timeout") {
            try {
                request.timeout_seconds = std::stoi(value);
            } catch (const std::logic_error&) {
                std::cout << "Invalid timeout: " << value << std::endl;
                return std::nullopt;
            }
        } else {
            std::cout << "Unknown option: " << flag << std::endl;
            return std::nullopt;
        }
    }
    return request;
}

int RunExec(codebox::engine::ExecutionEngine& engine, const ExecutionRequest& request) {
    const auto result = engine.Execute(request);
    std::cout << Dump(codebox::execution::ResultToJson(result, request.language)) << std::endl;
    return result.Success() ? 0 : 1;
}

int RunValidate(codebox::engine::ExecutionEngine& engine, const ExecutionRequest& request) {
    const auto violation = engine.Validate(request);
    if (violation) {
        std::cout << "Code validation failed: " << *violation << std::endl;
        return 1;
    }
    std::cout << "Code validation passed" << std::endl;
    return 0;
}

int RunHint(codebox::engine::ExecutionEngine& engine, const ExecutionRequest& request) {
    const auto result = engine.Execute(request);
    std::cout << codebox::execution::HintAdvisor::HintFor(result, request.language) << std::endl;
    return 0;
}

int RunStatus(codebox::engine::ExecutionEngine& engine) {
    nlohmann::json json = {
        {"status", engine.ServiceStatus()},
        {"dockerAvailable", engine.IsRuntimeAvailable()}
    };
    std::cout << Dump(json) << std::endl;
    return 0;
}

// Newline-delimited JSON in, one JSON result line per request out. Each
// request gets its own thread, at most max_in_flight at a time; beyond that a
// request is answered with the capacity error straight away. The engine's
// admission gate bounds how many actually run.
int RunServe(codebox::engine::ExecutionEngine& engine, std::size_t max_in_flight) {
    std::mutex output_mutex;
    auto emit = [&output_mutex](const nlohmann::json& json) {
        std::lock_guard<std::mutex> lock(output_mutex);
        std::cout << Dump(json, -1) << std::endl;
    };
    codebox::utils::ThreadGroup workers(max_in_flight);

    std::string line;
    while (std::getline(std::cin, line)) {
        if (line.find_first_not_of(" \t\r") == std::string::npos) {
            continue;
        }
        nlohmann::json id = nullptr;
        ExecutionRequest request{};
        try {
            const auto data = nlohmann::json::parse(line);
            if (data.is_object() && data.contains("id")) {
                id = data["id"];
            }
            request = codebox::execution::ParseRequestJson(data);
        } catch (const nlohmann::json::exception& ex) {
            emit({{"id", id}, {"error", std::string("Invalid request: ") + ex.what()}});
            continue;
        } catch (const std::invalid_argument& ex) {
            emit({{"id", id}, {"error", std::string("Invalid request: ") + ex.what()}});
            continue;
        }
        const bool launched = workers.TryLaunch([&engine, &emit, request, id] {
            const auto result = engine.Execute(request);
            auto json = codebox::execution::ResultToJson(result, request.language);
            json["id"] = id;
            emit(json);
        });
        if (!launched) {
            std::cerr << "[serve] " << max_in_flight << " requests in flight, rejecting" << std::endl;
            const auto rejected =
                codebox::execution::ExecutionResult::SystemFailure(codebox::engine::kCapacityExhaustedMessage);
            auto json = codebox::execution::ResultToJson(rejected, request.language);
            json["id"] = id;
            emit(json);
        }
    }
    workers.JoinAll();
    return 0;
}

}  // namespace

int main(int argc, char** argv) {
    if (argc < 2) {
        PrintUsage();
        return kExitUsage;
    }
    const std::string command = argv[1];

    const auto config = codebox::config::LoadConfig();
    codebox::engine::ExecutionService service(config);
    auto& engine = service.Engine();

    if (command == "languages") {
        std::cout << Dump(codebox::execution::LanguagesToJson(engine.SupportedLanguages())) << std::endl;
        return 0;
    }
    if (command == "status") {
        return RunStatus(engine);
    }
    if (command == "serve") {
        const auto max_in_flight = static_cast<std::size_t>(std::max(1, config.execution.max_concurrent)) * 2;
        return RunServe(engine, max_in_flight);
    }
    if (command == "exec" || command == "validate" || command == "hint") {
        const auto request = ParseRequestArgs(argc, argv);
        if (!request) {
            return kExitUsage;
        }
        if (command == "exec") {
            return RunExec(engine, *request);
        }
        if (command == "validate") {
            return RunValidate(engine, *request);
        }
        return RunHint(engine, *request);
    }

    PrintUsage();
    return kExitUsage;
}
