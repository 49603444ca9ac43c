#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <stdexcept>
#include <string>
#include <thread>

#include "config/config_loader.hpp"
#include "engine/execution_service.hpp"
#include "execution/hint_advisor.hpp"
#include "execution/wire_format.hpp"
#include "httplib.h"
#include "nlohmann/json.hpp"

namespace {

volatile std::sig_atomic_t g_signal = 0;

void HandleSignal(int signal) {
    g_signal = signal;
}

constexpr const char* kJson = "application/json";

std::string Dump(const nlohmann::json& json) {
    return json.dump(2, ' ', false, nlohmann::json::error_handler_t::replace);
}

void SendMessage(httplib::Response& res, int status, const std::string& message) {
    res.status = status;
    res.set_content(Dump({{"message", message}}), kJson);
}

// Parses the body into a request; on failure answers 400 and returns false.
bool ParseBody(const httplib::Request& req,
               httplib::Response& res,
               codebox::execution::ExecutionRequest& out) {
    try {
        out = codebox::execution::ParseRequestJson(nlohmann::json::parse(req.body));
        return true;
    } catch (const nlohmann::json::exception& ex) {
        SendMessage(res, 400, std::string("Invalid request: ") + ex.what());
    } catch (const std::invalid_argument& ex) {
        SendMessage(res, 400, ex.what());
    }
    return false;
}

void RegisterRoutes(httplib::Server& server, codebox::engine::ExecutionEngine& engine) {
    server.Post("/api/code/execute", [&engine](const httplib::Request& req, httplib::Response& res) {
        codebox::execution::ExecutionRequest request{};
        if (!ParseBody(req, res, request)) {
            return;
        }
        const auto result = engine.Execute(request);
        res.set_content(Dump(codebox::execution::ResultToJson(result, request.language)), kJson);
    });

    server.Post("/api/code/validate", [&engine](const httplib::Request& req, httplib::Response& res) {
        codebox::execution::ExecutionRequest request{};
        if (!ParseBody(req, res, request)) {
            return;
        }
        const auto violation = engine.Validate(request);
        if (violation) {
            SendMessage(res, 400, "Code validation failed: " + *violation);
            return;
        }
        SendMessage(res, 200, "Code validation passed");
    });

    server.Get("/api/code/languages", [&engine](const httplib::Request&, httplib::Response& res) {
        res.set_content(Dump(codebox::execution::LanguagesToJson(engine.SupportedLanguages())), kJson);
    });

    server.Get("/api/code/status", [&engine](const httplib::Request&, httplib::Response& res) {
        nlohmann::json json = {
            {"status", engine.ServiceStatus()},
            {"dockerAvailable", engine.IsRuntimeAvailable()}
        };
        res.set_content(Dump(json), kJson);
    });

    server.Post("/api/code/hints", [&engine](const httplib::Request& req, httplib::Response& res) {
        codebox::execution::ExecutionRequest request{};
        if (!ParseBody(req, res, request)) {
            return;
        }
        const auto result = engine.Execute(request);
        const auto hint = codebox::execution::HintAdvisor::HintFor(result, request.language);
        res.set_content(Dump({{"hint", hint}}), kJson);
    });
}

}  // namespace

int main() {
    const auto config = codebox::config::LoadConfig();
    codebox::engine::ExecutionService service(config);

    httplib::Server server;
    RegisterRoutes(server, service.Engine());

    struct sigaction action {};
    action.sa_handler = HandleSignal;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;
    sigaction(SIGINT, &action, nullptr);
    sigaction(SIGTERM, &action, nullptr);

    const std::string host = config.gateway.host;
    const int port = config.gateway.port;
    std::atomic<bool> listen_failed{false};
    std::thread http_thread([&server, &listen_failed, host, port]() {
        if (!server.listen(host, port)) {
            std::cerr << "[gateway] failed to listen on " << host << ":" << port << std::endl;
            listen_failed.store(true);
        }
    });

    std::cerr << "[gateway] listening on " << host << ":" << port << std::endl;
    while (g_signal == 0 && !listen_failed.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    server.stop();
    if (http_thread.joinable()) {
        http_thread.join();
    }
    std::cerr << "[gateway] stopped" << std::endl;
    return listen_failed.load() ? 1 : 0;
}
