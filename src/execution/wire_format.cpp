#include "execution/wire_format.hpp"

#include <algorithm>
#include <cstdint>
#include <limits>
#include <stdexcept>

#include "utils/common.hpp"

namespace codebox::execution {
namespace {

// Saturates instead of wrapping when the JSON integer does not fit an int.
int ReadClampedInt(const nlohmann::json& value) {
    constexpr auto kMax = static_cast<std::int64_t>(std::numeric_limits<int>::max());
    constexpr auto kMin = static_cast<std::int64_t>(std::numeric_limits<int>::min());
    if (value.is_number_unsigned()) {
        const auto number = value.get<std::uint64_t>();
        return number > static_cast<std::uint64_t>(kMax) ? std::numeric_limits<int>::max()
                                                         : static_cast<int>(number);
    }
    return static_cast<int>(std::clamp(value.get<std::int64_t>(), kMin, kMax));
}

}  // namespace

ExecutionRequest ParseRequestJson(const nlohmann::json& data) {
    if (!data.is_object()) {
        throw std::invalid_argument("request must be a JSON object");
    }
    if (!data.contains("code") || !data["code"].is_string()) {
        throw std::invalid_argument("Code cannot be empty");
    }
    const auto code = data["code"].get<std::string>();
    if (code.find_first_not_of(" \t\r\n") == std::string::npos) {
        throw std::invalid_argument("Code cannot be empty");
    }
    if (!data.contains("language") || !data["language"].is_string()) {
        throw std::invalid_argument("Programming language must be specified");
    }
    const auto language_name = data["language"].get<std::string>();
    const auto language = ParseLanguage(language_name);
    if (!language) {
        throw std::invalid_argument("Unsupported language: " + language_name);
    }

    ExecutionRequest request{};
    request.language = *language;
    request.source_code = code;
    if (data.contains("stdin") && data["stdin"].is_string()) {
        request.stdin_text = data["stdin"].get<std::string>();
    }
    if (data.contains("timeoutSeconds") && !data["timeoutSeconds"].is_null()) {
        if (!data["timeoutSeconds"].is_number_integer()) {
            throw std::invalid_argument("timeoutSeconds must be an integer");
        }
        request.timeout_seconds = ReadClampedInt(data["timeoutSeconds"]);
    }
    return request;
}

nlohmann::json ResultToJson(const ExecutionResult& result, const std::optional<Language>& language) {
    nlohmann::json json = {
        {"success", result.Success()},
        {"status", ToString(result.status)},
        {"output", result.output},
        {"error", result.error.empty() ? nlohmann::json(nullptr) : nlohmann::json(result.error)},
        {"compilationError", result.compilation_error.empty() ? nlohmann::json(nullptr)
                                                              : nlohmann::json(result.compilation_error)},
        {"exitCode", result.exit_code},
        {"executionTimeMs", result.execution_time_ms},
        {"executedAt", utils::FormatIsoTimestamp(result.executed_at)}
    };
    if (language) {
        json["language"] = ToString(*language);
    }
    return json;
}

nlohmann::json LanguagesToJson(const std::vector<Language>& languages) {
    nlohmann::json json = nlohmann::json::array();
    for (const auto language : languages) {
        json.push_back(ToString(language));
    }
    return json;
}

}  // namespace codebox::execution
