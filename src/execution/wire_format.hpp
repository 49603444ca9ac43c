#pragma once

#include <optional>

#include "execution/execution_types.hpp"
#include "nlohmann/json.hpp"

namespace codebox::execution {

// {"language","code","stdin","timeoutSeconds"}. Throws std::invalid_argument
// with a caller-facing message when a field is missing or malformed.
ExecutionRequest ParseRequestJson(const nlohmann::json& data);

nlohmann::json ResultToJson(const ExecutionResult& result,
                            const std::optional<Language>& language = std::nullopt);

nlohmann::json LanguagesToJson(const std::vector<Language>& languages);

}  // namespace codebox::execution
