/**
 * @file OllamaClient.hpp
 * @brief Low-level HTTP client for the Ollama REST API.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace provenance::infrastructure {

class OllamaClient {
public:
    struct GenerateResult {
        std::string response;
        int promptTokens = 0;   ///< prompt_eval_count
        int outputTokens = 0;   ///< eval_count
    };

    OllamaClient(const std::string& host = "localhost", int port = 11434);

    /**
     * @brief Non-streaming /api/generate call with a fixed seed.
     * @return std::nullopt on connection, HTTP or payload errors (all logged).
     */
    std::optional<GenerateResult> generate(const std::string& model,
                                           const std::string& system,
                                           const std::string& prompt,
                                           double temperature,
                                           int maxOutputTokens);

    /** @brief Model tags listed by /api/tags; empty when the server is unreachable. */
    std::vector<std::string> getAvailableModels();

private:
    std::optional<nlohmann::json> postJson(const std::string& path, const nlohmann::json& body, int readTimeoutSec);
    std::optional<nlohmann::json> getJson(const std::string& path, int readTimeoutSec);

    std::string m_host;
    int m_port;
};

} // namespace provenance::infrastructure
