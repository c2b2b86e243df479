#include "infrastructure/OllamaClient.hpp"
#include <httplib.h>
#include <iostream>

namespace provenance::infrastructure {

using json = nlohmann::json;

namespace {

constexpr double kDeterministicTopP = 1.0;
constexpr int kDeterministicSeed = 42;
constexpr int kGenerateTimeoutSec = 600;
constexpr int kTagsTimeoutSec = 5;

std::optional<json> ParseReply(const httplib::Result& res, const std::string& path) {
    if (!res) {
        std::cerr << "[OllamaClient] " << path << " connection failed: " << static_cast<int>(res.error()) << std::endl;
        return std::nullopt;
    }
    if (res->status != 200) {
        std::cerr << "[OllamaClient] " << path << " HTTP " << res->status << ": " << res->body << std::endl;
        return std::nullopt;
    }
    try {
        return json::parse(res->body);
    } catch (const std::exception& e) {
        std::cerr << "[OllamaClient] " << path << " returned invalid JSON: " << e.what() << std::endl;
    }
    return std::nullopt;
}

} // namespace

OllamaClient::OllamaClient(const std::string& host, int port)
    : m_host(host), m_port(port) {}

std::optional<json> OllamaClient::postJson(const std::string& path, const json& body, int readTimeoutSec) {
    httplib::Client cli(m_host, m_port);
    cli.set_read_timeout(readTimeoutSec);
    return ParseReply(cli.Post(path, body.dump(), "application/json"), path);
}

std::optional<json> OllamaClient::getJson(const std::string& path, int readTimeoutSec) {
    httplib::Client cli(m_host, m_port);
    cli.set_read_timeout(readTimeoutSec);
    return ParseReply(cli.Get(path), path);
}

std::optional<OllamaClient::GenerateResult> OllamaClient::generate(const std::string& model,
                                                                   const std::string& system,
                                                                   const std::string& prompt,
                                                                   double temperature,
                                                                   int maxOutputTokens) {
    json request = {
        {"model", model},
        {"system", system},
        {"prompt", prompt},
        {"stream", false},
        {"options", {
            {"temperature", temperature},
            {"top_p", kDeterministicTopP},
            {"seed", kDeterministicSeed},
            {"num_predict", maxOutputTokens}
        }}
    };

    auto body = postJson("/api/generate", request, kGenerateTimeoutSec);
    if (!body) return std::nullopt;
    if (!body->contains("response") || !(*body)["response"].is_string()) {
        std::cerr << "[OllamaClient] /api/generate reply has no response text" << std::endl;
        return std::nullopt;
    }

    GenerateResult result;
    result.response = (*body)["response"].get<std::string>();
    result.promptTokens = body->value("prompt_eval_count", 0);
    result.outputTokens = body->value("eval_count", 0);
    return result;
}

std::vector<std::string> OllamaClient::getAvailableModels() {
    std::vector<std::string> models;
    auto body = getJson("/api/tags", kTagsTimeoutSec);
    if (!body || !body->contains("models") || !(*body)["models"].is_array()) {
        return models;
    }
    for (const auto& item : (*body)["models"]) {
        if (item.contains("name") && item["name"].is_string()) {
            models.push_back(item["name"].get<std::string>());
        }
    }
    return models;
}

} // namespace provenance::infrastructure
