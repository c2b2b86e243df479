/**
 * @file OllamaAdapter.cpp
 * @brief Implementation of the OllamaAdapter class.
 */
#include "infrastructure/OllamaAdapter.hpp"
#include "infrastructure/ModelSelector.hpp"
#include <iostream>

namespace provenance::infrastructure {

namespace {
const char* kSystemPrompt = "You are a helpful assistant.";
}

OllamaAdapter::OllamaAdapter(const std::string& host, int port, const std::string& model)
    : m_client(host, port) {
    if (model.empty()) {
        detectBestModel();
    } else {
        m_model = model;
    }
}

void OllamaAdapter::detectBestModel() {
    auto available = m_client.getAvailableModels();
    if (available.empty()) {
        std::cerr << "[OllamaAdapter] Failed to list models. Is Ollama running? Keeping default: " << m_model << std::endl;
        return;
    }
    m_model = ModelSelector::SelectBest(available, m_model);
    std::cout << "[OllamaAdapter] Auto-selected model: " << m_model << std::endl;
}

std::optional<domain::LanguageModel::InferenceResult> OllamaAdapter::infer(const std::string& prompt,
                                                                           const std::string& context,
                                                                           const SamplingParams& params) {
    std::string fullPrompt = context.empty() ? prompt : context + "\n" + prompt;

    std::cout << "[OllamaAdapter] Sending request to " << m_model << " (" << fullPrompt.size() << " chars)" << std::endl;
    auto reply = m_client.generate(m_model, kSystemPrompt, fullPrompt, params.temperature, params.maxOutputTokens);
    if (!reply) {
        return std::nullopt;
    }

    InferenceResult result;
    result.llmResponse = reply->response;
    result.usage["input"] = reply->promptTokens;
    result.usage["output"] = reply->outputTokens;
    result.usage["total"] = reply->promptTokens + reply->outputTokens;
    return result;
}

} // namespace provenance::infrastructure
