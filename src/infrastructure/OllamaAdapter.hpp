/**
 * @file OllamaAdapter.hpp
 * @brief LanguageModel backed by a local Ollama server.
 */

#pragma once
#include "domain/LanguageModel.hpp"
#include "infrastructure/OllamaClient.hpp"
#include <string>

namespace provenance::infrastructure {

/**
 * @class OllamaAdapter
 * @brief Implements domain::LanguageModel using the Ollama REST API.
 */
class OllamaAdapter : public domain::LanguageModel {
public:
    /**
     * @param host Server hostname or IP.
     * @param port Server port.
     * @param model Model to use; when empty the best installed model is detected.
     */
    OllamaAdapter(const std::string& host = "localhost", int port = 11434, const std::string& model = "");

    /** @brief Sends context then prompt to /api/generate. @see domain::LanguageModel::infer */
    std::optional<InferenceResult> infer(const std::string& prompt,
                                         const std::string& context,
                                         const SamplingParams& params) override;

    std::string getCurrentModel() const override { return m_model; }

private:
    void detectBestModel();

    OllamaClient m_client;
    std::string m_model = "llama3"; ///< Target model name.
};

} // namespace provenance::infrastructure
