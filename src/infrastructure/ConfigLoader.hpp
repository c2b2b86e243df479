/**
 * @file ConfigLoader.hpp
 * @brief Static utility for loading/saving the Provenance configuration (settings.json).
 *
 * Keeps JSON parsing of settings in one place; the rest of the code receives
 * plain structs.
 */

#pragma once

#include <string>
#include "application/verification/EvidenceVerifier.hpp"

namespace provenance::infrastructure {

struct OllamaSettings {
    std::string host = "localhost";
    int port = 11434;
    std::string model;   ///< Empty: detect the best installed model.
};

/**
 * @struct ProvenanceSettings
 * @brief Every configurable value. Missing keys keep these defaults.
 */
struct ProvenanceSettings {
    int contextWindow = 1000;
    std::string batchSeparator = "\n";
    std::string backupSourceName = "user_provided_unknown_source";
    std::string defaultTokenizer = "gpt2";
    std::string modelRepo;          ///< Directory holding <tokenizer id>/tokenizer.json.
    std::string modelCatalogPath;   ///< Optional JSON array of extra model cards.
    application::verification::VerificationSettings verification;
    OllamaSettings ollama;
};

class ConfigLoader {
public:
    /**
     * @brief Reads settings.json from @p projectRoot.
     * @return Defaults when the file is missing or unreadable.
     */
    static ProvenanceSettings Load(const std::string& projectRoot);

    /**
     * @brief Writes @p settings to settings.json, preserving unknown keys if possible.
     * @return false when the file could not be written.
     */
    static bool Save(const std::string& projectRoot, const ProvenanceSettings& settings);
};

} // namespace provenance::infrastructure
