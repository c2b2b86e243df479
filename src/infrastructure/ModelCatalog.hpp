/**
 * @file ModelCatalog.hpp
 * @brief Model cards: context window, tokenizer and separator per model.
 */

#pragma once
#include <optional>
#include <string>
#include <vector>
#include "application/SourceSession.hpp"
#include "infrastructure/ConfigLoader.hpp"

namespace provenance::infrastructure {

struct ModelCard {
    std::string modelName;
    int contextWindow = 2048;
    std::optional<std::string> tokenizer;   ///< Identifier for TokenizerRegistry.
    std::string separator = "\n";

    /** @brief Half of the context window is reserved for the answer. */
    int maxInputLen() const { return contextWindow / 2; }
};

/**
 * @class ModelCatalog
 * @brief Built-in cards for common model families plus cards loaded from JSON.
 */
class ModelCatalog {
public:
    ModelCatalog();

    /**
     * @brief Finds a card by exact name, then by the family part of an Ollama tag
     *        ("llama3:8b" -> "llama3").
     */
    std::optional<ModelCard> lookup(const std::string& modelName) const;

    /** @brief Adds @p card, replacing a card with the same name. */
    void add(const ModelCard& card);

    /**
     * @brief Loads a JSON array of cards from @p path.
     * @return Number of cards added; entries without model_name are skipped.
     */
    int loadFromFile(const std::string& path);

    const std::vector<ModelCard>& cards() const { return m_cards; }

    /** @brief Session settings for packing context sent to @p card's model. */
    static application::SourceSessionConfig SessionConfigFor(const ModelCard& card, const ProvenanceSettings& settings);

private:
    std::vector<ModelCard> m_cards;
};

} // namespace provenance::infrastructure
