/**
 * @file ModelCatalog.cpp
 * @brief Implementation of ModelCatalog.
 */

#include "infrastructure/ModelCatalog.hpp"
#include "infrastructure/ModelSelector.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>

namespace provenance::infrastructure {

namespace {

ModelCard MakeCard(const std::string& name, int window, std::optional<std::string> tokenizer) {
    ModelCard card;
    card.modelName = name;
    card.contextWindow = window;
    card.tokenizer = std::move(tokenizer);
    return card;
}

} // namespace

ModelCatalog::ModelCatalog() {
    m_cards = {
        MakeCard("gpt2", 1024, std::string("gpt2")),
        MakeCard("llama3", 8192, std::string("llama3")),
        MakeCard("mistral", 8192, std::string("mistral")),
        MakeCard("qwen2.5", 32768, std::string("qwen2.5")),
        MakeCard("phi3", 4096, std::string("phi3")),
        MakeCard("gemma", 8192, std::string("gemma")),
        MakeCard("text-davinci-003", 4096, std::nullopt)
    };
}

std::optional<ModelCard> ModelCatalog::lookup(const std::string& modelName) const {
    auto byName = [&](const std::string& name) {
        return std::find_if(m_cards.begin(), m_cards.end(), [&](const ModelCard& c) { return c.modelName == name; });
    };

    auto it = byName(modelName);
    if (it != m_cards.end()) return *it;

    it = byName(ModelSelector::Family(modelName));
    if (it != m_cards.end()) {
        ModelCard card = *it;
        card.modelName = modelName;
        return card;
    }
    return std::nullopt;
}

void ModelCatalog::add(const ModelCard& card) {
    auto it = std::find_if(m_cards.begin(), m_cards.end(),
                           [&](const ModelCard& c) { return c.modelName == card.modelName; });
    if (it != m_cards.end()) {
        *it = card;
    } else {
        m_cards.push_back(card);
    }
}

int ModelCatalog::loadFromFile(const std::string& path) {
    if (path.empty() || !std::filesystem::exists(path)) {
        std::cerr << "[ModelCatalog] Catalog file not found: " << path << std::endl;
        return 0;
    }

    int added = 0;
    try {
        std::ifstream f(path);
        nlohmann::json j;
        f >> j;
        if (!j.is_array()) {
            std::cerr << "[ModelCatalog] Expected a JSON array in " << path << std::endl;
            return 0;
        }
        for (const auto& item : j) {
            if (!item.is_object() || !item.contains("model_name") || !item["model_name"].is_string()) {
                std::cerr << "[ModelCatalog] Skipping card without model_name" << std::endl;
                continue;
            }
            ModelCard card;
            card.modelName = item["model_name"].get<std::string>();
            card.contextWindow = item.value("context_window", card.contextWindow);
            if (item.contains("tokenizer") && item["tokenizer"].is_string()) {
                card.tokenizer = item["tokenizer"].get<std::string>();
            }
            if (item.contains("separator") && item["separator"].is_string()) {
                card.separator = item["separator"].get<std::string>();
            }
            add(card);
            ++added;
        }
    } catch (const std::exception& e) {
        std::cerr << "[ModelCatalog] Error reading " << path << ": " << e.what() << std::endl;
    }
    return added;
}

application::SourceSessionConfig ModelCatalog::SessionConfigFor(const ModelCard& card,
                                                                const ProvenanceSettings& settings) {
    application::SourceSessionConfig config;
    config.contextWindow = card.maxInputLen();
    config.separator = card.separator;
    config.backupSourceName = settings.backupSourceName;
    config.tokenizer.modelCardTokenizer = card.tokenizer;
    config.tokenizer.defaultTokenizer = settings.defaultTokenizer;
    return config;
}

} // namespace provenance::infrastructure
