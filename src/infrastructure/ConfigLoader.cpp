/**
 * @file ConfigLoader.cpp
 * @brief Implementation of ConfigLoader.
 */

#include "infrastructure/ConfigLoader.hpp"
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <iostream>

namespace provenance::infrastructure {

namespace {

template <typename T>
void ReadKey(const nlohmann::json& j, const char* key, T& target) {
    if (j.contains(key) && !j[key].is_null()) {
        target = j[key].get<T>();
    }
}

} // namespace

ProvenanceSettings ConfigLoader::Load(const std::string& projectRoot) {
    ProvenanceSettings settings;
    std::filesystem::path configPath = std::filesystem::path(projectRoot) / "settings.json";
    if (!std::filesystem::exists(configPath)) {
        return settings;
    }

    try {
        std::ifstream f(configPath);
        nlohmann::json j;
        f >> j;

        ProvenanceSettings loaded;
        ReadKey(j, "context_window", loaded.contextWindow);
        ReadKey(j, "batch_separator", loaded.batchSeparator);
        ReadKey(j, "backup_source_name", loaded.backupSourceName);
        ReadKey(j, "model_catalog", loaded.modelCatalogPath);

        if (j.contains("tokenizer") && j["tokenizer"].is_object()) {
            const auto& t = j["tokenizer"];
            ReadKey(t, "default", loaded.defaultTokenizer);
            ReadKey(t, "model_repo", loaded.modelRepo);
        }

        if (j.contains("verification") && j["verification"].is_object()) {
            const auto& v = j["verification"];
            auto& out = loaded.verification;
            ReadKey(v, "fact_context_radius", out.factContextRadius);
            ReadKey(v, "source_min_threshold", out.sources.minThreshold);
            ReadKey(v, "source_min_match_count", out.sources.minMatchCount);
            ReadKey(v, "source_conclusive_threshold", out.sources.conclusiveThreshold);
            ReadKey(v, "source_max_candidates", out.sources.maxCandidates);
            ReadKey(v, "source_snippet_radius", out.sources.snippetRadius);
            ReadKey(v, "not_found_threshold", out.notFoundThreshold);
        }

        if (j.contains("ollama") && j["ollama"].is_object()) {
            const auto& o = j["ollama"];
            ReadKey(o, "host", loaded.ollama.host);
            ReadKey(o, "port", loaded.ollama.port);
            ReadKey(o, "model", loaded.ollama.model);
        }

        if (loaded.contextWindow <= 0) {
            std::cerr << "[ConfigLoader] Ignoring non-positive context_window " << loaded.contextWindow << std::endl;
            loaded.contextWindow = settings.contextWindow;
        }
        settings = loaded;
    } catch (const std::exception& e) {
        std::cerr << "[ConfigLoader] Error reading settings.json: " << e.what() << std::endl;
    }

    return settings;
}

bool ConfigLoader::Save(const std::string& projectRoot, const ProvenanceSettings& settings) {
    std::filesystem::path configPath = std::filesystem::path(projectRoot) / "settings.json";
    nlohmann::json j = nlohmann::json::object();

    // Try to load existing to preserve other settings
    if (std::filesystem::exists(configPath)) {
        try {
            std::ifstream f(configPath);
            f >> j;
        } catch (const std::exception& e) {
            std::cerr << "[ConfigLoader] Overwriting unreadable settings.json: " << e.what() << std::endl;
            j = nlohmann::json::object();
        }
    }

    j["context_window"] = settings.contextWindow;
    j["batch_separator"] = settings.batchSeparator;
    j["backup_source_name"] = settings.backupSourceName;
    j["model_catalog"] = settings.modelCatalogPath;
    j["tokenizer"] = {
        {"default", settings.defaultTokenizer},
        {"model_repo", settings.modelRepo}
    };
    const auto& v = settings.verification;
    j["verification"] = {
        {"fact_context_radius", v.factContextRadius},
        {"source_min_threshold", v.sources.minThreshold},
        {"source_min_match_count", v.sources.minMatchCount},
        {"source_conclusive_threshold", v.sources.conclusiveThreshold},
        {"source_max_candidates", v.sources.maxCandidates},
        {"source_snippet_radius", v.sources.snippetRadius},
        {"not_found_threshold", v.notFoundThreshold}
    };
    j["ollama"] = {
        {"host", settings.ollama.host},
        {"port", settings.ollama.port},
        {"model", settings.ollama.model}
    };

    std::ofstream f(configPath);
    if (!f) {
        std::cerr << "[ConfigLoader] Error writing settings.json at " << configPath << std::endl;
        return false;
    }
    f << j.dump(4);
    return static_cast<bool>(f);
}

} // namespace provenance::infrastructure
