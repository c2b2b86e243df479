#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>

#include <nlohmann/json.hpp>

#include "infrastructure/ConfigLoader.hpp"

using namespace provenance;
using infrastructure::ConfigLoader;

int main() {
    std::cout << "[Test] Starting ConfigLoader Test..." << std::endl;

    const std::string testRoot = "test_project_root_config";
    std::filesystem::remove_all(testRoot);
    std::filesystem::create_directories(testRoot);
    const auto settingsPath = std::filesystem::path(testRoot) / "settings.json";

    // 1. Missing file: defaults.
    {
        auto settings = ConfigLoader::Load(testRoot);
        assert(settings.contextWindow == 1000);
        assert(settings.batchSeparator == "\n");
        assert(settings.defaultTokenizer == "gpt2");
        assert(settings.ollama.port == 11434);
        assert(settings.verification.sources.maxCandidates == 3);
    }

    // 2. Partial file: present keys override, others keep defaults.
    {
        std::ofstream f(settingsPath);
        f << R"({
            "context_window": 2048,
            "tokenizer": {"default": "whitespace"},
            "verification": {"source_max_candidates": 5, "not_found_threshold": 0.4},
            "ollama": {"port": 8080},
            "ui_theme": "dark"
        })";
    }
    {
        auto settings = ConfigLoader::Load(testRoot);
        assert(settings.contextWindow == 2048);
        assert(settings.defaultTokenizer == "whitespace");
        assert(settings.verification.sources.maxCandidates == 5);
        assert(settings.verification.notFoundThreshold == 0.4);
        assert(settings.verification.factContextRadius == 10);
        assert(settings.ollama.port == 8080);
        assert(settings.ollama.host == "localhost");

        // Save keeps keys it does not own.
        settings.backupSourceName = "unknown";
        assert(ConfigLoader::Save(testRoot, settings));
        std::ifstream in(settingsPath);
        nlohmann::json j;
        in >> j;
        assert(j["ui_theme"] == "dark");
        assert(j["backup_source_name"] == "unknown");

        auto reloaded = ConfigLoader::Load(testRoot);
        assert(reloaded.backupSourceName == "unknown");
        assert(reloaded.contextWindow == 2048);
    }

    // 3. Invalid values fall back to defaults.
    {
        std::ofstream(settingsPath) << R"({"context_window": -5, "batch_separator": " | "})";
        auto settings = ConfigLoader::Load(testRoot);
        assert(settings.contextWindow == 1000);
        assert(settings.batchSeparator == " | ");

        std::ofstream(settingsPath) << R"({"context_window": "big"})";
        assert(ConfigLoader::Load(testRoot).contextWindow == 1000);

        std::ofstream(settingsPath) << "{ not json";
        assert(ConfigLoader::Load(testRoot).contextWindow == 1000);
    }

    std::filesystem::remove_all(testRoot);
    std::cout << "[PASS] ConfigLoader reads, defaults and preserves settings." << std::endl;
    return 0;
}
