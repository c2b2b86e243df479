#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>

#include "infrastructure/ModelCatalog.hpp"
#include "infrastructure/ModelSelector.hpp"

using namespace provenance;
using infrastructure::ModelCatalog;
using infrastructure::ModelSelector;

int main() {
    std::cout << "[Test] Starting ModelCatalog Test..." << std::endl;

    // 1. Built-in cards and tag lookup.
    {
        ModelCatalog catalog;
        auto gpt2 = catalog.lookup("gpt2");
        assert(gpt2 && gpt2->contextWindow == 1024 && gpt2->maxInputLen() == 512);

        auto tagged = catalog.lookup("llama3:8b");
        assert(tagged);
        assert(tagged->modelName == "llama3:8b");
        assert(tagged->contextWindow == 8192);
        assert(tagged->tokenizer == std::string("llama3"));

        auto davinci = catalog.lookup("text-davinci-003");
        assert(davinci && !davinci->tokenizer.has_value());

        assert(!catalog.lookup("unknown-model").has_value());
    }

    // 2. Cards loaded from JSON add to and replace the built-ins.
    {
        const std::string path = "test_model_catalog.json";
        std::ofstream(path) << R"([
            {"model_name": "gpt2", "context_window": 2000, "tokenizer": "gpt2", "separator": " "},
            {"model_name": "tiny", "context_window": 64, "tokenizer": "whitespace"},
            {"context_window": 10}
        ])";
        ModelCatalog catalog;
        const auto before = catalog.cards().size();
        assert(catalog.loadFromFile(path) == 2);
        assert(catalog.cards().size() == before + 1);
        assert(catalog.lookup("gpt2")->contextWindow == 2000);
        assert(catalog.lookup("tiny")->tokenizer == std::string("whitespace"));
        assert(catalog.loadFromFile("missing_catalog.json") == 0);
        std::filesystem::remove(path);

        infrastructure::ProvenanceSettings settings;
        settings.backupSourceName = "fallback";
        auto config = ModelCatalog::SessionConfigFor(*catalog.lookup("gpt2"), settings);
        assert(config.contextWindow == 1000);
        assert(config.separator == " ");
        assert(config.backupSourceName == "fallback");
        assert(config.tokenizer.modelCardTokenizer == std::string("gpt2"));
        assert(config.tokenizer.defaultTokenizer == "gpt2");
    }

    // 3. Model selection.
    {
        assert(ModelSelector::SelectBest({}) == "llama3");
        assert(ModelSelector::SelectBest({"phi3:mini", "mistral:7b"}, "phi3:mini") == "phi3:mini");
        assert(ModelSelector::SelectBest({"phi3:mini", "mistral:7b"}) == "mistral:7b");
        assert(ModelSelector::SelectBest({"custom"}) == "custom");
        assert(ModelSelector::SelectBest({"qwen2.5:7b", "llama3:70b"}) == "llama3:70b");
        assert(ModelSelector::SelectBest({"gemma:2b", "qwen2.5:7b"}, "mixtral") == "qwen2.5:7b");
        assert(ModelSelector::Family("llama3:8b-instruct") == "llama3");
        assert(ModelSelector::Family("gpt2") == "gpt2");
    }

    std::cout << "[PASS] ModelCatalog resolves model cards." << std::endl;
    return 0;
}
