#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "application/SourceSession.hpp"
#include "application/verification/EvidenceVerifier.hpp"
#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/ModelCatalog.hpp"
#include "infrastructure/OllamaAdapter.hpp"
#include "infrastructure/RecordJson.hpp"
#include "infrastructure/TokenizerRegistry.hpp"

namespace fs = std::filesystem;
using namespace provenance;

namespace {

void PrintUsage() {
    std::cout << "Usage:\n"
              << "  provenance pack <records.json>              Pack records and print the batches\n"
              << "  provenance ask <records.json> <question>    Ask the model over each batch and verify the answers\n"
              << "Options:\n"
              << "  --root <dir>     Directory holding settings.json (default: current directory)\n"
              << "  --model <name>   Model card to size batches for (default: Ollama model or default card)\n";
}

bool ReadJsonFile(const std::string& path, nlohmann::json& out) {
    std::ifstream f(path);
    if (!f) {
        std::cerr << "[Provenance] Cannot open " << path << std::endl;
        return false;
    }
    try {
        f >> out;
    } catch (const std::exception& e) {
        std::cerr << "[Provenance] Invalid JSON in " << path << ": " << e.what() << std::endl;
        return false;
    }
    return true;
}

} // namespace

int main(int argc, char** argv) {
    std::vector<std::string> positional;
    std::string root = fs::current_path().string();
    std::string modelName;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--root" && i + 1 < argc) {
            root = argv[++i];
        } else if (arg == "--model" && i + 1 < argc) {
            modelName = argv[++i];
        } else if (arg == "-h" || arg == "--help") {
            PrintUsage();
            return 0;
        } else {
            positional.push_back(arg);
        }
    }

    if (positional.size() < 2 || (positional[0] != "pack" && positional[0] != "ask") ||
        (positional[0] == "ask" && positional.size() < 3)) {
        PrintUsage();
        return 1;
    }

    auto settings = infrastructure::ConfigLoader::Load(root);

    infrastructure::ModelCatalog catalog;
    if (!settings.modelCatalogPath.empty()) {
        catalog.loadFromFile(settings.modelCatalogPath);
    }

    std::shared_ptr<infrastructure::OllamaAdapter> model;
    if (positional[0] == "ask") {
        model = std::make_shared<infrastructure::OllamaAdapter>(settings.ollama.host, settings.ollama.port,
                                                                modelName.empty() ? settings.ollama.model : modelName);
        if (modelName.empty()) modelName = model->getCurrentModel();
    }

    application::SourceSessionConfig sessionConfig;
    sessionConfig.contextWindow = settings.contextWindow;
    sessionConfig.separator = settings.batchSeparator;
    sessionConfig.backupSourceName = settings.backupSourceName;
    sessionConfig.tokenizer.defaultTokenizer = settings.defaultTokenizer;
    if (!modelName.empty()) {
        if (auto card = catalog.lookup(modelName)) {
            sessionConfig = infrastructure::ModelCatalog::SessionConfigFor(*card, settings);
        } else {
            std::cerr << "[Provenance] No model card for " << modelName << ", using settings.json window" << std::endl;
        }
    }

    nlohmann::json records;
    if (!ReadJsonFile(positional[1], records)) {
        return 1;
    }

    infrastructure::TokenizerRegistry registry(settings.modelRepo);
    application::SourceSession session(sessionConfig, registry.loader());

    try {
        session.addSourceJson(records);
    } catch (const std::exception& e) {
        std::cerr << "[Provenance] Packing failed: " << e.what() << std::endl;
        return 1;
    }

    if (positional[0] == "pack") {
        nlohmann::json out = nlohmann::json::array();
        for (const auto& batch : session.sourceMaterials()) {
            out.push_back(infrastructure::RecordJson::ToJson(batch));
        }
        std::cout << out.dump(2) << std::endl;
        return 0;
    }

    const std::string& question = positional[2];
    application::verification::EvidenceVerifier verifier(settings.verification, model);
    nlohmann::json out = nlohmann::json::array();

    for (std::size_t i = 0; i < session.sourceMaterials().size(); ++i) {
        const auto& batch = session.sourceMaterials()[i];
        auto answer = model->infer(question, batch.text, domain::LanguageModel::SamplingParams{});
        if (!answer) {
            std::cerr << "[Provenance] No answer for batch " << batch.id << std::endl;
            continue;
        }

        auto record = session.responseRecordFor(i, answer->llmResponse, question);
        if (!record) continue;
        record->usage = answer->usage;

        auto review = verifier.review(*record);
        nlohmann::json entry = infrastructure::RecordJson::ToJson(review);
        entry["batch_id"] = batch.id;
        entry["llm_response"] = answer->llmResponse;
        entry["markup"] = application::verification::NumberFactChecker::Markup(answer->llmResponse, review.factCheck);
        out.push_back(entry);
    }

    std::cout << out.dump(2) << std::endl;
    return 0;
}
