/**
 * @file TokenizerRegistry.cpp
 * @brief Implementation of TokenizerRegistry.
 */

#include "infrastructure/TokenizerRegistry.hpp"
#include "infrastructure/BpeTokenizer.hpp"
#include "infrastructure/WhitespaceTokenizer.hpp"
#include <filesystem>
#include <iostream>

namespace provenance::infrastructure {

TokenizerRegistry::TokenizerRegistry(std::string modelRepo) : m_modelRepo(std::move(modelRepo)) {}

std::shared_ptr<domain::Tokenizer> TokenizerRegistry::load(const std::string& identifier) const {
    if (identifier == "whitespace") {
        return std::make_shared<WhitespaceTokenizer>();
    }

    std::error_code ec;
    if (std::filesystem::is_regular_file(identifier, ec)) {
        return BpeTokenizer::LoadFromFile(identifier, identifier);
    }

    if (!m_modelRepo.empty()) {
        std::filesystem::path candidate = std::filesystem::path(m_modelRepo) / identifier / "tokenizer.json";
        if (std::filesystem::is_regular_file(candidate, ec)) {
            return BpeTokenizer::LoadFromFile(candidate.string(), identifier);
        }
    }

    std::cerr << "[TokenizerRegistry] No tokenizer found for '" << identifier << "'"
              << (m_modelRepo.empty() ? std::string() : " in " + m_modelRepo) << std::endl;
    return nullptr;
}

std::shared_ptr<domain::Tokenizer> TokenizerRegistry::resolve(const std::string& identifier) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_cache.find(identifier);
    if (it != m_cache.end()) return it->second;

    auto tokenizer = load(identifier);
    if (tokenizer) {
        m_cache[identifier] = tokenizer;
    }
    return tokenizer;
}

application::TokenizerLoader TokenizerRegistry::loader() {
    return [this](const std::string& identifier) { return resolve(identifier); };
}

} // namespace provenance::infrastructure
