/**
 * @file TokenAdapter.cpp
 * @brief Implementation of TokenAdapter.
 */

#include "application/TokenAdapter.hpp"
#include "domain/ConfigurationError.hpp"
#include <iostream>

namespace provenance::application {

TokenAdapter::TokenAdapter(TokenizerChoice choice, TokenizerLoader loader)
    : m_choice(std::move(choice)), m_loader(std::move(loader)) {}

void TokenAdapter::resolve() {
    if (m_tokenizer) return;

    if (m_choice.sessionTokenizer) {
        m_tokenizer = m_choice.sessionTokenizer;
    } else if (m_loader) {
        if (m_choice.modelCardTokenizer && !m_choice.modelCardTokenizer->empty()) {
            m_tokenizer = m_loader(*m_choice.modelCardTokenizer);
            if (!m_tokenizer) {
                std::cerr << "[TokenAdapter] Model card tokenizer '" << *m_choice.modelCardTokenizer
                          << "' not available, falling back to '" << m_choice.defaultTokenizer << "'" << std::endl;
            }
        }
        if (!m_tokenizer && !m_choice.defaultTokenizer.empty()) {
            m_tokenizer = m_loader(m_choice.defaultTokenizer);
        }
    }

    if (!m_tokenizer) {
        throw domain::ConfigurationError("No tokenizer could be resolved (default '" +
                                         m_choice.defaultTokenizer + "')");
    }
    std::cout << "[TokenAdapter] Using tokenizer: " << m_tokenizer->name() << std::endl;
}

int TokenAdapter::count(const std::string& text) {
    resolve();
    return m_tokenizer->count(text);
}

std::vector<int> TokenAdapter::encode(const std::string& text) {
    resolve();
    return m_tokenizer->encode(text);
}

std::string TokenAdapter::decode(const std::vector<int>& ids) {
    resolve();
    return m_tokenizer->decode(ids);
}

std::shared_ptr<domain::Tokenizer> TokenAdapter::tokenizer() {
    resolve();
    return m_tokenizer;
}

std::string TokenAdapter::tokenizerName() const {
    return m_tokenizer ? m_tokenizer->name() : std::string();
}

} // namespace provenance::application
