/**
 * @file TokenAdapter.hpp
 * @brief Session-scoped access to the tokenizer used for batch sizing.
 */

#pragma once
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "domain/Tokenizer.hpp"

namespace provenance::application {

/** @brief Resolves a tokenizer identifier, returning nullptr when it is unknown. */
using TokenizerLoader = std::function<std::shared_ptr<domain::Tokenizer>(const std::string&)>;

/**
 * @struct TokenizerChoice
 * @brief Candidates tried in order: the session tokenizer, the model card's, then the default.
 */
struct TokenizerChoice {
    std::shared_ptr<domain::Tokenizer> sessionTokenizer;
    std::optional<std::string> modelCardTokenizer;
    std::string defaultTokenizer = "gpt2";
};

/**
 * @class TokenAdapter
 * @brief Resolves the tokenizer lazily, once, and keeps it for the whole session.
 *
 * Throws domain::ConfigurationError when none of the candidates resolves.
 */
class TokenAdapter {
public:
    TokenAdapter(TokenizerChoice choice, TokenizerLoader loader);

    int count(const std::string& text);
    std::vector<int> encode(const std::string& text);
    std::string decode(const std::vector<int>& ids);

    /** @brief The resolved tokenizer (forces resolution). */
    std::shared_ptr<domain::Tokenizer> tokenizer();

    /** @brief Name of the resolved tokenizer, or empty when not yet resolved. */
    std::string tokenizerName() const;

private:
    void resolve();

    TokenizerChoice m_choice;
    TokenizerLoader m_loader;
    std::shared_ptr<domain::Tokenizer> m_tokenizer;
};

} // namespace provenance::application
