/**
 * @file WhitespaceTokenizer.hpp
 * @brief Reversible word-level tokenizer with a vocabulary that grows on demand.
 */

#pragma once
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>
#include "domain/Tokenizer.hpp"

namespace provenance::infrastructure {

/**
 * @class WhitespaceTokenizer
 * @brief One token per word, carrying the whitespace that follows it.
 *
 * Leading whitespace forms its own token, so decode(encode(x)) == x for any x.
 * Safe to share between sessions.
 */
class WhitespaceTokenizer : public domain::Tokenizer {
public:
    std::vector<int> encode(const std::string& text) const override;
    std::string decode(const std::vector<int>& ids) const override;
    int count(const std::string& text) const override;
    std::string name() const override { return "whitespace"; }

    /** @brief The pieces encode() assigns ids to. */
    static std::vector<std::string> Split(const std::string& text);

private:
    mutable std::mutex m_mutex;
    mutable std::unordered_map<std::string, int> m_ids;
    mutable std::vector<std::string> m_pieces;
};

} // namespace provenance::infrastructure
