/**
 * @file BpeTokenizer.hpp
 * @brief Byte-level BPE tokenizer loaded from a HuggingFace tokenizer.json.
 */

#pragma once
#include <array>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>
#include <nlohmann/json.hpp>
#include "domain/Tokenizer.hpp"

namespace provenance::infrastructure {

/**
 * @class BpeTokenizer
 * @brief GPT-2 style tokenizer: byte->unicode mapping, GPT-2 pre-tokenization,
 *        then ranked pair merges.
 *
 * Reads model.vocab, model.merges (either "a b" strings or [a, b] pairs) and
 * added_tokens. Immutable after construction.
 */
class BpeTokenizer : public domain::Tokenizer {
public:
    /** @throws std::runtime_error when @p tokenizerJson has no usable model section. */
    BpeTokenizer(const nlohmann::json& tokenizerJson, std::string name);

    /** @brief Loads @p path. Returns nullptr and logs on any error. */
    static std::shared_ptr<BpeTokenizer> LoadFromFile(const std::string& path, const std::string& name);

    std::vector<int> encode(const std::string& text) const override;
    std::string decode(const std::vector<int>& ids) const override;
    std::string name() const override { return m_name; }

    std::size_t vocabSize() const { return m_vocab.size(); }

    /** @brief GPT-2 bytes_to_unicode table: byte value -> UTF-8 encoded stand-in. */
    static const std::array<std::string, 256>& ByteEncoder();

    /** @brief Splits raw text the way the GPT-2 pre-tokenizer regex does. */
    static std::vector<std::string> PreTokenize(const std::string& text);

private:
    std::vector<std::string> bpe(const std::string& word) const;
    void encodeSegment(const std::string& text, std::vector<int>& ids) const;

    std::string m_name;
    std::unordered_map<std::string, int> m_vocab;
    std::unordered_map<int, std::string> m_idToToken;
    std::unordered_map<std::string, int> m_ranks;      ///< "a b" -> merge rank
    std::vector<std::pair<std::string, int>> m_added;  ///< Longest first.
    std::unordered_map<int, std::string> m_addedById;
    std::unordered_map<std::string, unsigned char> m_byteDecoder;
};

} // namespace provenance::infrastructure
