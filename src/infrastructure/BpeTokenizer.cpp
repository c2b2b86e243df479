/**
 * @file BpeTokenizer.cpp
 * @brief Implementation of BpeTokenizer.
 */

#include "infrastructure/BpeTokenizer.hpp"
#include <algorithm>
#include <cctype>
#include <climits>
#include <fstream>
#include <iostream>
#include <stdexcept>

namespace provenance::infrastructure {

namespace {

std::string EncodeUtf8(int codepoint) {
    std::string out;
    if (codepoint < 0x80) {
        out.push_back(static_cast<char>(codepoint));
    } else if (codepoint < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (codepoint >> 6)));
        out.push_back(static_cast<char>(0x80 | (codepoint & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xE0 | (codepoint >> 12)));
        out.push_back(static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (codepoint & 0x3F)));
    }
    return out;
}

std::size_t Utf8Length(unsigned char c) {
    if ((c & 0x80) == 0) return 1;
    if ((c & 0xE0) == 0xC0) return 2;
    if ((c & 0xF0) == 0xE0) return 3;
    if ((c & 0xF8) == 0xF0) return 4;
    return 1;
}

enum class CharClass { Letter, Digit, Space, Other };

// Bytes of multi-byte UTF-8 sequences count as letters.
CharClass Classify(unsigned char c) {
    if (c >= 0x80 || std::isalpha(c)) return CharClass::Letter;
    if (std::isdigit(c)) return CharClass::Digit;
    if (std::isspace(c)) return CharClass::Space;
    return CharClass::Other;
}

std::size_t RunEnd(const std::string& text, std::size_t i, CharClass cls) {
    while (i < text.size() && Classify(static_cast<unsigned char>(text[i])) == cls) ++i;
    return i;
}

std::size_t ContractionLength(const std::string& text, std::size_t i) {
    if (text[i] != '\'') return 0;
    static const char* kSuffixes[] = {"re", "ve", "ll", "s", "t", "m", "d"};
    for (const char* suffix : kSuffixes) {
        std::size_t len = std::char_traits<char>::length(suffix);
        if (text.compare(i + 1, len, suffix) == 0) return len + 1;
    }
    return 0;
}

} // namespace

const std::array<std::string, 256>& BpeTokenizer::ByteEncoder() {
    static const std::array<std::string, 256> kTable = [] {
        std::array<std::string, 256> table;
        std::array<bool, 256> direct{};
        auto mark = [&](int from, int to) {
            for (int b = from; b <= to; ++b) direct[static_cast<std::size_t>(b)] = true;
        };
        mark('!', '~');
        mark(161, 172);
        mark(174, 255);

        int shifted = 0;
        for (int b = 0; b < 256; ++b) {
            int codepoint = direct[static_cast<std::size_t>(b)] ? b : 256 + shifted++;
            table[static_cast<std::size_t>(b)] = EncodeUtf8(codepoint);
        }
        return table;
    }();
    return kTable;
}

std::vector<std::string> BpeTokenizer::PreTokenize(const std::string& text) {
    std::vector<std::string> words;
    const std::size_t n = text.size();
    std::size_t i = 0;

    while (i < n) {
        if (std::size_t len = ContractionLength(text, i)) {
            words.push_back(text.substr(i, len));
            i += len;
            continue;
        }

        const CharClass cls = Classify(static_cast<unsigned char>(text[i]));
        if (cls != CharClass::Space) {
            std::size_t end = RunEnd(text, i, cls);
            words.push_back(text.substr(i, end - i));
            i = end;
            continue;
        }

        // " word": a single space joins the following run.
        if (text[i] == ' ' && i + 1 < n) {
            const CharClass next = Classify(static_cast<unsigned char>(text[i + 1]));
            if (next != CharClass::Space) {
                std::size_t end = RunEnd(text, i + 1, next);
                words.push_back(text.substr(i, end - i));
                i = end;
                continue;
            }
        }

        // \s+(?!\S) then \s+
        std::size_t end = RunEnd(text, i, CharClass::Space);
        if (end < n && end - i > 1) --end;
        words.push_back(text.substr(i, end - i));
        i = end;
    }
    return words;
}

BpeTokenizer::BpeTokenizer(const nlohmann::json& tokenizerJson, std::string name)
    : m_name(std::move(name)) {
    if (!tokenizerJson.contains("model") || !tokenizerJson["model"].is_object()) {
        throw std::runtime_error("tokenizer.json has no model section");
    }
    const auto& model = tokenizerJson["model"];
    if (!model.contains("vocab") || !model["vocab"].is_object()) {
        throw std::runtime_error("tokenizer.json model has no vocab");
    }

    for (const auto& item : model["vocab"].items()) {
        int id = item.value().get<int>();
        m_vocab[item.key()] = id;
        m_idToToken[id] = item.key();
    }

    if (model.contains("merges") && model["merges"].is_array()) {
        int rank = 0;
        for (const auto& merge : model["merges"]) {
            if (merge.is_string()) {
                m_ranks[merge.get<std::string>()] = rank++;
            } else if (merge.is_array() && merge.size() == 2) {
                m_ranks[merge[0].get<std::string>() + " " + merge[1].get<std::string>()] = rank++;
            }
        }
    }

    if (tokenizerJson.contains("added_tokens") && tokenizerJson["added_tokens"].is_array()) {
        for (const auto& token : tokenizerJson["added_tokens"]) {
            if (!token.contains("content") || !token.contains("id")) continue;
            std::string content = token["content"].get<std::string>();
            int id = token["id"].get<int>();
            if (content.empty()) continue;
            m_added.emplace_back(content, id);
            m_addedById[id] = content;
        }
        std::sort(m_added.begin(), m_added.end(),
                  [](const auto& a, const auto& b) { return a.first.size() > b.first.size(); });
    }

    const auto& encoder = ByteEncoder();
    for (std::size_t b = 0; b < encoder.size(); ++b) {
        m_byteDecoder[encoder[b]] = static_cast<unsigned char>(b);
    }
}

std::shared_ptr<BpeTokenizer> BpeTokenizer::LoadFromFile(const std::string& path, const std::string& name) {
    std::ifstream f(path);
    if (!f) {
        std::cerr << "[BpeTokenizer] Cannot open " << path << std::endl;
        return nullptr;
    }
    try {
        nlohmann::json j;
        f >> j;
        auto tokenizer = std::make_shared<BpeTokenizer>(j, name);
        std::cout << "[BpeTokenizer] Loaded " << name << " (vocab=" << tokenizer->m_vocab.size()
                  << ", merges=" << tokenizer->m_ranks.size() << ")" << std::endl;
        return tokenizer;
    } catch (const std::exception& e) {
        std::cerr << "[BpeTokenizer] Error reading " << path << ": " << e.what() << std::endl;
    }
    return nullptr;
}

std::vector<std::string> BpeTokenizer::bpe(const std::string& token) const {
    if (m_vocab.count(token)) return {token};

    std::vector<std::string> word;
    for (std::size_t i = 0; i < token.size();) {
        std::size_t len = std::min(Utf8Length(static_cast<unsigned char>(token[i])), token.size() - i);
        word.push_back(token.substr(i, len));
        i += len;
    }

    while (word.size() > 1) {
        int bestRank = INT_MAX;
        std::size_t bestIndex = 0;
        for (std::size_t i = 0; i + 1 < word.size(); ++i) {
            auto it = m_ranks.find(word[i] + " " + word[i + 1]);
            if (it != m_ranks.end() && it->second < bestRank) {
                bestRank = it->second;
                bestIndex = i;
            }
        }
        if (bestRank == INT_MAX) break;

        // Merge every occurrence of the best pair.
        const std::string first = word[bestIndex];
        const std::string second = word[bestIndex + 1];
        std::vector<std::string> merged;
        for (std::size_t i = 0; i < word.size();) {
            if (i + 1 < word.size() && word[i] == first && word[i + 1] == second) {
                merged.push_back(first + second);
                i += 2;
            } else {
                merged.push_back(word[i]);
                ++i;
            }
        }
        word = std::move(merged);
    }
    return word;
}

void BpeTokenizer::encodeSegment(const std::string& text, std::vector<int>& ids) const {
    const auto& encoder = ByteEncoder();
    for (const auto& raw : PreTokenize(text)) {
        std::string mapped;
        for (unsigned char c : raw) mapped += encoder[c];
        for (const auto& piece : bpe(mapped)) {
            auto it = m_vocab.find(piece);
            if (it != m_vocab.end()) {
                ids.push_back(it->second);
            } else {
                std::cerr << "[BpeTokenizer] Token not in vocab: \"" << piece << "\"" << std::endl;
            }
        }
    }
}

std::vector<int> BpeTokenizer::encode(const std::string& text) const {
    std::vector<int> ids;
    std::size_t segmentStart = 0;
    std::size_t i = 0;
    while (i < text.size()) {
        bool matched = false;
        for (const auto& added : m_added) {
            if (text.compare(i, added.first.size(), added.first) == 0) {
                encodeSegment(text.substr(segmentStart, i - segmentStart), ids);
                ids.push_back(added.second);
                i += added.first.size();
                segmentStart = i;
                matched = true;
                break;
            }
        }
        if (!matched) ++i;
    }
    encodeSegment(text.substr(segmentStart), ids);
    return ids;
}

std::string BpeTokenizer::decode(const std::vector<int>& ids) const {
    std::string out;
    for (int id : ids) {
        auto added = m_addedById.find(id);
        if (added != m_addedById.end()) {
            out += added->second;
            continue;
        }
        auto it = m_idToToken.find(id);
        if (it == m_idToToken.end()) {
            std::cerr << "[BpeTokenizer] Unknown token id " << id << std::endl;
            continue;
        }
        const std::string& token = it->second;
        for (std::size_t i = 0; i < token.size();) {
            std::size_t len = std::min(Utf8Length(static_cast<unsigned char>(token[i])), token.size() - i);
            auto byte = m_byteDecoder.find(token.substr(i, len));
            if (byte != m_byteDecoder.end()) out.push_back(static_cast<char>(byte->second));
            i += len;
        }
    }
    return out;
}

} // namespace provenance::infrastructure
