/**
 * @file WhitespaceTokenizer.cpp
 * @brief Implementation of WhitespaceTokenizer.
 */

#include "infrastructure/WhitespaceTokenizer.hpp"
#include <cctype>
#include <iostream>

namespace provenance::infrastructure {

namespace {
bool IsSpace(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}
}

std::vector<std::string> WhitespaceTokenizer::Split(const std::string& text) {
    std::vector<std::string> pieces;
    std::size_t i = 0;
    const std::size_t n = text.size();

    if (i < n && IsSpace(text[i])) {
        while (i < n && IsSpace(text[i])) ++i;
        pieces.push_back(text.substr(0, i));
    }
    while (i < n) {
        std::size_t start = i;
        while (i < n && !IsSpace(text[i])) ++i;
        while (i < n && IsSpace(text[i])) ++i;
        pieces.push_back(text.substr(start, i - start));
    }
    return pieces;
}

int WhitespaceTokenizer::count(const std::string& text) const {
    return static_cast<int>(Split(text).size());
}

std::vector<int> WhitespaceTokenizer::encode(const std::string& text) const {
    auto pieces = Split(text);
    std::vector<int> ids;
    ids.reserve(pieces.size());

    std::lock_guard<std::mutex> lock(m_mutex);
    for (auto& piece : pieces) {
        auto it = m_ids.find(piece);
        if (it == m_ids.end()) {
            int id = static_cast<int>(m_pieces.size());
            it = m_ids.emplace(piece, id).first;
            m_pieces.push_back(std::move(piece));
        }
        ids.push_back(it->second);
    }
    return ids;
}

std::string WhitespaceTokenizer::decode(const std::vector<int>& ids) const {
    std::string text;
    std::lock_guard<std::mutex> lock(m_mutex);
    for (int id : ids) {
        if (id < 0 || static_cast<std::size_t>(id) >= m_pieces.size()) {
            std::cerr << "[WhitespaceTokenizer] Unknown token id " << id << std::endl;
            continue;
        }
        text += m_pieces[static_cast<std::size_t>(id)];
    }
    return text;
}

} // namespace provenance::infrastructure
