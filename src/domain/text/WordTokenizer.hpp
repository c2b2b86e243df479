/**
 * @file WordTokenizer.hpp
 * @brief Whole-word tokenizer with character offsets, used by the evidence analyses.
 */

#pragma once
#include <cstddef>
#include <string>
#include <vector>

namespace provenance::domain::text {

/**
 * @struct WordToken
 * @brief A whitespace-delimited word and its location in the source text.
 *
 * @c start / @c end always refer to the raw word, even when @c text was cleaned.
 */
struct WordToken {
    std::string text;
    std::size_t start = 0;
    std::size_t end = 0;
    std::size_t position = 0;   ///< Index of the raw word in the whitespace split.
};

struct WordTokenizerOptions {
    bool lowerCase = true;
    bool removePunctuation = true;
    bool removeStopWords = true;
    bool removeNumbers = true;
    bool oneLetterRemoval = false;
};

/**
 * @class WordTokenizer
 * @brief Splits on whitespace, then applies the selected cleaning filters.
 *
 * The offset index is built once per call; callers that need several views of
 * the same text should tokenize once and filter the result.
 */
class WordTokenizer {
public:
    explicit WordTokenizer(WordTokenizerOptions options = {});

    std::vector<WordToken> tokenize(const std::string& text) const;

    /** @brief Same as tokenize() but returns the words only. */
    std::vector<std::string> words(const std::string& text) const;

    /** @brief Raw whitespace split with offsets, no filtering. */
    static std::vector<WordToken> SplitOnWhitespace(const std::string& text);

    /** @brief Removes - , ' / : . ? % [ ] characters anywhere in the word. */
    static std::string StripPunctuation(const std::string& word);

    static std::string ToLower(const std::string& word);

    /** @brief Case-insensitive check against the stop word list. */
    static bool IsStopWord(const std::string& word);

private:
    WordTokenizerOptions m_options;
};

} // namespace provenance::domain::text
