/**
 * @file NumberParsing.hpp
 * @brief Numeric normalisation shared by the fact checker and the token comparator.
 */

#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <vector>
#include "domain/text/WordTokenizer.hpp"

namespace provenance::domain::text {

/**
 * @struct NumberMention
 * @brief A number found in a text, either as digits or spelled out.
 */
struct NumberMention {
    double value = 0.0;
    std::size_t firstToken = 0;   ///< Position of the first word in the whitespace split.
    std::size_t lastToken = 0;
    std::size_t start = 0;        ///< Character span in the source text.
    std::size_t end = 0;
    std::string surface;          ///< Text as written.
    bool spelledOut = false;
};

/**
 * @brief Parses a single word as a number.
 *
 * Strips bullets, trailing , . - ; : ! ? ) ] and quotes, leading currency
 * symbols ($, €, £) and opening brackets, then removes thousands separators.
 * A trailing % divides the value by 100.
 */
std::optional<double> ParseNumericToken(const std::string& word);

/** @brief Removes only the trailing sentence punctuation, keeping $ and %. */
std::string TrimSentencePunctuation(const std::string& word);

/** @brief Numeric equality with a relative tolerance of 1e-9. */
bool NumbersEqual(double a, double b);

/**
 * @brief Converts a spelled-out number ("two hundred and five") to its value.
 * @return std::nullopt when a word is not a number word.
 */
std::optional<double> WordsToNumber(const std::vector<std::string>& words);

/**
 * @brief Finds every number in @p tokens (a raw whitespace split of @p text).
 *
 * Digit tokens yield their value; a digit token followed by "percent" also yields
 * the scaled value. Runs of number words ("ten percent", "fifty thousand") are
 * converted, with "and"/"plus" accepted inside a run.
 */
std::vector<NumberMention> FindNumberMentions(const std::vector<WordToken>& tokens, const std::string& text);

} // namespace provenance::domain::text
