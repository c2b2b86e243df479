/**
 * @file TokenComparator.cpp
 * @brief Implementation of TokenComparator.
 */

#include "application/verification/TokenComparator.hpp"
#include "domain/text/NumberParsing.hpp"
#include "domain/text/WordTokenizer.hpp"
#include <algorithm>
#include <cstdio>
#include <optional>

namespace provenance::application::verification {

using domain::text::WordTokenizer;
using domain::text::WordTokenizerOptions;

namespace {

WordTokenizerOptions ComparisonOptions() {
    WordTokenizerOptions options;
    options.lowerCase = true;
    options.removePunctuation = false;
    options.removeStopWords = true;
    options.removeNumbers = false;
    options.oneLetterRemoval = true;
    return options;
}

void RemoveSequence(std::string& s, const std::string& what) {
    std::size_t pos;
    while ((pos = s.find(what)) != std::string::npos) {
        s.erase(pos, what.size());
    }
}

std::string FormatPercent(double ratio) {
    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%.1f%%", ratio * 100.0);
    return buffer;
}

} // namespace

std::string TokenComparator::CleanToken(const std::string& token) {
    std::string out = token;
    if (!out.empty() && out.back() == '.') out.pop_back();

    RemoveSequence(out, "\xE2\x80\xA2");   // bullet
    RemoveSequence(out, "\xE2\x80\x9C");   // left double quote
    RemoveSequence(out, "\xE2\x80\x9D");   // right double quote
    out.erase(std::remove_if(out.begin(), out.end(), [](char c) {
                  switch (c) {
                      case ',': case '(': case ')': case ';': case '$': case '"':
                      case '\n': case '\r': case '\t':
                          return true;
                      default:
                          return false;
                  }
              }),
              out.end());
    return out;
}

domain::ComparisonStats TokenComparator::compare(const std::string& response,
                                                 const std::string& evidence,
                                                 const std::vector<std::string>& keyPoints) const {
    const WordTokenizer tokenizer(ComparisonOptions());

    std::vector<std::string> evidenceWords;
    for (const auto& word : tokenizer.words(evidence)) {
        evidenceWords.push_back(CleanToken(word));
    }

    // Built on the first numeric answer word.
    std::optional<std::vector<domain::text::NumberMention>> evidenceNumbers;

    const std::vector<std::string> segments = keyPoints.empty() ? std::vector<std::string>{response} : keyPoints;

    domain::ComparisonStats stats;
    std::size_t totalTokens = 0;

    for (const auto& keyPoint : segments) {
        const auto words = tokenizer.words(keyPoint);
        if (words.empty()) continue;
        totalTokens += words.size();

        std::size_t confirmedHere = 0;
        for (const auto& raw : words) {
            const std::string tok = CleanToken(raw);
            const auto number = domain::text::ParseNumericToken(tok);
            bool matched = false;

            if (number) {
                if (!evidenceNumbers) {
                    evidenceNumbers = domain::text::FindNumberMentions(WordTokenizer::SplitOnWhitespace(evidence),
                                                                       evidence);
                }
                matched = std::any_of(evidenceNumbers->begin(), evidenceNumbers->end(),
                                      [&](const domain::text::NumberMention& m) {
                                          return domain::text::NumbersEqual(m.value, *number);
                                      });
            }

            if (!matched) {
                for (const auto& ev : evidenceWords) {
                    if (tok == ev) {
                        matched = true;
                        break;
                    }
                    if (number) {
                        auto evNumber = domain::text::ParseNumericToken(ev);
                        if (evNumber && domain::text::NumbersEqual(*evNumber, *number)) {
                            matched = true;
                            break;
                        }
                    }
                }
            }

            if (matched) {
                stats.confirmedWords.push_back(tok);
                ++confirmedHere;
            } else if (std::find(stats.unconfirmedWords.begin(), stats.unconfirmedWords.end(), tok) ==
                       stats.unconfirmedWords.end()) {
                stats.unconfirmedWords.push_back(tok);
            }
        }

        domain::KeyPointMatch kp;
        kp.keyPoint = keyPoint;
        kp.entry = static_cast<int>(stats.keyPointList.size());
        kp.verifiedMatch = static_cast<double>(confirmedHere) / static_cast<double>(words.size());
        stats.keyPointList.push_back(std::move(kp));
    }

    if (totalTokens > 0) {
        double ratio = static_cast<double>(stats.confirmedWords.size()) / static_cast<double>(totalTokens);
        stats.verifiedTokenMatchRatio = std::min(ratio, 1.0);
    }
    stats.percentDisplay = FormatPercent(stats.verifiedTokenMatchRatio);
    return stats;
}

} // namespace provenance::application::verification
