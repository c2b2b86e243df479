/**
 * @file SourceAttributor.cpp
 * @brief Implementation of SourceAttributor.
 */

#include "application/verification/SourceAttributor.hpp"
#include "domain/text/WordTokenizer.hpp"
#include <algorithm>

namespace provenance::application::verification {

using domain::text::WordToken;
using domain::text::WordTokenizer;
using domain::text::WordTokenizerOptions;

namespace {

struct Candidate {
    double score = 0.0;
    std::size_t entryIndex = 0;
    std::vector<std::size_t> matches;     ///< Indices into spanTokens.
    std::vector<WordToken> spanTokens;
};

std::string ReplaceLineBreaks(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        if (c == '\n' || c == '\r') {
            out += " ... ";
        } else {
            out.push_back(c);
        }
    }
    return out;
}

} // namespace

SourceAttributor::SourceAttributor(SourceAttributorOptions options) : m_options(options) {}

std::vector<domain::SourceReviewEntry> SourceAttributor::review(
    const std::string& response,
    const std::string& evidence,
    const std::vector<domain::BatchMetadataEntry>& metadata) const {

    WordTokenizerOptions responseOptions;
    responseOptions.lowerCase = false;
    responseOptions.removeNumbers = false;
    responseOptions.oneLetterRemoval = true;
    const auto responseWords = WordTokenizer(responseOptions).words(response);
    if (responseWords.empty()) return {};

    WordTokenizerOptions evidenceOptions;
    evidenceOptions.lowerCase = false;
    evidenceOptions.removeStopWords = false;
    evidenceOptions.removeNumbers = false;
    const auto evidenceTokens = WordTokenizer(evidenceOptions).tokenize(evidence);

    std::vector<Candidate> candidates;
    for (std::size_t x = 0; x < metadata.size(); ++x) {
        const auto& entry = metadata[x];
        Candidate candidate;
        candidate.entryIndex = x;
        for (const auto& tok : evidenceTokens) {
            if (tok.start >= entry.evidenceStartChar && tok.start < entry.evidenceStopChar) {
                candidate.spanTokens.push_back(tok);
            }
        }

        for (const auto& word : responseWords) {
            const std::string lowered = WordTokenizer::ToLower(word);
            for (std::size_t i = 0; i < candidate.spanTokens.size(); ++i) {
                if (WordTokenizer::ToLower(candidate.spanTokens[i].text) == lowered) {
                    candidate.matches.push_back(i);
                    break;
                }
            }
        }

        candidate.score = static_cast<double>(candidate.matches.size()) / static_cast<double>(responseWords.size());
        if (candidate.score > m_options.minThreshold ||
            static_cast<int>(candidate.matches.size()) > m_options.minMatchCount) {
            candidates.push_back(std::move(candidate));
        }
    }

    std::stable_sort(candidates.begin(), candidates.end(),
                     [](const Candidate& a, const Candidate& b) { return a.score > b.score; });

    std::vector<domain::SourceReviewEntry> results;
    std::vector<std::string> seenSnippets;
    const std::size_t top = std::min(candidates.size(), static_cast<std::size_t>(std::max(m_options.maxCandidates, 0)));
    const std::size_t radius = static_cast<std::size_t>(std::max(m_options.snippetRadius, 0));

    for (std::size_t m = 0; m < top; ++m) {
        const auto& candidate = candidates[m];

        std::vector<std::size_t> sorted = candidate.matches;
        std::sort(sorted.begin(), sorted.end());
        std::size_t median = 0;
        if (sorted.size() % 2 == 1) {
            median = sorted[sorted.size() / 2];
        } else if (!sorted.empty()) {
            median = (sorted[sorted.size() / 2 - 1] + sorted[sorted.size() / 2]) / 2;
        }

        const std::size_t first = median >= radius ? median - radius : 0;
        const std::size_t last = std::min(candidate.spanTokens.size(), median + radius);
        std::string snippet;
        if (last > first) {
            const std::size_t from = candidate.spanTokens[first].start;
            const std::size_t to = candidate.spanTokens[last - 1].end;
            snippet = ReplaceLineBreaks(evidence.substr(from, to - from));
        }

        if (std::find(seenSnippets.begin(), seenSnippets.end(), snippet) == seenSnippets.end()) {
            seenSnippets.push_back(snippet);
            const auto& entry = metadata[candidate.entryIndex];
            domain::SourceReviewEntry out;
            out.text = snippet;
            out.matchScore = candidate.score;
            out.source = entry.sourceName;
            out.pageNum = entry.pageNum;
            out.docId = entry.docId;
            out.blockId = entry.blockId;
            results.push_back(std::move(out));
        }

        if (candidate.score > m_options.conclusiveThreshold) break;
    }

    return results;
}

} // namespace provenance::application::verification
