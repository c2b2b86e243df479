/**
 * @file NumberFactChecker.cpp
 * @brief Implementation of NumberFactChecker.
 */

#include "application/verification/NumberFactChecker.hpp"
#include "domain/text/NumberParsing.hpp"
#include "domain/text/WordTokenizer.hpp"
#include <algorithm>

namespace provenance::application::verification {

using domain::text::WordToken;
using domain::text::WordTokenizer;

namespace {

const domain::BatchMetadataEntry* LocateEntry(const std::vector<domain::BatchMetadataEntry>& metadata,
                                              std::size_t offset) {
    for (const auto& entry : metadata) {
        if (entry.contains(offset)) return &entry;
    }
    return metadata.empty() ? nullptr : &metadata.back();
}

std::string ContextWindow(const std::vector<WordToken>& tokens, std::size_t center, int radius) {
    const std::size_t r = static_cast<std::size_t>(std::max(radius, 0));
    const std::size_t first = center > r ? center - r : 0;
    const std::size_t last = std::min(tokens.size(), center + r);

    std::string joined;
    for (std::size_t i = first; i < last; ++i) {
        if (!joined.empty()) joined += " ";
        joined += tokens[i].text;
    }
    joined.erase(std::remove_if(joined.begin(), joined.end(), [](char c) { return c == '\n' || c == '\r'; }),
                 joined.end());
    return " ... " + joined + " ... ";
}

} // namespace

NumberFactChecker::NumberFactChecker(int contextRadius) : m_contextRadius(contextRadius) {}

std::vector<domain::FactCheckEntry> NumberFactChecker::check(
    const std::string& response,
    const std::string& evidence,
    const std::vector<domain::BatchMetadataEntry>& metadata) const {

    std::vector<domain::FactCheckEntry> entries;

    const auto responseTokens = WordTokenizer::SplitOnWhitespace(response);
    const auto evidenceTokens = WordTokenizer::SplitOnWhitespace(evidence);
    const auto mentions = domain::text::FindNumberMentions(evidenceTokens, evidence);

    for (const auto& tok : responseTokens) {
        auto value = domain::text::ParseNumericToken(tok.text);
        if (!value) continue;

        domain::FactCheckEntry entry;
        entry.fact = domain::text::TrimSentencePunctuation(tok.text);
        std::size_t pos = tok.text.find(entry.fact);
        entry.responseStart = tok.start + (pos == std::string::npos ? 0 : pos);
        entry.responseStop = entry.responseStart + entry.fact.size();

        auto match = std::find_if(mentions.begin(), mentions.end(), [&](const domain::text::NumberMention& m) {
            return domain::text::NumbersEqual(m.value, *value);
        });

        if (match != mentions.end()) {
            entry.status = domain::FactStatus::Confirmed;
            entry.text = ContextWindow(evidenceTokens, match->firstToken, m_contextRadius);
            if (const auto* source = LocateEntry(metadata, match->start)) {
                entry.pageNum = source->pageNum;
                entry.source = source->sourceName;
            }
        }
        entries.push_back(std::move(entry));
    }

    return entries;
}

std::string NumberFactChecker::Markup(const std::string& response, const std::vector<domain::FactCheckEntry>& entries) {
    std::vector<const domain::FactCheckEntry*> ordered;
    for (const auto& e : entries) {
        if (e.responseStop > e.responseStart && e.responseStop <= response.size()) ordered.push_back(&e);
    }
    std::sort(ordered.begin(), ordered.end(), [](const auto* a, const auto* b) {
        return a->responseStart < b->responseStart;
    });

    std::string out;
    std::size_t cursor = 0;
    for (const auto* e : ordered) {
        if (e->responseStart < cursor) continue;
        out += response.substr(cursor, e->responseStart - cursor);
        const std::string fact = response.substr(e->responseStart, e->responseStop - e->responseStart);
        if (e->status == domain::FactStatus::Confirmed) {
            out += "<b>" + fact + "</b>";
        } else {
            out += "<font color=red>" + fact + "</font>";
        }
        cursor = e->responseStop;
    }
    out += response.substr(cursor);
    return out;
}

} // namespace provenance::application::verification
