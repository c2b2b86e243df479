/**
 * @file NotFoundClassifier.cpp
 * @brief Implementation of NotFoundClassifier.
 */

#include "application/verification/NotFoundClassifier.hpp"
#include "domain/text/WordTokenizer.hpp"
#include "infrastructure/PromptCatalog.hpp"
#include <algorithm>
#include <cctype>
#include <iostream>
#include <vector>

namespace provenance::application::verification {

namespace {

bool StartsWith(const std::string& s, const std::string& prefix) {
    return s.compare(0, prefix.size(), prefix) == 0;
}

} // namespace

NotFoundClassifier::NotFoundClassifier(std::shared_ptr<domain::LanguageModel> model, double threshold)
    : m_model(std::move(model)), m_threshold(threshold) {}

std::string NotFoundClassifier::CleanResponse(const std::string& response) {
    std::string out;
    std::size_t i = 0;
    while (i < response.size()) {
        if (response.compare(i, 3, "\xE2\x80\xA2") == 0) {
            i += 3;
            continue;
        }
        char c = response[i++];
        switch (c) {
            case ';': case '!': case '?': case '(': case ')': case ',': case '.':
            case '\n': case '\r': case '\t':
                break;
            default:
                out.push_back(c);
        }
    }

    auto notSpace = [](unsigned char c) { return !std::isspace(c); };
    out.erase(out.begin(), std::find_if(out.begin(), out.end(), notSpace));
    out.erase(std::find_if(out.rbegin(), out.rend(), notSpace).base(), out.end());
    return domain::text::WordTokenizer::ToLower(out);
}

bool NotFoundClassifier::ParseResponse(const std::string& response) {
    const std::string cleaned = CleanResponse(response);
    return cleaned.empty() || StartsWith(cleaned, "not found");
}

bool NotFoundClassifier::evidenceMatch(const std::string& response, double verifiedTokenMatchRatio) const {
    const std::string cleaned = CleanResponse(response);
    if (cleaned == "yes" || cleaned == "no") return false;
    return verifiedTokenMatchRatio < m_threshold;
}

std::optional<bool> NotFoundClassifier::askTheModel(const std::string& response) const {
    if (!m_model) {
        std::cerr << "[NotFoundClassifier] No language model configured, skipping ask-the-model." << std::endl;
        return std::nullopt;
    }

    const auto prompt = infrastructure::PromptCatalog::GetNotFoundClassifierPrompt();
    domain::LanguageModel::SamplingParams params;
    params.temperature = 0.0;
    params.maxOutputTokens = 10;

    auto reply = m_model->infer(prompt.instruction, prompt.renderContext(response), params);
    if (!reply) {
        std::cerr << "[NotFoundClassifier] Model " << m_model->getCurrentModel()
                  << " did not answer, ask-the-model not evaluated." << std::endl;
        return std::nullopt;
    }

    const std::string cleaned = CleanResponse(reply->llmResponse);
    if (StartsWith(cleaned, "yes")) return true;
    // "no" and inconclusive replies both count as a valid answer.
    return false;
}

domain::NotFoundVerdict NotFoundClassifier::classify(const std::string& response,
                                                     std::optional<double> verifiedTokenMatchRatio,
                                                     const NotFoundOptions& options) const {
    domain::NotFoundVerdict verdict;

    if (options.parseResponse) {
        verdict.parseResponse = ParseResponse(response);
    }
    if (options.evidenceMatch) {
        if (verifiedTokenMatchRatio) {
            verdict.evidenceMatch = evidenceMatch(response, *verifiedTokenMatchRatio);
        } else {
            std::cerr << "[NotFoundClassifier] No token match ratio supplied, evidence-match skipped." << std::endl;
        }
    }
    if (options.askTheModel) {
        verdict.askTheModel = askTheModel(response);
    }

    if (CleanResponse(response).empty()) {
        verdict.classification = domain::NotFoundClassification::NotFound;
        return verdict;
    }

    std::vector<bool> votes;
    for (const auto& v : {verdict.parseResponse, verdict.evidenceMatch, verdict.askTheModel}) {
        if (v) votes.push_back(*v);
    }

    if (votes.empty()) {
        verdict.classification = domain::NotFoundClassification::NotEvaluated;
    } else if (std::all_of(votes.begin(), votes.end(), [](bool b) { return b; })) {
        verdict.classification = domain::NotFoundClassification::NotFound;
    } else if (std::none_of(votes.begin(), votes.end(), [](bool b) { return b; })) {
        verdict.classification = domain::NotFoundClassification::Found;
    } else {
        verdict.classification = domain::NotFoundClassification::Undetermined;
    }
    return verdict;
}

} // namespace provenance::application::verification
