/**
 * @file NotFoundClassifier.hpp
 * @brief Decides whether a model answer amounts to "the context does not say".
 */

#pragma once
#include <memory>
#include <optional>
#include <string>
#include "domain/EvidenceVerdicts.hpp"
#include "domain/LanguageModel.hpp"

namespace provenance::application::verification {

struct NotFoundOptions {
    bool parseResponse = true;
    bool evidenceMatch = true;
    bool askTheModel = false;
};

/**
 * @class NotFoundClassifier
 * @brief Runs up to three heuristics; each answers true for "not found".
 *
 * Heuristics that ran and disagree yield Undetermined. An answer that is empty
 * after cleaning is always NotFound.
 */
class NotFoundClassifier {
public:
    /**
     * @param model Used only by the ask-the-model heuristic; may be null.
     * @param threshold Match ratio below which the evidence-match heuristic says "not found".
     */
    explicit NotFoundClassifier(std::shared_ptr<domain::LanguageModel> model = nullptr, double threshold = 0.25);

    /**
     * @param verifiedTokenMatchRatio Ratio from the TokenComparator, required by
     *        the evidence-match heuristic.
     */
    domain::NotFoundVerdict classify(const std::string& response,
                                     std::optional<double> verifiedTokenMatchRatio,
                                     const NotFoundOptions& options) const;

    /** @brief Removes ; ! ? ( ) , . tabs, line breaks and bullets, then trims and lowercases. */
    static std::string CleanResponse(const std::string& response);

    /** @brief True when the cleaned answer is empty or starts with "not found". */
    static bool ParseResponse(const std::string& response);

    /** @brief True when too few answer words are in the evidence. Plain yes/no answers are exempt. */
    bool evidenceMatch(const std::string& response, double verifiedTokenMatchRatio) const;

    /** @brief Asks the model to classify @p response. std::nullopt when no model answered. */
    std::optional<bool> askTheModel(const std::string& response) const;

private:
    std::shared_ptr<domain::LanguageModel> m_model;
    double m_threshold;
};

} // namespace provenance::application::verification
