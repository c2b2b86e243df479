/**
 * @file EvidenceVerifier.hpp
 * @brief Runs the evidence analyses on a model answer and gathers a review.
 */

#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "application/verification/NotFoundClassifier.hpp"
#include "application/verification/NumberFactChecker.hpp"
#include "application/verification/SourceAttributor.hpp"
#include "application/verification/TokenComparator.hpp"
#include "domain/EvidenceVerdicts.hpp"
#include "domain/LanguageModel.hpp"
#include "domain/ResponseRecord.hpp"

namespace provenance::application::verification {

struct VerificationSettings {
    int factContextRadius = 10;
    SourceAttributorOptions sources;
    double notFoundThreshold = 0.25;
};

struct ReviewOptions {
    bool factCheck = true;
    bool sourceReview = true;
    bool comparisonStats = true;
    bool classifyNotFound = true;
    NotFoundOptions notFound;
    std::vector<std::string> keyPoints;   ///< Optional segmentation of the answer.
};

/**
 * @struct EvidenceReview
 * @brief Everything the verifier found about one answer.
 */
struct EvidenceReview {
    std::vector<domain::FactCheckEntry> factCheck;
    std::vector<domain::SourceReviewEntry> sourceReview;
    domain::ComparisonStats comparisonStats;
    domain::NotFoundVerdict notFound;
    nlohmann::json report;   ///< status, errors, warnings and per-analysis checks.
};

/**
 * @class EvidenceVerifier
 * @brief Facade over the four analyses. Never throws: an analysis that fails
 *        is logged, reported as "error" and leaves its conservative default.
 */
class EvidenceVerifier {
public:
    explicit EvidenceVerifier(VerificationSettings settings = {},
                              std::shared_ptr<domain::LanguageModel> model = nullptr);

    EvidenceReview review(const domain::ResponseRecord& record, const ReviewOptions& options = {}) const;

    std::vector<EvidenceReview> reviewAll(const std::vector<domain::ResponseRecord>& records,
                                          const ReviewOptions& options = {}) const;

private:
    void AddError(nlohmann::json& report, const std::string& message) const;
    void AddWarning(nlohmann::json& report, const std::string& message) const;
    void SetCheck(nlohmann::json& report, const std::string& key, const std::string& status) const;

    NumberFactChecker m_facts;
    SourceAttributor m_sources;
    TokenComparator m_comparator;
    NotFoundClassifier m_notFound;
};

} // namespace provenance::application::verification
