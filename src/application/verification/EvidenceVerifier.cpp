/**
 * @file EvidenceVerifier.cpp
 * @brief Implementation of EvidenceVerifier.
 */

#include "application/verification/EvidenceVerifier.hpp"

#include <algorithm>
#include <exception>
#include <iostream>

namespace provenance::application::verification {

EvidenceVerifier::EvidenceVerifier(VerificationSettings settings, std::shared_ptr<domain::LanguageModel> model)
    : m_facts(settings.factContextRadius),
      m_sources(settings.sources),
      m_notFound(std::move(model), settings.notFoundThreshold) {}

void EvidenceVerifier::AddError(nlohmann::json& report, const std::string& message) const {
    report["errors"].push_back(message);
}

void EvidenceVerifier::AddWarning(nlohmann::json& report, const std::string& message) const {
    report["warnings"].push_back(message);
}

void EvidenceVerifier::SetCheck(nlohmann::json& report, const std::string& key, const std::string& status) const {
    report["checks"][key] = status;
}

EvidenceReview EvidenceVerifier::review(const domain::ResponseRecord& record, const ReviewOptions& options) const {
    EvidenceReview result;
    nlohmann::json report = {
        {"status", "pass"},
        {"errors", nlohmann::json::array()},
        {"warnings", nlohmann::json::array()},
        {"checks", nlohmann::json::object()}
    };

    // A) Numbers
    if (options.factCheck) {
        try {
            result.factCheck = m_facts.check(record.llmResponse, record.evidence, record.evidenceMetadata);
            auto unconfirmed = std::count_if(result.factCheck.begin(), result.factCheck.end(), [](const auto& e) {
                return e.status == domain::FactStatus::NotConfirmed;
            });
            if (unconfirmed > 0) {
                AddWarning(report, std::to_string(unconfirmed) + " number(s) not found in the evidence.");
                SetCheck(report, "fact_check", "warning");
            } else {
                SetCheck(report, "fact_check", "ok");
            }
        } catch (const std::exception& e) {
            std::cerr << "[EvidenceVerifier] Fact check failed: " << e.what() << std::endl;
            result.factCheck.clear();
            AddError(report, std::string("Fact check failed: ") + e.what());
            SetCheck(report, "fact_check", "error");
        }
    } else {
        SetCheck(report, "fact_check", "skipped");
    }

    // B) Sources
    if (options.sourceReview) {
        try {
            result.sourceReview = m_sources.review(record.llmResponse, record.evidence, record.evidenceMetadata);
            if (result.sourceReview.empty()) {
                AddWarning(report, "No evidence span matches the response.");
                SetCheck(report, "source_review", "warning");
            } else {
                SetCheck(report, "source_review", "ok");
            }
        } catch (const std::exception& e) {
            std::cerr << "[EvidenceVerifier] Source review failed: " << e.what() << std::endl;
            result.sourceReview.clear();
            AddError(report, std::string("Source review failed: ") + e.what());
            SetCheck(report, "source_review", "error");
        }
    } else {
        SetCheck(report, "source_review", "skipped");
    }

    // C) Token comparison. The evidence-match heuristic needs its ratio.
    std::optional<double> ratio;
    const bool needStats = options.comparisonStats || (options.classifyNotFound && options.notFound.evidenceMatch);
    if (needStats) {
        try {
            result.comparisonStats = m_comparator.compare(record.llmResponse, record.evidence, options.keyPoints);
            ratio = result.comparisonStats.verifiedTokenMatchRatio;
            SetCheck(report, "comparison_stats", "ok");
        } catch (const std::exception& e) {
            std::cerr << "[EvidenceVerifier] Token comparison failed: " << e.what() << std::endl;
            result.comparisonStats = domain::ComparisonStats{};
            AddError(report, std::string("Token comparison failed: ") + e.what());
            SetCheck(report, "comparison_stats", "error");
        }
    } else {
        SetCheck(report, "comparison_stats", "skipped");
    }

    // D) Not found
    if (options.classifyNotFound) {
        try {
            result.notFound = m_notFound.classify(record.llmResponse, ratio, options.notFound);
            switch (result.notFound.classification) {
                case domain::NotFoundClassification::NotFound:
                    AddWarning(report, "Response classified as 'not found'.");
                    SetCheck(report, "not_found", "warning");
                    break;
                case domain::NotFoundClassification::Undetermined:
                    AddWarning(report, "Not-found heuristics disagree.");
                    SetCheck(report, "not_found", "warning");
                    break;
                default:
                    SetCheck(report, "not_found", "ok");
            }
        } catch (const std::exception& e) {
            std::cerr << "[EvidenceVerifier] Not-found classification failed: " << e.what() << std::endl;
            result.notFound = domain::NotFoundVerdict{};
            result.notFound.classification = domain::NotFoundClassification::Undetermined;
            AddError(report, std::string("Not-found classification failed: ") + e.what());
            SetCheck(report, "not_found", "error");
        }
    } else {
        SetCheck(report, "not_found", "skipped");
    }

    if (!report["errors"].empty()) {
        report["status"] = "error";
    } else if (!report["warnings"].empty()) {
        report["status"] = "warning";
    }

    result.report = report;
    return result;
}

std::vector<EvidenceReview> EvidenceVerifier::reviewAll(const std::vector<domain::ResponseRecord>& records,
                                                        const ReviewOptions& options) const {
    std::vector<EvidenceReview> reviews;
    reviews.reserve(records.size());
    for (const auto& record : records) {
        reviews.push_back(review(record, options));
    }
    return reviews;
}

} // namespace provenance::application::verification
