/**
 * @file EvidenceVerdicts.hpp
 * @brief Value Objects returned by the evidence verification analyses.
 */

#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace provenance::domain {

enum class FactStatus {
    Confirmed,
    NotConfirmed
};

inline std::string FactStatusToString(FactStatus status) {
    return status == FactStatus::Confirmed ? "Confirmed" : "Not Confirmed";
}

/**
 * @struct FactCheckEntry
 * @brief Verdict on one number found in the model answer.
 */
struct FactCheckEntry {
    std::string fact;                ///< Number as written in the answer.
    FactStatus status = FactStatus::NotConfirmed;
    std::string text;                ///< Evidence context around the match; empty when unconfirmed.
    std::optional<int> pageNum;
    std::string source;
    std::size_t responseStart = 0;   ///< Span of the fact inside the answer.
    std::size_t responseStop = 0;
};

/**
 * @struct SourceReviewEntry
 * @brief A ranked evidence span that most likely produced the answer.
 */
struct SourceReviewEntry {
    std::string text;
    double matchScore = 0.0;
    std::string source;
    int pageNum = 1;
    int docId = 1;
    int blockId = 1;
};

struct KeyPointMatch {
    std::string keyPoint;
    int entry = 0;
    double verifiedMatch = 0.0;
};

/**
 * @struct ComparisonStats
 * @brief Aggregate token match between answer and evidence.
 */
struct ComparisonStats {
    std::string percentDisplay = "0.0%";
    std::vector<std::string> confirmedWords;
    std::vector<std::string> unconfirmedWords;
    double verifiedTokenMatchRatio = 0.0;
    std::vector<KeyPointMatch> keyPointList;
};

enum class NotFoundClassification {
    NotFound,
    Found,
    Undetermined,
    NotEvaluated   ///< No heuristic was selected.
};

inline std::string NotFoundClassificationToString(NotFoundClassification c) {
    switch (c) {
        case NotFoundClassification::NotFound: return "not_found";
        case NotFoundClassification::Found: return "found";
        case NotFoundClassification::Undetermined: return "undetermined";
        case NotFoundClassification::NotEvaluated: return "not_evaluated";
    }
    return "undetermined";
}

/**
 * @struct NotFoundVerdict
 * @brief Per-heuristic results (true = "not found") and their combination.
 */
struct NotFoundVerdict {
    std::optional<bool> parseResponse;
    std::optional<bool> evidenceMatch;
    std::optional<bool> askTheModel;
    NotFoundClassification classification = NotFoundClassification::NotEvaluated;
};

} // namespace provenance::domain
