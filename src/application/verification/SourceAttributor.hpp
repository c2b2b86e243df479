/**
 * @file SourceAttributor.hpp
 * @brief Ranks the evidence spans that most likely produced a model answer.
 */

#pragma once
#include <string>
#include <vector>
#include "domain/Batch.hpp"
#include "domain/EvidenceVerdicts.hpp"

namespace provenance::application::verification {

struct SourceAttributorOptions {
    double minThreshold = 0.25;        ///< Minimum share of answer words found in a span.
    int minMatchCount = 3;             ///< Or more than this many matching words.
    double conclusiveThreshold = 0.75; ///< Stop after a candidate scores above this.
    int maxCandidates = 3;
    int snippetRadius = 10;            ///< Words kept on each side of the median match.
};

/**
 * @class SourceAttributor
 * @brief Word-overlap attribution of an answer to metadata spans of its batch.
 */
class SourceAttributor {
public:
    explicit SourceAttributor(SourceAttributorOptions options = {});

    std::vector<domain::SourceReviewEntry> review(const std::string& response,
                                                  const std::string& evidence,
                                                  const std::vector<domain::BatchMetadataEntry>& metadata) const;

private:
    SourceAttributorOptions m_options;
};

} // namespace provenance::application::verification
