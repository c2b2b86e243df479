/**
 * @file NumberFactChecker.hpp
 * @brief Checks every number in a model answer against the evidence text.
 */

#pragma once
#include <string>
#include <vector>
#include "domain/Batch.hpp"
#include "domain/EvidenceVerdicts.hpp"

namespace provenance::application::verification {

/**
 * @class NumberFactChecker
 * @brief Confirms numbers by exact numeric equality, percent and currency aware.
 *
 * A confirmed number is attributed to the metadata span holding the matching
 * evidence word, with @c contextRadius words of evidence on each side.
 */
class NumberFactChecker {
public:
    explicit NumberFactChecker(int contextRadius = 10);

    std::vector<domain::FactCheckEntry> check(const std::string& response,
                                              const std::string& evidence,
                                              const std::vector<domain::BatchMetadataEntry>& metadata) const;

    /** @brief Wraps confirmed facts in <b> and the others in <font color=red>. */
    static std::string Markup(const std::string& response, const std::vector<domain::FactCheckEntry>& entries);

private:
    int m_contextRadius;
};

} // namespace provenance::application::verification
