/**
 * @file TokenComparator.hpp
 * @brief Share of answer words that can be found in the evidence.
 */

#pragma once
#include <string>
#include <vector>
#include "domain/EvidenceVerdicts.hpp"

namespace provenance::application::verification {

/**
 * @class TokenComparator
 * @brief Exact word matching with numeric equality for numbers.
 *
 * Numbers in the answer also match spelled-out numbers in the evidence
 * ("10%" matches "ten percent").
 */
class TokenComparator {
public:
    /**
     * @param keyPoints Optional pre-segmented answer. When empty the whole
     *        response is a single key point.
     */
    domain::ComparisonStats compare(const std::string& response,
                                    const std::string& evidence,
                                    const std::vector<std::string>& keyPoints = {}) const;

    /** @brief Drops a trailing period and the characters , ( ) ; $ " and quote marks. */
    static std::string CleanToken(const std::string& token);
};

} // namespace provenance::application::verification
