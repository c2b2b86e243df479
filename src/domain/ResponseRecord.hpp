/**
 * @file ResponseRecord.hpp
 * @brief A model answer linked to the batch it was generated from.
 */

#pragma once
#include <map>
#include <string>
#include <vector>
#include "domain/Batch.hpp"

namespace provenance::domain {

/**
 * @struct ResponseRecord
 * @brief Produced by the caller after sending a batch to the LanguageModel.
 */
struct ResponseRecord {
    std::string llmResponse;
    std::string prompt;
    std::string evidence;                             ///< batch.text used as context.
    std::vector<BatchMetadataEntry> evidenceMetadata; ///< batch.metadata for that text.
    Biblio biblio;
    std::map<std::string, int> usage;
    std::string instruction;                          ///< e.g. "yes_no"; informational.
};

} // namespace provenance::domain
