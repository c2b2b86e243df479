/**
 * @file Batch.hpp
 * @brief Domain types for token-bounded context batches.
 */

#pragma once
#include <cstddef>
#include <map>
#include <set>
#include <string>
#include <vector>

namespace provenance::domain {

/**
 * @struct BatchMetadataEntry
 * @brief Locates one packed record inside the batch text.
 *
 * The span [evidenceStartChar, evidenceStopChar) covers the record text plus
 * the batch separator that follows it.
 */
struct BatchMetadataEntry {
    int batchSourceId = 0;          ///< Position of the record within its batch.
    std::size_t evidenceStartChar = 0;
    std::size_t evidenceStopChar = 0;
    std::string sourceName;
    int pageNum = 1;
    int docId = 1;
    int blockId = 1;

    bool contains(std::size_t offset) const {
        return offset >= evidenceStartChar && offset < evidenceStopChar;
    }

    bool operator==(const BatchMetadataEntry& o) const {
        return batchSourceId == o.batchSourceId && evidenceStartChar == o.evidenceStartChar &&
               evidenceStopChar == o.evidenceStopChar && sourceName == o.sourceName &&
               pageNum == o.pageNum && docId == o.docId && blockId == o.blockId;
    }
};

/** @brief Source document name -> pages drawn from it. */
using Biblio = std::map<std::string, std::set<int>>;

struct BatchStats {
    int tokens = 0;
    std::size_t chars = 0;
    int samples = 0;

    bool operator==(const BatchStats& o) const {
        return tokens == o.tokens && chars == o.chars && samples == o.samples;
    }
};

/**
 * @struct Batch
 * @brief One aggregation of text records sized to fit a model context window.
 */
struct Batch {
    int id = 0;
    std::string text;
    std::vector<BatchMetadataEntry> metadata;
    Biblio biblio;
    BatchStats stats;

    bool operator==(const Batch& o) const {
        return id == o.id && text == o.text && metadata == o.metadata && biblio == o.biblio && stats == o.stats;
    }
    bool operator!=(const Batch& o) const { return !(*this == o); }
};

} // namespace provenance::domain
