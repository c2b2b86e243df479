/**
 * @file SourceBatcher.hpp
 * @brief Packs text records into token-bounded batches.
 */

#pragma once
#include <string>
#include <vector>
#include "application/TokenAdapter.hpp"
#include "domain/Batch.hpp"
#include "domain/TextRecord.hpp"

namespace provenance::application {

struct SourceBatcherOptions {
    std::string separator = "\n";
    std::string backupSourceName = "user_provided_unknown_source";
};

/**
 * @struct PackagingResult
 * @brief Diagnostics for one package() call.
 *
 * Only batches touched by the call are reported: a resumed batch and every new one.
 */
struct PackagingResult {
    int batchesCount = 0;
    std::vector<int> tokensPerBatch;    ///< Running token total of each touched batch.
    std::vector<int> samplesPerBatch;   ///< Samples appended to each touched batch by this call.
};

struct PackagingOutcome {
    std::vector<domain::Batch> batches;   ///< Full updated list, existing batches first.
    PackagingResult result;
};

/**
 * @class SourceBatcher
 * @brief Deduplicates, chunks and greedily packs records in input order.
 *
 * All counting, chunking and recounting go through the same TokenAdapter, so
 * chunk boundaries agree with the sizes used for packing. A record is sized
 * together with the separator that follows it in the batch text.
 */
class SourceBatcher {
public:
    explicit SourceBatcher(TokenAdapter& tokens, SourceBatcherOptions options = {});

    /**
     * @brief Packs @p records after @p existing.
     * @param aggregate When true and @p existing is not empty, the last batch is
     *        resumed instead of starting a fresh one.
     * @param window Exclusive token limit for every closed batch.
     */
    PackagingOutcome package(const std::vector<domain::TextRecord>& records,
                             const std::vector<domain::Batch>& existing,
                             bool aggregate,
                             int window);

    /** @brief Removes structural duplicates, keeping first occurrences in order. */
    static std::vector<domain::TextRecord> Deduplicate(const std::vector<domain::TextRecord>& records);

    /**
     * @brief Splits @p record into evenly sized slices that each stay below
     *        @p window once the separator is appended.
     *
     * Every slice keeps the record's source fields.
     */
    std::vector<domain::TextRecord> chunk(const domain::TextRecord& record, int window);

private:
    /** @brief Tokens the record occupies in a batch: its text plus the separator. */
    int packedSize(const domain::TextRecord& record);

    /** @brief Largest slice, in tokens, that still fits below @p window with its separator. */
    int sliceCapacity(int window);

    TokenAdapter& m_tokens;
    SourceBatcherOptions m_options;
};

} // namespace provenance::application
