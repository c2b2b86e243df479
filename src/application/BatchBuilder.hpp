/**
 * @file BatchBuilder.hpp
 * @brief Resumable, in-progress batch used by the SourceBatcher.
 */

#pragma once
#include <string>
#include "application/TokenAdapter.hpp"
#include "domain/Batch.hpp"
#include "domain/TextRecord.hpp"

namespace provenance::application {

/**
 * @class BatchBuilder
 * @brief Accumulates records into one batch and tracks its running counters.
 *
 * A builder either starts empty with a fresh id or resumes a batch produced by
 * an earlier packing call. Finishing it yields a plain domain::Batch.
 */
class BatchBuilder {
public:
    BatchBuilder(TokenAdapter& tokens, std::string separator, std::string backupSourceName);

    /** @brief Discards the current state and starts an empty batch. */
    void start(int batchId);

    /**
     * @brief Continues filling @p batch.
     *
     * The token count is recounted with the session adapter, so a batch produced
     * under another tokenizer is sized correctly.
     */
    void resume(const domain::Batch& batch);

    /** @brief Appends @p record plus the separator, counted together as @p tokens. */
    void append(const domain::TextRecord& record, int tokens);

    /** @brief True when @p tokens more would still keep the batch below @p window. */
    bool fits(int tokens, int window) const { return tokens + m_batch.stats.tokens < window; }

    bool empty() const { return m_batch.metadata.empty(); }
    int id() const { return m_batch.id; }
    int tokens() const { return m_batch.stats.tokens; }

    /** @brief Samples appended since start() or resume(). */
    int appendedSamples() const { return m_appended; }

    /** @brief Returns the finished batch. The builder keeps its state. */
    domain::Batch finish() const;

private:
    TokenAdapter& m_tokens;
    std::string m_separator;
    std::string m_backupSourceName;
    domain::Batch m_batch;
    int m_appended = 0;
};

} // namespace provenance::application
