/**
 * @file SourceSession.hpp
 * @brief Owns the source materials of one question/answer session.
 */

#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "application/SourceBatcher.hpp"
#include "application/TokenAdapter.hpp"
#include "domain/Batch.hpp"
#include "domain/ResponseRecord.hpp"
#include "domain/TextRecord.hpp"

namespace provenance::application {

struct SourceSessionConfig {
    int contextWindow = 1000;
    std::string separator = "\n";
    std::string backupSourceName = "user_provided_unknown_source";
    TokenizerChoice tokenizer;
};

/**
 * @struct BatchSummary
 * @brief One line of reviewSourcesSummary().
 */
struct BatchSummary {
    int batchId = 0;
    domain::BatchStats stats;
    domain::Biblio biblio;
};

/**
 * @class SourceSession
 * @brief Holds the packed batches and the session tokenizer.
 *
 * Every packing call in the session goes through the same TokenAdapter.
 * Not thread-safe: guard a shared session externally.
 */
class SourceSession {
public:
    SourceSession(SourceSessionConfig config, TokenizerLoader loader);

    SourceSession(const SourceSession&) = delete;
    SourceSession& operator=(const SourceSession&) = delete;

    /** @brief Packs @p records after the current materials. */
    PackagingResult addSource(const std::vector<domain::TextRecord>& records, bool aggregate = true);

    /** @brief Parses a JSON array of records (malformed ones are skipped) and packs them. */
    PackagingResult addSourceJson(const nlohmann::json& records, bool aggregate = true);

    /** @brief Adds the last user/bot exchange as a "dialog_tracker" source. */
    PackagingResult addLastInteraction(const std::string& userText, const std::string& botText);

    void clearSourceMaterials();

    std::vector<BatchSummary> reviewSourcesSummary() const;

    /** @brief True when any batch carries text. */
    bool sourceMaterialsAttached() const;

    /**
     * @brief Links an answer to the batch that was sent as its context.
     * @return std::nullopt when @p batchIndex is out of range.
     */
    std::optional<domain::ResponseRecord> responseRecordFor(std::size_t batchIndex,
                                                            const std::string& llmResponse,
                                                            const std::string& prompt) const;

    const std::vector<domain::Batch>& sourceMaterials() const { return m_sourceMaterials; }
    int contextWindow() const { return m_config.contextWindow; }
    TokenAdapter& tokens() { return m_tokens; }

private:
    SourceSessionConfig m_config;
    TokenAdapter m_tokens;
    SourceBatcher m_batcher;
    std::vector<domain::Batch> m_sourceMaterials;
};

} // namespace provenance::application
