/**
 * @file SourceSession.cpp
 * @brief Implementation of SourceSession.
 */

#include "application/SourceSession.hpp"
#include "infrastructure/RecordJson.hpp"
#include <algorithm>
#include <iostream>

namespace provenance::application {

SourceSession::SourceSession(SourceSessionConfig config, TokenizerLoader loader)
    : m_config(std::move(config)),
      m_tokens(m_config.tokenizer, std::move(loader)),
      m_batcher(m_tokens, SourceBatcherOptions{m_config.separator, m_config.backupSourceName}) {}

PackagingResult SourceSession::addSource(const std::vector<domain::TextRecord>& records, bool aggregate) {
    auto outcome = m_batcher.package(records, m_sourceMaterials, aggregate, m_config.contextWindow);
    m_sourceMaterials = std::move(outcome.batches);
    std::cout << "[SourceSession] Packed " << records.size() << " records, "
              << m_sourceMaterials.size() << " batches in session" << std::endl;
    return outcome.result;
}

PackagingResult SourceSession::addSourceJson(const nlohmann::json& records, bool aggregate) {
    return addSource(infrastructure::RecordJson::ParseRecords(records), aggregate);
}

PackagingResult SourceSession::addLastInteraction(const std::string& userText, const std::string& botText) {
    domain::TextRecord record(userText + "\n" + botText + "\n");
    record.fileSource = "dialog_tracker";
    record.pageNum = 0;
    return addSource({record}, true);
}

void SourceSession::clearSourceMaterials() {
    m_sourceMaterials.clear();
}

std::vector<BatchSummary> SourceSession::reviewSourcesSummary() const {
    std::vector<BatchSummary> summary;
    summary.reserve(m_sourceMaterials.size());
    for (const auto& batch : m_sourceMaterials) {
        summary.push_back(BatchSummary{batch.id, batch.stats, batch.biblio});
    }
    return summary;
}

bool SourceSession::sourceMaterialsAttached() const {
    return std::any_of(m_sourceMaterials.begin(), m_sourceMaterials.end(),
                       [](const domain::Batch& b) { return !b.text.empty(); });
}

std::optional<domain::ResponseRecord> SourceSession::responseRecordFor(std::size_t batchIndex,
                                                                       const std::string& llmResponse,
                                                                       const std::string& prompt) const {
    if (batchIndex >= m_sourceMaterials.size()) {
        std::cerr << "[SourceSession] No batch at index " << batchIndex << std::endl;
        return std::nullopt;
    }
    const auto& batch = m_sourceMaterials[batchIndex];
    domain::ResponseRecord record;
    record.llmResponse = llmResponse;
    record.prompt = prompt;
    record.evidence = batch.text;
    record.evidenceMetadata = batch.metadata;
    record.biblio = batch.biblio;
    return record;
}

} // namespace provenance::application
