/**
 * @file BatchBuilder.cpp
 * @brief Implementation of BatchBuilder.
 */

#include "application/BatchBuilder.hpp"

namespace provenance::application {

BatchBuilder::BatchBuilder(TokenAdapter& tokens, std::string separator, std::string backupSourceName)
    : m_tokens(tokens), m_separator(std::move(separator)), m_backupSourceName(std::move(backupSourceName)) {}

void BatchBuilder::start(int batchId) {
    m_batch = domain::Batch{};
    m_batch.id = batchId;
    m_appended = 0;
}

void BatchBuilder::resume(const domain::Batch& batch) {
    m_batch = batch;
    m_batch.stats.tokens = m_tokens.count(batch.text);
    m_batch.stats.chars = batch.text.size();
    m_batch.stats.samples = static_cast<int>(batch.metadata.size());
    m_appended = 0;
}

void BatchBuilder::append(const domain::TextRecord& record, int tokens) {
    const std::size_t start = m_batch.text.size();
    m_batch.text += record.text;
    m_batch.text += m_separator;

    domain::BatchMetadataEntry entry;
    entry.batchSourceId = static_cast<int>(m_batch.metadata.size());
    entry.evidenceStartChar = start;
    entry.evidenceStopChar = m_batch.text.size();
    entry.sourceName = record.sourceName(m_backupSourceName);
    entry.pageNum = record.resolvedPageNum();
    entry.docId = record.resolvedDocId();
    entry.blockId = record.resolvedBlockId();

    m_batch.biblio[entry.sourceName].insert(entry.pageNum);
    m_batch.metadata.push_back(std::move(entry));

    m_batch.stats.tokens += tokens;
    m_batch.stats.chars = m_batch.text.size();
    m_batch.stats.samples = static_cast<int>(m_batch.metadata.size());
    ++m_appended;
}

domain::Batch BatchBuilder::finish() const {
    return m_batch;
}

} // namespace provenance::application
