/**
 * @file SourceBatcher.cpp
 * @brief Implementation of SourceBatcher.
 */

#include "application/SourceBatcher.hpp"
#include "application/BatchBuilder.hpp"
#include "domain/ConfigurationError.hpp"
#include <algorithm>
#include <cstddef>
#include <iostream>

namespace provenance::application {

SourceBatcher::SourceBatcher(TokenAdapter& tokens, SourceBatcherOptions options)
    : m_tokens(tokens), m_options(std::move(options)) {}

std::vector<domain::TextRecord> SourceBatcher::Deduplicate(const std::vector<domain::TextRecord>& records) {
    std::vector<domain::TextRecord> unique;
    unique.reserve(records.size());
    for (const auto& record : records) {
        if (std::find(unique.begin(), unique.end(), record) == unique.end()) {
            unique.push_back(record);
        }
    }
    return unique;
}

int SourceBatcher::sliceCapacity(int window) {
    return window - m_tokens.count(m_options.separator) - 1;
}

int SourceBatcher::packedSize(const domain::TextRecord& record) {
    return m_tokens.count(record.text + m_options.separator);
}

std::vector<domain::TextRecord> SourceBatcher::chunk(const domain::TextRecord& record, int window) {
    const int capacity = sliceCapacity(window);
    if (capacity <= 0) {
        throw domain::ConfigurationError("Context window " + std::to_string(window) +
                                         " leaves no room for text after the batch separator");
    }

    const std::vector<int> ids = m_tokens.encode(record.text);
    const std::size_t n = ids.size();
    const std::size_t cap = static_cast<std::size_t>(capacity);

    const std::size_t slices = std::max<std::size_t>(1, (n + cap - 1) / cap);
    const std::size_t base = n / slices;
    const std::size_t extra = n % slices;

    std::vector<domain::TextRecord> chunks;
    chunks.reserve(slices);
    std::size_t pos = 0;
    for (std::size_t i = 0; i < slices; ++i) {
        const std::size_t len = base + (i < extra ? 1 : 0);
        std::vector<int> slice(ids.begin() + static_cast<std::ptrdiff_t>(pos),
                               ids.begin() + static_cast<std::ptrdiff_t>(pos + len));
        pos += len;

        domain::TextRecord piece = record;
        piece.text = m_tokens.decode(slice);
        chunks.push_back(std::move(piece));
    }
    return chunks;
}

PackagingOutcome SourceBatcher::package(const std::vector<domain::TextRecord>& records,
                                        const std::vector<domain::Batch>& existing,
                                        bool aggregate,
                                        int window) {
    if (window <= 0) {
        throw domain::ConfigurationError("Context window must be positive, got " + std::to_string(window));
    }

    PackagingOutcome outcome;
    outcome.batches = existing;

    // Resolves the tokenizer before any state changes.
    m_tokens.tokenizer();
    if (sliceCapacity(window) <= 0) {
        throw domain::ConfigurationError("Context window " + std::to_string(window) +
                                         " leaves no room for text after the batch separator");
    }

    std::vector<domain::TextRecord> samples;
    for (const auto& record : Deduplicate(records)) {
        const int t = packedSize(record);
        if (t >= window) {
            auto pieces = chunk(record, window);
            std::cout << "[SourceBatcher] Chunked record of " << t << " tokens from '"
                      << record.sourceName(m_options.backupSourceName) << "' into "
                      << pieces.size() << " slices" << std::endl;
            samples.insert(samples.end(), pieces.begin(), pieces.end());
        } else {
            samples.push_back(record);
        }
    }

    BatchBuilder builder(m_tokens, m_options.separator, m_options.backupSourceName);
    if (aggregate && !outcome.batches.empty()) {
        builder.resume(outcome.batches.back());
        outcome.batches.pop_back();
    } else {
        int nextId = outcome.batches.empty() ? 0 : outcome.batches.back().id + 1;
        builder.start(nextId);
    }

    auto close = [&]() {
        outcome.result.tokensPerBatch.push_back(builder.tokens());
        outcome.result.samplesPerBatch.push_back(builder.appendedSamples());
        outcome.batches.push_back(builder.finish());
    };

    for (const auto& sample : samples) {
        const int t = packedSize(sample);
        if (!builder.empty() && !builder.fits(t, window)) {
            close();
            builder.start(builder.id() + 1);
        }
        builder.append(sample, t);
    }

    if (!builder.empty()) {
        close();
    }

    outcome.result.batchesCount = static_cast<int>(outcome.result.tokensPerBatch.size());
    return outcome;
}

} // namespace provenance::application
