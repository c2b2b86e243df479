/**
 * @file RecordJson.cpp
 * @brief Implementation of RecordJson.
 */

#include "infrastructure/RecordJson.hpp"
#include "application/verification/EvidenceVerifier.hpp"
#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <limits>

namespace provenance::infrastructure {

using json = nlohmann::json;

namespace {

std::optional<int> OptionalInt(const json& j, const char* key) {
    if (!j.contains(key) || j[key].is_null()) {
        return std::nullopt;
    }
    const json& value = j[key];
    if (value.is_number_unsigned()) {
        const auto n = value.get<std::uint64_t>();
        if (n <= static_cast<std::uint64_t>(std::numeric_limits<int>::max())) {
            return static_cast<int>(n);
        }
    } else if (value.is_number_integer()) {
        const auto n = value.get<std::int64_t>();
        if (n >= std::numeric_limits<int>::min() && n <= std::numeric_limits<int>::max()) {
            return static_cast<int>(n);
        }
    } else if (value.is_string()) {
        // Some extractors write page numbers as strings.
        const std::string text = value.get<std::string>();
        if (!text.empty()) {
            errno = 0;
            char* end = nullptr;
            const long n = std::strtol(text.c_str(), &end, 10);
            if (end == text.c_str() + text.size() && errno != ERANGE &&
                n >= std::numeric_limits<int>::min() && n <= std::numeric_limits<int>::max()) {
                return static_cast<int>(n);
            }
        }
    }
    std::cerr << "[RecordJson] Ignoring '" << key << "': " << value.dump() << " is not an int" << std::endl;
    return std::nullopt;
}

json OptionalToJson(const std::optional<bool>& value) {
    return value ? json(*value) : json(nullptr);
}

} // namespace

std::optional<domain::TextRecord> RecordJson::ParseRecord(const json& j) {
    if (!j.is_object() || !j.contains("text") || !j["text"].is_string()) {
        return std::nullopt;
    }
    domain::TextRecord record(j["text"].get<std::string>());
    if (j.contains("file_source") && j["file_source"].is_string()) {
        record.fileSource = j["file_source"].get<std::string>();
    }
    record.pageNum = OptionalInt(j, "page_num");
    record.masterIndex = OptionalInt(j, "master_index");
    record.docId = OptionalInt(j, "doc_id");
    record.blockId = OptionalInt(j, "block_id");
    return record;
}

std::vector<domain::TextRecord> RecordJson::ParseRecords(const json& j) {
    std::vector<domain::TextRecord> records;
    const json items = j.is_array() ? j : json::array({j});
    std::size_t index = 0;
    for (const auto& item : items) {
        auto record = ParseRecord(item);
        if (record) {
            records.push_back(std::move(*record));
        } else {
            std::cerr << "[RecordJson] Skipping malformed record at index " << index << " (missing string 'text')"
                      << std::endl;
        }
        ++index;
    }
    return records;
}

json RecordJson::ToJson(const domain::TextRecord& record) {
    json j = {{"text", record.text}};
    if (record.fileSource) j["file_source"] = *record.fileSource;
    if (record.pageNum) j["page_num"] = *record.pageNum;
    if (record.masterIndex) j["master_index"] = *record.masterIndex;
    if (record.docId) j["doc_id"] = *record.docId;
    if (record.blockId) j["block_id"] = *record.blockId;
    return j;
}

json RecordJson::ToJson(const domain::BatchMetadataEntry& entry) {
    return {
        {"batch_source_id", entry.batchSourceId},
        {"evidence_start_char", entry.evidenceStartChar},
        {"evidence_stop_char", entry.evidenceStopChar},
        {"source_name", entry.sourceName},
        {"page_num", entry.pageNum},
        {"doc_id", entry.docId},
        {"block_id", entry.blockId}
    };
}

json RecordJson::ToJson(const domain::Batch& batch) {
    json metadata = json::array();
    for (const auto& entry : batch.metadata) metadata.push_back(ToJson(entry));

    json biblio = json::object();
    for (const auto& [source, pages] : batch.biblio) {
        biblio[source] = std::vector<int>(pages.begin(), pages.end());
    }

    return {
        {"batch_id", batch.id},
        {"text", batch.text},
        {"metadata", metadata},
        {"biblio", biblio},
        {"batch_stats", {
            {"tokens", batch.stats.tokens},
            {"chars", batch.stats.chars},
            {"samples", batch.stats.samples}
        }}
    };
}

std::optional<domain::Batch> RecordJson::ParseBatch(const json& j) {
    try {
        domain::Batch batch;
        batch.id = j.at("batch_id").get<int>();
        batch.text = j.at("text").get<std::string>();
        for (const auto& m : j.at("metadata")) {
            domain::BatchMetadataEntry entry;
            entry.batchSourceId = m.at("batch_source_id").get<int>();
            entry.evidenceStartChar = m.at("evidence_start_char").get<std::size_t>();
            entry.evidenceStopChar = m.at("evidence_stop_char").get<std::size_t>();
            entry.sourceName = m.at("source_name").get<std::string>();
            entry.pageNum = m.value("page_num", 1);
            entry.docId = m.value("doc_id", 1);
            entry.blockId = m.value("block_id", 1);
            batch.metadata.push_back(std::move(entry));
        }
        if (j.contains("biblio")) {
            for (const auto& item : j["biblio"].items()) {
                auto pages = item.value().get<std::vector<int>>();
                batch.biblio[item.key()].insert(pages.begin(), pages.end());
            }
        }
        if (j.contains("batch_stats")) {
            const auto& s = j["batch_stats"];
            batch.stats.tokens = s.value("tokens", 0);
            batch.stats.chars = s.value("chars", batch.text.size());
            batch.stats.samples = s.value("samples", static_cast<int>(batch.metadata.size()));
        }
        return batch;
    } catch (const std::exception& e) {
        std::cerr << "[RecordJson] Invalid batch: " << e.what() << std::endl;
    }
    return std::nullopt;
}

json RecordJson::ToJson(const domain::FactCheckEntry& entry) {
    return {
        {"fact", entry.fact},
        {"status", domain::FactStatusToString(entry.status)},
        {"text", entry.text},
        {"page_num", entry.pageNum ? json(*entry.pageNum) : json("")},
        {"source", entry.source}
    };
}

json RecordJson::ToJson(const domain::SourceReviewEntry& entry) {
    return {
        {"text", entry.text},
        {"match_score", entry.matchScore},
        {"source", entry.source},
        {"page_num", entry.pageNum},
        {"doc_id", entry.docId},
        {"block_id", entry.blockId}
    };
}

json RecordJson::ToJson(const domain::ComparisonStats& stats) {
    json keyPoints = json::array();
    for (const auto& kp : stats.keyPointList) {
        keyPoints.push_back({{"key_point", kp.keyPoint}, {"entry", kp.entry}, {"verified_match", kp.verifiedMatch}});
    }
    return {
        {"percent_display", stats.percentDisplay},
        {"confirmed_words", stats.confirmedWords},
        {"unconfirmed_words", stats.unconfirmedWords},
        {"verified_token_match_ratio", stats.verifiedTokenMatchRatio},
        {"key_point_list", keyPoints}
    };
}

json RecordJson::ToJson(const domain::NotFoundVerdict& verdict) {
    return {
        {"parse_response", OptionalToJson(verdict.parseResponse)},
        {"evidence_match", OptionalToJson(verdict.evidenceMatch)},
        {"ask_the_model", OptionalToJson(verdict.askTheModel)},
        {"classification", domain::NotFoundClassificationToString(verdict.classification)}
    };
}

json RecordJson::ToJson(const application::verification::EvidenceReview& review) {
    json facts = json::array();
    for (const auto& f : review.factCheck) facts.push_back(ToJson(f));
    json sources = json::array();
    for (const auto& s : review.sourceReview) sources.push_back(ToJson(s));

    return {
        {"fact_check", facts},
        {"source_review", sources},
        {"comparison_stats", ToJson(review.comparisonStats)},
        {"not_found", ToJson(review.notFound)},
        {"report", review.report}
    };
}

} // namespace provenance::infrastructure
