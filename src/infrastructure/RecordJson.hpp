/**
 * @file RecordJson.hpp
 * @brief JSON reading of text records and JSON rendering of batches and verdicts.
 */

#pragma once
#include <optional>
#include <vector>
#include <nlohmann/json.hpp>
#include "domain/Batch.hpp"
#include "domain/EvidenceVerdicts.hpp"
#include "domain/TextRecord.hpp"

namespace provenance::application::verification {
struct EvidenceReview;
}

namespace provenance::infrastructure {

/**
 * @class RecordJson
 * @brief Field names follow the retriever output: text, file_source, page_num,
 *        master_index, doc_id, block_id.
 */
class RecordJson {
public:
    /**
     * @brief std::nullopt when "text" is missing or not a string.
     *
     * Integer fields also accept numeric strings. Any other value, or one
     * outside the int range, is dropped with a warning.
     */
    static std::optional<domain::TextRecord> ParseRecord(const nlohmann::json& j);

    /** @brief Parses an array (or a single object), skipping malformed records with a warning. */
    static std::vector<domain::TextRecord> ParseRecords(const nlohmann::json& j);

    static nlohmann::json ToJson(const domain::TextRecord& record);
    static nlohmann::json ToJson(const domain::BatchMetadataEntry& entry);
    static nlohmann::json ToJson(const domain::Batch& batch);
    static nlohmann::json ToJson(const domain::FactCheckEntry& entry);
    static nlohmann::json ToJson(const domain::SourceReviewEntry& entry);
    static nlohmann::json ToJson(const domain::ComparisonStats& stats);
    static nlohmann::json ToJson(const domain::NotFoundVerdict& verdict);
    static nlohmann::json ToJson(const application::verification::EvidenceReview& review);

    /** @brief Reads back a batch written by ToJson(const Batch&). */
    static std::optional<domain::Batch> ParseBatch(const nlohmann::json& j);
};

} // namespace provenance::infrastructure
