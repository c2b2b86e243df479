/**
 * @file TextRecord.hpp
 * @brief Value Object for a retrieved text fragment entering the batching pipeline.
 */

#pragma once
#include <optional>
#include <string>
#include <utility>

namespace provenance::domain {

/**
 * @struct TextRecord
 * @brief A text fragment produced by a parser, a retriever or a knowledge-graph lookup.
 *
 * Only @c text is required. Every other field is optional and resolved through
 * the accessors below, which apply the documented defaults.
 */
struct TextRecord {
    std::string text;                       ///< Fragment content.
    std::optional<std::string> fileSource;  ///< Originating document name.
    std::optional<int> pageNum;             ///< Page within the document.
    std::optional<int> masterIndex;         ///< Parser index used when no page is known.
    std::optional<int> docId;               ///< Document id in the source library.
    std::optional<int> blockId;             ///< Block id within the document.

    TextRecord() = default;
    explicit TextRecord(std::string t) : text(std::move(t)) {}

    /** @brief Document name, or @p fallback when the record carries none. */
    std::string sourceName(const std::string& fallback) const {
        return fileSource ? *fileSource : fallback;
    }

    /** @brief page_num, then master_index, then 1. */
    int resolvedPageNum() const {
        if (pageNum) return *pageNum;
        if (masterIndex) return *masterIndex;
        return 1;
    }

    int resolvedDocId() const { return docId.value_or(1); }
    int resolvedBlockId() const { return blockId.value_or(1); }

    bool operator==(const TextRecord& other) const {
        return text == other.text && fileSource == other.fileSource && pageNum == other.pageNum &&
               masterIndex == other.masterIndex && docId == other.docId && blockId == other.blockId;
    }
    bool operator!=(const TextRecord& other) const { return !(*this == other); }
};

} // namespace provenance::domain
