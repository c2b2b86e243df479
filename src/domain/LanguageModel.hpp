/**
 * @file LanguageModel.hpp
 * @brief Interface for the language model that answers over a context batch.
 */

#pragma once
#include <map>
#include <optional>
#include <string>

namespace provenance::domain {

/**
 * @class LanguageModel
 * @brief Abstract collaborator that runs inference. The core never calls it while
 *        packing; only the optional self-classification heuristic does.
 */
class LanguageModel {
public:
    virtual ~LanguageModel() = default;

    /**
     * @struct SamplingParams
     * @brief Generation settings forwarded to the provider.
     */
    struct SamplingParams {
        double temperature = 0.0;
        int maxOutputTokens = 200;
    };

    /**
     * @struct InferenceResult
     * @brief Model answer plus provider usage counters.
     */
    struct InferenceResult {
        std::string llmResponse;
        std::map<std::string, int> usage;
    };

    /**
     * @brief Answers @p prompt using @p context as evidence.
     * @return The answer, or std::nullopt when the provider could not be reached.
     */
    virtual std::optional<InferenceResult> infer(const std::string& prompt,
                                                 const std::string& context,
                                                 const SamplingParams& params) = 0;

    /** @brief Name of the model currently answering. */
    virtual std::string getCurrentModel() const = 0;
};

} // namespace provenance::domain
