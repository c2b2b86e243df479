/**
 * @file ModelSelector.hpp
 * @brief Picks the model to answer with from those an Ollama server offers.
 */

#pragma once
#include <string>
#include <vector>

namespace provenance::infrastructure {

/**
 * @class ModelSelector
 * @brief Selection policy only; the adapter does the I/O.
 *
 * Families are ranked by context window size among the built-in model cards.
 */
class ModelSelector {
public:
    /** @brief "llama3:8b-instruct" -> "llama3". */
    static std::string Family(const std::string& modelTag) {
        return modelTag.substr(0, modelTag.find(':'));
    }

    /**
     * @brief Keeps @p preferred when installed (exact tag or same family),
     *        otherwise the first installed tag of the best ranked family.
     */
    static std::string SelectBest(const std::vector<std::string>& installed,
                                  const std::string& preferred = "llama3") {
        if (installed.empty()) return preferred;

        for (const auto& tag : installed) {
            if (tag == preferred) return tag;
        }
        for (const auto& tag : installed) {
            if (Family(tag) == Family(preferred)) return tag;
        }

        static const std::vector<std::string> kRanking = {"qwen2.5", "llama3", "mistral", "gemma", "phi3"};
        for (const auto& family : kRanking) {
            for (const auto& tag : installed) {
                if (Family(tag) == family) return tag;
            }
        }
        return installed.front();
    }
};

} // namespace provenance::infrastructure
