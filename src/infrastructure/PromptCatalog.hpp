/**
 * @file PromptCatalog.hpp
 * @brief Central storage for the prompts the verifier sends to a model.
 */

#pragma once

#include <optional>
#include <string>

namespace provenance::infrastructure {

/**
 * @struct PromptTemplate
 * @brief Prompt parts assembled around a context in the order blurb1, blurb2, context, instruction.
 */
struct PromptTemplate {
    std::string name;
    std::string description;
    std::string systemPrompt;
    std::string blurb1;
    std::string blurb2;
    std::string instruction;

    /** @brief The text placed before the instruction: both blurbs then @p context. */
    std::string renderContext(const std::string& context) const {
        return blurb1 + blurb2 + context;
    }
};

class PromptCatalog {
public:
    /** @brief Returns the prompt registered under @p name. */
    static std::optional<PromptTemplate> Get(const std::string& name);

    /** @brief Prompt asking a model whether an answer is a "not found" answer. */
    static PromptTemplate GetNotFoundClassifierPrompt();
};

} // namespace provenance::infrastructure
