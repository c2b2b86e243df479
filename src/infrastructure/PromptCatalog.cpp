#include "infrastructure/PromptCatalog.hpp"

namespace provenance::infrastructure {

PromptTemplate PromptCatalog::GetNotFoundClassifierPrompt() {
    PromptTemplate p;
    p.name = "not_found_classifier";
    p.description = "Asks a model to classify a response as 'not found'.";
    p.systemPrompt = "You are a helpful assistant.";
    p.blurb1 =
        "Here are several examples of a 'not found' response: "
        "Not Found \n"
        "The text does not provide an answer. \n"
        "The answer is not clear. \n"
        "Sorry, I could not find a definitive answer. \n"
        "The answer is not provided in the information given. \n"
        "The text does not specify the answer to this question. \n";
    p.blurb2 = "Here is a new example: ";
    p.instruction = "Please respond 'Yes' or 'No' if this new example is a 'Not Found' response.";
    return p;
}

std::optional<PromptTemplate> PromptCatalog::Get(const std::string& name) {
    if (name == "not_found_classifier") {
        return GetNotFoundClassifierPrompt();
    }
    return std::nullopt;
}

} // namespace provenance::infrastructure
