#include <cassert>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "application/TokenAdapter.hpp"
#include "domain/ConfigurationError.hpp"
#include "infrastructure/WhitespaceTokenizer.hpp"

using namespace provenance;
using application::TokenAdapter;
using application::TokenizerChoice;

namespace {

// Resolves only the identifiers in @p known, recording every request.
application::TokenizerLoader RecordingLoader(std::vector<std::string>& requests, std::vector<std::string> known) {
    return [&requests, known](const std::string& id) -> std::shared_ptr<domain::Tokenizer> {
        requests.push_back(id);
        for (const auto& k : known) {
            if (k == id) return std::make_shared<infrastructure::WhitespaceTokenizer>();
        }
        return nullptr;
    };
}

} // namespace

int main() {
    std::cout << "[Test] Starting TokenAdapter Test..." << std::endl;

    // 1. The session tokenizer wins and the loader is never called.
    {
        std::vector<std::string> requests;
        TokenizerChoice choice;
        choice.sessionTokenizer = std::make_shared<infrastructure::WhitespaceTokenizer>();
        choice.modelCardTokenizer = "card";
        TokenAdapter adapter(choice, RecordingLoader(requests, {"card", "gpt2"}));
        assert(adapter.tokenizerName().empty());
        assert(adapter.count("one two three") == 3);
        assert(adapter.tokenizer() == choice.sessionTokenizer);
        assert(requests.empty());
    }

    // 2. Model card identifier before the default.
    {
        std::vector<std::string> requests;
        TokenizerChoice choice;
        choice.modelCardTokenizer = "card";
        TokenAdapter adapter(choice, RecordingLoader(requests, {"card", "gpt2"}));
        assert(adapter.count("a b") == 2);
        assert((requests == std::vector<std::string>{"card"}));
    }

    // 3. Unknown card identifier falls back to the default.
    {
        std::vector<std::string> requests;
        TokenizerChoice choice;
        choice.modelCardTokenizer = "unknown-card";
        TokenAdapter adapter(choice, RecordingLoader(requests, {"gpt2"}));
        assert(adapter.count("a b c d") == 4);
        assert((requests == std::vector<std::string>{"unknown-card", "gpt2"}));
    }

    // 4. Resolution happens once; the same instance serves every call.
    {
        std::vector<std::string> requests;
        TokenAdapter adapter(TokenizerChoice{}, RecordingLoader(requests, {"gpt2"}));
        auto first = adapter.tokenizer();
        auto ids = adapter.encode("alpha beta gamma");
        assert(adapter.decode(ids) == "alpha beta gamma");
        assert(adapter.tokenizer() == first);
        assert(requests.size() == 1);
        assert(adapter.tokenizerName() == "whitespace");
    }

    // 5. Nothing resolves.
    {
        std::vector<std::string> requests;
        TokenAdapter adapter(TokenizerChoice{}, RecordingLoader(requests, {}));
        bool threw = false;
        try {
            adapter.count("text");
        } catch (const domain::ConfigurationError& e) {
            threw = true;
            assert(std::string(e.what()).find("gpt2") != std::string::npos);
        }
        assert(threw);
    }

    // 6. No loader at all.
    {
        TokenAdapter adapter(TokenizerChoice{}, nullptr);
        bool threw = false;
        try {
            adapter.tokenizer();
        } catch (const domain::ConfigurationError&) {
            threw = true;
        }
        assert(threw);
    }

    std::cout << "[PASS] TokenAdapter resolves session, card, then default tokenizer." << std::endl;
    return 0;
}
