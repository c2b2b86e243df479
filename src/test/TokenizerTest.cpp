#include <cassert>
#include <filesystem>
#include <iostream>

#include "infrastructure/BpeTokenizer.hpp"
#include "infrastructure/TokenizerRegistry.hpp"
#include "infrastructure/WhitespaceTokenizer.hpp"
#include "TestTokenizerFiles.hpp"

using namespace provenance;
using infrastructure::BpeTokenizer;
using infrastructure::WhitespaceTokenizer;

int main() {
    std::cout << "[Test] Starting Tokenizer Test..." << std::endl;

    // Whitespace tokenizer
    WhitespaceTokenizer ws;
    auto pieces = WhitespaceTokenizer::Split("  hello world\n");
    assert((pieces == std::vector<std::string>{"  ", "hello ", "world\n"}));
    const std::string sample = "  Reversible\ttext,\n with  odd   spacing ";
    auto ids = ws.encode(sample);
    assert(ws.decode(ids) == sample);
    assert(ws.count(sample) == static_cast<int>(ids.size()));
    assert(ws.count("") == 0);
    assert(ws.encode("hello ")[0] == ws.encode("hello again")[0]);
    assert(ws.name() == "whitespace");

    // Byte-level BPE
    const std::filesystem::path testRoot = "test_project_root_tokenizer";
    const auto tokenizerFile = testRoot / "tiny" / "tokenizer.json";
    test::WriteTinyTokenizer(tokenizerFile);

    auto bpe = BpeTokenizer::LoadFromFile(tokenizerFile.string(), "tiny");
    assert(bpe && "Tokenizer should load.");
    assert(bpe->vocabSize() == 261);

    auto pre = BpeTokenizer::PreTokenize("I'm fine  ok\n");
    assert((pre == std::vector<std::string>{"I", "'m", " fine", " ", " ok", "\n"}));

    auto helloIds = bpe->encode("hello world");
    assert((helloIds == std::vector<int>{test::kHello, test::kSpaceW, 'o', 'r', 'l', 'd'}));
    assert(bpe->decode(helloIds) == "hello world");
    assert(bpe->count("hello world") == 6);

    // Not in the vocabulary as a whole: merged pair by pair.
    assert((bpe->encode("hellhell") == std::vector<int>{test::kHell, test::kHell}));

    auto special = bpe->encode("hello<|endoftext|>hello");
    assert((special == std::vector<int>{test::kHello, test::kEndOfText, test::kHello}));
    assert(bpe->decode(special) == "hello<|endoftext|>hello");

    const std::string utf8 = "caf\xC3\xA9 na\xC3\xAFve\n\n  text";
    assert(bpe->decode(bpe->encode(utf8)) == utf8);

    assert(!BpeTokenizer::LoadFromFile((testRoot / "missing.json").string(), "missing"));

    // Registry
    infrastructure::TokenizerRegistry registry(testRoot.string());
    auto first = registry.resolve("whitespace");
    assert(first && first->name() == "whitespace");
    assert(registry.resolve("whitespace") == first);

    auto byRepo = registry.resolve("tiny");
    assert(byRepo && byRepo->name() == "tiny");
    assert(byRepo->count("hello world") == 6);
    assert(registry.resolve("tiny") == byRepo);

    auto byPath = registry.resolve(tokenizerFile.string());
    assert(byPath && byPath->count("hello") == 1);

    assert(!registry.resolve("gpt2"));

    auto loader = registry.loader();
    assert(loader("tiny") == byRepo);

    std::filesystem::remove_all(testRoot);
    std::cout << "[PASS] Tokenizers are reversible and the registry resolves identifiers." << std::endl;
    return 0;
}
