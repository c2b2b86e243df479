#include <cassert>
#include <iostream>

#include "domain/text/WordTokenizer.hpp"

using provenance::domain::text::WordTokenizer;
using provenance::domain::text::WordTokenizerOptions;

int main() {
    std::cout << "[Test] Starting WordTokenizer Test..." << std::endl;

    // Offsets point at the raw words.
    const std::string text = "  The cat,\n sat on 3 mats.";
    auto raw = WordTokenizer::SplitOnWhitespace(text);
    assert(raw.size() == 6);
    assert(raw[0].text == "The" && raw[0].start == 2 && raw[0].end == 5);
    assert(raw[1].text == "cat," && raw[1].start == 6);
    assert(raw[2].text == "sat" && raw[2].start == 12);
    assert(raw[5].text == "mats." && raw[5].position == 5);
    assert(text.substr(raw[5].start, raw[5].end - raw[5].start) == "mats.");

    // Defaults: lowercase, no punctuation, no stop words, no numbers.
    auto words = WordTokenizer().words(text);
    assert((words == std::vector<std::string>{"cat", "sat", "mats"}));

    // Cleaned tokens keep the raw offsets.
    auto tokens = WordTokenizer().tokenize(text);
    assert(tokens[0].text == "cat" && tokens[0].start == 6 && tokens[0].end == 10);

    WordTokenizerOptions keepCase;
    keepCase.lowerCase = false;
    keepCase.removeStopWords = false;
    keepCase.removeNumbers = false;
    auto kept = WordTokenizer(keepCase).words(text);
    assert((kept == std::vector<std::string>{"The", "cat", "sat", "on", "3", "mats"}));

    WordTokenizerOptions oneLetter;
    oneLetter.removeNumbers = false;
    oneLetter.oneLetterRemoval = true;
    auto noSingles = WordTokenizer(oneLetter).words("x marks 7 spots");
    assert((noSingles == std::vector<std::string>{"marks", "spots"}));

    // Punctuation kept, stop words still matched case-insensitively.
    WordTokenizerOptions punct;
    punct.removePunctuation = false;
    punct.lowerCase = false;
    auto withPunct = WordTokenizer(punct).words("However, The results.");
    assert((withPunct == std::vector<std::string>{"However,", "results."}));

    assert(WordTokenizer::IsStopWord("THE"));
    assert(!WordTokenizer::IsStopWord("revenue"));
    assert(WordTokenizer::StripPunctuation("[e.g.,]") == "eg");
    assert(WordTokenizer::SplitOnWhitespace("   ").empty());

    std::cout << "[PASS] WordTokenizer splits with offsets and filters as configured." << std::endl;
    return 0;
}
