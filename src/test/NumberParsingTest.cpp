#include <cassert>
#include <cmath>
#include <iostream>

#include "domain/text/NumberParsing.hpp"
#include "domain/text/WordTokenizer.hpp"

using namespace provenance::domain::text;

namespace {

bool HasValue(const std::vector<NumberMention>& mentions, double value) {
    for (const auto& m : mentions) {
        if (NumbersEqual(m.value, value)) return true;
    }
    return false;
}

} // namespace

int main() {
    std::cout << "[Test] Starting NumberParsing Test..." << std::endl;

    assert(*ParseNumericToken("$50,000.00") == 50000.0);
    assert(NumbersEqual(*ParseNumericToken("10%."), 0.1));
    assert(*ParseNumericToken("(2023),") == 2023.0);
    assert(*ParseNumericToken("\xE2\x80\xA2" "42;") == 42.0);
    assert(*ParseNumericToken("\xE2\x82\xAC" "1,250") == 1250.0);
    assert(*ParseNumericToken("3.5\"") == 3.5);
    assert(!ParseNumericToken("revenue"));
    assert(!ParseNumericToken("1.2.3"));
    assert(!ParseNumericToken("$"));
    assert(!ParseNumericToken("%"));

    assert(TrimSentencePunctuation("10%.") == "10%");
    assert(TrimSentencePunctuation("$5,000,") == "$5,000");

    assert(NumbersEqual(0.1, 10.0 / 100.0));
    assert(!NumbersEqual(0.1, 0.1001));

    assert(*WordsToNumber({"ten"}) == 10.0);
    assert(*WordsToNumber({"two", "hundred", "and", "five"}) == 205.0);
    assert(*WordsToNumber({"fifty", "thousand"}) == 50000.0);
    assert(*WordsToNumber({"twenty-five"}) == 25.0);
    assert(*WordsToNumber({"three", "million", "four", "hundred", "thousand"}) == 3400000.0);
    assert(!WordsToNumber({"ten", "apples"}));

    // Repeated scale words stay finite instead of wrapping around.
    std::vector<std::string> hundreds(12, "hundred");
    auto huge = WordsToNumber(hundreds);
    assert(huge && std::isfinite(*huge) && NumbersEqual(*huge, 1e24));
    hundreds.assign(200, "hundred");
    assert(!WordsToNumber(hundreds));

    const std::string evidence = "Growth reached ten percent, while 12 percent of two hundred and five patients left.";
    auto mentions = FindNumberMentions(WordTokenizer::SplitOnWhitespace(evidence), evidence);
    assert(HasValue(mentions, 10.0));
    assert(HasValue(mentions, 0.1));
    assert(HasValue(mentions, 12.0));
    assert(HasValue(mentions, 0.12));
    assert(HasValue(mentions, 205.0));
    assert(!HasValue(mentions, 2.0));

    // Spelled-out mentions carry their span in the text.
    for (const auto& m : mentions) {
        if (m.spelledOut && m.value == 205.0) {
            assert(evidence.substr(m.start, m.end - m.start) == "two hundred and five");
        }
    }

    // A trailing number phrase is still emitted.
    const std::string tail = "the total was forty two";
    auto tailMentions = FindNumberMentions(WordTokenizer::SplitOnWhitespace(tail), tail);
    assert(tailMentions.size() == 1 && tailMentions[0].value == 42.0);

    // Sentence punctuation ends a phrase.
    const std::string split = "We saw three. Four left.";
    auto splitMentions = FindNumberMentions(WordTokenizer::SplitOnWhitespace(split), split);
    assert(HasValue(splitMentions, 3.0) && HasValue(splitMentions, 4.0) && !HasValue(splitMentions, 7.0));

    // Digit runs beyond the double range are not numbers.
    const std::string overflowing = "1" + std::string(400, '0');
    assert(!ParseNumericToken(overflowing));
    assert(!ParseNumericToken(overflowing + "%"));
    const std::string outsized = "growth 10% over " + overflowing + " units.";
    auto outsizedMentions = FindNumberMentions(WordTokenizer::SplitOnWhitespace(outsized), outsized);
    assert(outsizedMentions.size() == 1 && outsizedMentions[0].value == 0.1);

    std::cout << "[PASS] Numbers are normalised, compared and found in text." << std::endl;
    return 0;
}
