#include <cassert>
#include <iostream>
#include <string>
#include <vector>

#include "application/verification/NumberFactChecker.hpp"

using namespace provenance;
using application::verification::NumberFactChecker;
using domain::FactStatus;

namespace {

domain::BatchMetadataEntry Span(std::size_t start, std::size_t stop, const std::string& source, int page) {
    domain::BatchMetadataEntry entry;
    entry.evidenceStartChar = start;
    entry.evidenceStopChar = stop;
    entry.sourceName = source;
    entry.pageNum = page;
    return entry;
}

} // namespace

int main() {
    std::cout << "[Test] Starting NumberFactChecker Test..." << std::endl;

    // 1. Currency and percent in the answer match digits and words in the evidence.
    {
        NumberFactChecker checker(2);
        const std::string response = "Revenue was $50,000.00 and growth was 10%.";
        const std::string evidence =
            "The company reported revenue of 50000 dollars. Growth reached ten percent over the year.";
        auto facts = checker.check(response, evidence, {});
        assert(facts.size() == 2);

        assert(facts[0].fact == "$50,000.00");
        assert(facts[0].status == FactStatus::Confirmed);
        assert(facts[0].text == " ... revenue of 50000 dollars. ... ");
        assert(!facts[0].pageNum.has_value());
        assert(response.substr(facts[0].responseStart, facts[0].responseStop - facts[0].responseStart) ==
               "$50,000.00");

        assert(facts[1].fact == "10%");
        assert(facts[1].status == FactStatus::Confirmed);
        assert(response.substr(facts[1].responseStart, facts[1].responseStop - facts[1].responseStart) == "10%");
    }

    // 2. The match is attributed to the span holding it.
    {
        NumberFactChecker checker;
        const std::string evidence = "Alpha has 12 units.\nBeta has 34 units.\n";
        std::vector<domain::BatchMetadataEntry> metadata{Span(0, 20, "a.pdf", 1), Span(20, 39, "b.pdf", 2)};
        auto facts = checker.check("Beta has 34 units.", evidence, metadata);
        assert(facts.size() == 1);
        assert(facts[0].status == FactStatus::Confirmed);
        assert(facts[0].source == "b.pdf");
        assert(facts[0].pageNum == 2);
        assert(facts[0].text.find("Beta has 34 units.") != std::string::npos);
        assert(facts[0].text.find('\n') == std::string::npos);
    }

    // 3. A match outside every span falls back to the last one.
    {
        NumberFactChecker checker;
        const std::string evidence = "Intro text. The total was 77 units.";
        auto facts = checker.check("It was 77.", evidence, {Span(0, 5, "x.pdf", 3), Span(5, 11, "y.pdf", 4)});
        assert(facts.size() == 1);
        assert(facts[0].status == FactStatus::Confirmed);
        assert(facts[0].source == "y.pdf");
        assert(facts[0].pageNum == 4);
    }

    // 4. Unconfirmed numbers carry no context or source.
    {
        NumberFactChecker checker;
        auto facts = checker.check("About 75 patients.", "Forty patients enrolled.", {Span(0, 24, "t.pdf", 1)});
        assert(facts.size() == 1);
        assert(facts[0].fact == "75");
        assert(facts[0].status == FactStatus::NotConfirmed);
        assert(facts[0].text.empty());
        assert(facts[0].source.empty());
        assert(!facts[0].pageNum.has_value());
    }

    // 5. Spelled-out numbers with "and".
    {
        NumberFactChecker checker;
        auto facts = checker.check("There were 205 birds.", "We counted two hundred and five birds today.", {});
        assert(facts.size() == 1);
        assert(facts[0].status == FactStatus::Confirmed);
    }

    // 6. Markup wraps each fact according to its status.
    {
        NumberFactChecker checker;
        const std::string response = "Paid $50,000.00 and 75 more.";
        auto facts = checker.check(response, "The invoice was 50000 in total.", {});
        assert(facts.size() == 2);
        assert(NumberFactChecker::Markup(response, facts) ==
               "Paid <b>$50,000.00</b> and <font color=red>75</font> more.");
        assert(NumberFactChecker::Markup("No numbers here.", {}) == "No numbers here.");
    }

    // 7. Words that are not numbers produce no entries.
    {
        NumberFactChecker checker;
        assert(checker.check("The weather stayed mild.", "Mild weather.", {}).empty());
    }

    std::cout << "[PASS] NumberFactChecker confirms and locates numbers." << std::endl;
    return 0;
}
