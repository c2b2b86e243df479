#include <cassert>
#include <cmath>
#include <iostream>
#include <string>
#include <vector>

#include "application/verification/SourceAttributor.hpp"

using namespace provenance;
using application::verification::SourceAttributor;

namespace {

struct Evidence {
    std::string text;
    std::vector<domain::BatchMetadataEntry> metadata;
};

// Concatenates the pieces the way a batch does, one span per piece.
Evidence Build(const std::vector<std::string>& pieces) {
    Evidence e;
    for (std::size_t i = 0; i < pieces.size(); ++i) {
        domain::BatchMetadataEntry entry;
        entry.batchSourceId = static_cast<int>(i);
        entry.evidenceStartChar = e.text.size();
        e.text += pieces[i];
        entry.evidenceStopChar = e.text.size();
        entry.sourceName = "doc" + std::to_string(i) + ".pdf";
        entry.pageNum = static_cast<int>(i) + 1;
        e.metadata.push_back(entry);
    }
    return e;
}

bool Near(double a, double b) {
    return std::fabs(a - b) < 1e-9;
}

} // namespace

int main() {
    std::cout << "[Test] Starting SourceAttributor Test..." << std::endl;

    // 1. A conclusive match stops the scan.
    {
        const std::string e0 = "The quarterly revenue increased sharply due to strong software sales in Europe.\n";
        auto evidence = Build({e0, "Unrelated notes about the weather in spring.\n"});
        SourceAttributor attributor;
        auto results = attributor.review("Revenue increased because software sales in Europe were strong.",
                                         evidence.text, evidence.metadata);
        assert(results.size() == 1);
        assert(Near(results[0].matchScore, 1.0));
        assert(results[0].text == e0.substr(0, e0.size() - 1));
        assert(results[0].source == "doc0.pdf");
        assert(results[0].pageNum == 1);
    }

    // 2. Candidates are ranked by score; weak spans are dropped.
    {
        auto evidence = Build({"apple banana cherry kiwi\n", "grape lemon mango peach plum\n", "lemon mango fig\n"});
        SourceAttributor attributor;
        auto results = attributor.review("apple banana cherry grape lemon mango peach plum",
                                         evidence.text, evidence.metadata);
        assert(results.size() == 2);
        assert(Near(results[0].matchScore, 0.625));
        assert(results[0].source == "doc1.pdf");
        assert(Near(results[1].matchScore, 0.375));
        assert(results[1].source == "doc0.pdf");
    }

    // 3. More than minMatchCount matches qualifies even under the score threshold.
    {
        auto evidence = Build({"alpha beta gamma delta\n"});
        application::verification::SourceAttributorOptions options;
        options.minThreshold = 0.9;
        options.minMatchCount = 3;
        SourceAttributor attributor(options);
        auto results = attributor.review("alpha beta gamma delta epsilon zeta", evidence.text, evidence.metadata);
        assert(results.size() == 1);
        assert(Near(results[0].matchScore, 4.0 / 6.0));
    }

    // 4. Line breaks inside a snippet become " ... ".
    {
        auto evidence = Build({"kiwi melon\nfig guava\n"});
        SourceAttributor attributor;
        auto results = attributor.review("kiwi melon fig guava", evidence.text, evidence.metadata);
        assert(results.size() == 1);
        assert(results[0].text == "kiwi melon ... fig guava");
    }

    // 5. Only stop words: nothing to attribute.
    {
        auto evidence = Build({"The results were not found here.\n"});
        SourceAttributor attributor;
        assert(attributor.review("The results were not found here.", evidence.text, evidence.metadata).empty());
        assert(attributor.review("", evidence.text, evidence.metadata).empty());
    }

    // 6. No shared content words: nothing to attribute.
    {
        auto evidence = Build({"apple banana cherry\n"});
        SourceAttributor attributor;
        assert(attributor.review("zebra quantum", evidence.text, evidence.metadata).empty());
    }

    std::cout << "[PASS] SourceAttributor ranks evidence spans." << std::endl;
    return 0;
}
