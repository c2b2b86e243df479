#include <cassert>
#include <cmath>
#include <iostream>
#include <string>
#include <vector>

#include "application/verification/TokenComparator.hpp"

using namespace provenance;
using application::verification::TokenComparator;

int main() {
    std::cout << "[Test] Starting TokenComparator Test..." << std::endl;
    TokenComparator comparator;

    // 1. Numbers match spelled-out and plain forms.
    {
        auto stats = comparator.compare("Revenue grew 10% to $50,000.",
                                        "Revenue grew ten percent, reaching 50000 in total.");
        assert(stats.percentDisplay == "100.0%");
        assert(std::fabs(stats.verifiedTokenMatchRatio - 1.0) < 1e-9);
        assert((stats.confirmedWords == std::vector<std::string>{"revenue", "grew", "10%", "50000"}));
        assert(stats.unconfirmedWords.empty());
        assert(stats.keyPointList.size() == 1);
        assert(stats.keyPointList[0].entry == 0);
    }

    // 2. Partial match.
    {
        auto stats = comparator.compare("Revenue fell sharply", "Revenue grew.");
        assert(stats.percentDisplay == "33.3%");
        assert((stats.confirmedWords == std::vector<std::string>{"revenue"}));
        assert((stats.unconfirmedWords == std::vector<std::string>{"fell", "sharply"}));
    }

    // 3. Key points are scored separately and aggregated.
    {
        auto stats = comparator.compare("Revenue grew. Profit fell.", "Revenue grew.", {"Revenue grew", "Profit fell"});
        assert(stats.keyPointList.size() == 2);
        assert(stats.keyPointList[0].keyPoint == "Revenue grew");
        assert(std::fabs(stats.keyPointList[0].verifiedMatch - 1.0) < 1e-9);
        assert(stats.keyPointList[1].entry == 1);
        assert(std::fabs(stats.keyPointList[1].verifiedMatch) < 1e-9);
        assert(stats.percentDisplay == "50.0%");
    }

    // 4. Empty answer.
    {
        auto stats = comparator.compare("", "Anything at all.");
        assert(stats.percentDisplay == "0.0%");
        assert(stats.verifiedTokenMatchRatio == 0.0);
        assert(stats.keyPointList.empty());
    }

    // 5. Unconfirmed words are listed once.
    {
        auto stats = comparator.compare("zebra zebra", "horse.");
        assert((stats.unconfirmedWords == std::vector<std::string>{"zebra"}));
        assert(stats.confirmedWords.empty());
        assert(stats.percentDisplay == "0.0%");
    }

    // 6. Token cleaning.
    {
        assert(TokenComparator::CleanToken("$1,200.") == "1200");
        assert(TokenComparator::CleanToken("(growth);") == "growth");
        assert(TokenComparator::CleanToken("\"quoted\"") == "quoted");
        assert(TokenComparator::CleanToken("\xE2\x80\xA2item") == "item");
    }

    std::cout << "[PASS] TokenComparator measures word overlap." << std::endl;
    return 0;
}
