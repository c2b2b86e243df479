#include <iostream>
#include <thread>
#include <vector>
#include <chrono>
#include <atomic>
#include <cassert>
#include "application/SourceSession.hpp"
#include "infrastructure/TokenizerRegistry.hpp"

using namespace provenance;

namespace {

std::string Words(const std::string& prefix, int count) {
    std::string text;
    for (int i = 0; i < count; ++i) {
        if (i > 0) text += " ";
        text += prefix + std::to_string(i);
    }
    return text;
}

} // namespace

int main() {
    std::cout << "[Test] Starting Concurrency Stress Test..." << std::endl;

    // One shared tokenizer, one session per thread.
    infrastructure::TokenizerRegistry registry;
    auto shared = registry.resolve("whitespace");
    assert(shared);

    const int NUM_SESSIONS = 16;
    std::vector<std::thread> threads;
    std::atomic<int> completed{0};
    std::atomic<int> failures{0};

    std::cout << "[Test] Spawning " << NUM_SESSIONS << " threads packing sources..." << std::endl;

    auto startTime = std::chrono::steady_clock::now();

    for (int i = 0; i < NUM_SESSIONS; ++i) {
        threads.emplace_back([&, i]() {
            application::SourceSessionConfig config;
            config.contextWindow = 100;
            config.tokenizer.sessionTokenizer = shared;
            application::SourceSession session(config, registry.loader());

            std::vector<domain::TextRecord> records;
            for (int r = 0; r < 10; ++r) {
                records.emplace_back(Words("t" + std::to_string(i) + "_" + std::to_string(r) + "_", 30));
            }
            session.addSource(records);

            // 30-token records: three per batch below a window of 100.
            const auto& batches = session.sourceMaterials();
            if (batches.size() != 4) failures++;
            for (const auto& batch : batches) {
                if (shared->decode(shared->encode(batch.text)) != batch.text) failures++;
                if (batch.metadata.size() != static_cast<std::size_t>(batch.stats.samples)) failures++;
            }
            completed++;
        });
    }

    for (auto& t : threads) {
        if (t.joinable()) t.join();
    }

    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - startTime);
    std::cout << "[Test] " << completed.load() << " sessions finished in " << duration.count() << "ms" << std::endl;

    assert(completed.load() == NUM_SESSIONS);
    assert(failures.load() == 0);

    std::cout << "[PASS] Concurrency Test Passed: shared tokenizer stayed consistent." << std::endl;
    return 0;
}
