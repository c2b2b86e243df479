/**
 * @file TestTokenizerFiles.hpp
 * @brief Writes a tiny byte-level BPE tokenizer.json for tests.
 */

#pragma once
#include <filesystem>
#include <fstream>
#include <string>
#include <nlohmann/json.hpp>
#include "infrastructure/BpeTokenizer.hpp"

namespace provenance::test {

// ids 0-255 are the single bytes; merged tokens follow.
inline constexpr int kHe = 256;
inline constexpr int kLl = 257;
inline constexpr int kHell = 258;
inline constexpr int kHello = 259;
inline constexpr int kSpaceW = 260;
inline constexpr int kEndOfText = 261;

inline void WriteTinyTokenizer(const std::filesystem::path& file) {
    const auto& bytes = infrastructure::BpeTokenizer::ByteEncoder();
    const std::string space = bytes[static_cast<unsigned char>(' ')];

    nlohmann::json vocab = nlohmann::json::object();
    for (int b = 0; b < 256; ++b) {
        vocab[bytes[static_cast<std::size_t>(b)]] = b;
    }
    vocab["he"] = kHe;
    vocab["ll"] = kLl;
    vocab["hell"] = kHell;
    vocab["hello"] = kHello;
    vocab[space + "w"] = kSpaceW;

    nlohmann::json j = {
        {"version", "1.0"},
        {"added_tokens", nlohmann::json::array({
            {{"id", kEndOfText}, {"content", "<|endoftext|>"}, {"special", true}}
        })},
        {"model", {
            {"type", "BPE"},
            {"vocab", vocab},
            {"merges", nlohmann::json::array({"h e", "l l", nlohmann::json::array({"he", "ll"}), "hell o", space + " w"})}
        }}
    };

    std::filesystem::create_directories(file.parent_path());
    std::ofstream out(file);
    out << j.dump(2);
}

} // namespace provenance::test
