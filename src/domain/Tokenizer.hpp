/**
 * @file Tokenizer.hpp
 * @brief Interface for model tokenizers used to size context batches.
 */

#pragma once
#include <string>
#include <vector>

namespace provenance::domain {

/**
 * @class Tokenizer
 * @brief Abstract tokenizer. Implementations must make decode(encode(x)) reproduce x.
 */
class Tokenizer {
public:
    virtual ~Tokenizer() = default;

    /** @brief Converts text into token ids. */
    virtual std::vector<int> encode(const std::string& text) const = 0;

    /** @brief Converts token ids back into text. */
    virtual std::string decode(const std::vector<int>& ids) const = 0;

    /** @brief Number of tokens in @p text. */
    virtual int count(const std::string& text) const {
        return static_cast<int>(encode(text).size());
    }

    /** @brief Identifier used in logs and summaries. */
    virtual std::string name() const = 0;
};

} // namespace provenance::domain
