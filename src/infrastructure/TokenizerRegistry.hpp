/**
 * @file TokenizerRegistry.hpp
 * @brief Resolves tokenizer identifiers to loaded tokenizers.
 */

#pragma once
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include "application/TokenAdapter.hpp"
#include "domain/Tokenizer.hpp"

namespace provenance::infrastructure {

/**
 * @class TokenizerRegistry
 * @brief Looks up "whitespace", a tokenizer.json path, or <modelRepo>/<id>/tokenizer.json.
 *
 * Results are cached per identifier. Unknown identifiers yield nullptr.
 */
class TokenizerRegistry {
public:
    explicit TokenizerRegistry(std::string modelRepo = "");

    std::shared_ptr<domain::Tokenizer> resolve(const std::string& identifier);

    /** @brief A loader for TokenAdapter bound to this registry, which must outlive it. */
    application::TokenizerLoader loader();

private:
    std::shared_ptr<domain::Tokenizer> load(const std::string& identifier) const;

    std::string m_modelRepo;
    std::mutex m_mutex;
    std::map<std::string, std::shared_ptr<domain::Tokenizer>> m_cache;
};

} // namespace provenance::infrastructure
