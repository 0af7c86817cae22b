#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace processing
{

struct LexiconEntry
{
    std::string term;        // as configured, reported back in matches
    std::string normalized;  // NFKC + lower-case form used for scoring
    bool is_phrase = false;  // normalized form contains a space
};

/**
 * @brief Immutable offensive-term list plus a disjoint whitelist.
 *
 * Built once at startup and shared read-only (std::shared_ptr<const Lexicon>) by every
 * matcher and detector; no locking needed. Entry order is insertion order and is part of
 * the contract: when two entries score equally, the earlier one wins.
 */
class Lexicon
{
public:
    Lexicon(const std::vector<std::string>& terms, const std::vector<std::string>& whitelist);

    // Built-in English term list with common leet and abbreviation variants
    static std::shared_ptr<const Lexicon> builtin();

    // Reads {"terms": [...], "whitelist": [...]}. Missing file, malformed JSON or an empty
    // term list yields std::nullopt.
    static std::optional<Lexicon> loadFromFile(const std::string& file_path);

    // Lexicon from file_path, or the built-in one (with a warning) when loading fails
    static std::shared_ptr<const Lexicon> loadOrBuiltin(const std::optional<std::string>& file_path);

    static const std::vector<std::string>& defaultTerms();
    static const std::vector<std::string>& defaultWhitelist();

    const std::vector<LexiconEntry>& entries() const { return entries_; }
    const std::vector<std::string>& whitelist() const { return whitelist_; }

    std::size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }

private:
    std::vector<LexiconEntry> entries_;
    std::vector<std::string> whitelist_;
};

} // namespace processing
